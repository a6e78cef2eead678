#pragma once
#include <string>
#include "log_record.h"

namespace dcron::core {

// 单行文本格式：
// ts=[2025-11-11 10:00:00.000] level=[INFO] seq=12 job=backup msg="lock obtained" k1=v1
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

private:
    LogFormatter() = default;

    static std::string escapeMsg_(const std::string& s);
};

} // namespace dcron::core
