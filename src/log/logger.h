#pragma once
#include <string>

namespace dcron {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    // 带 job 名的事件日志，job 名会作为独立字段输出
    static void jobEvent(LogLevel level, const std::string& jobName, const std::string& msg);

    static std::string level_to_string(LogLevel level);
    // "debug" / "info" / "warn" / "error"，无法识别时返回 fallback
    static LogLevel level_from_string(const std::string& s, LogLevel fallback = LogLevel::Info);

private:
    static void write(LogLevel level, const std::string& jobName, const std::string& msg);
};

} // namespace dcron
