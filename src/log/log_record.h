#pragma once
#include <string>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace dcron::core {

struct LogRecord {
    // 关联的 job（系统日志为空）
    std::string jobName;

    LogLevel level{LogLevel::Info};
    std::string message;

    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};

    // 任意扩展字段
    std::unordered_map<std::string, std::string> fields;

    // 序列号（由 LogManager 分配）
    std::uint64_t seq{0};
};

inline std::int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

} // namespace dcron::core
