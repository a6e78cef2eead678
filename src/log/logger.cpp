//
// Logger 只是门面，真正的输出交给 LogManager + sinks
//
#include "logger.h"
#include <iostream>
#include <algorithm>
#include <cctype>
#include "log_manager.h"
#include "log_record.h"
#include "core/utils.h"

void dcron::Logger::debug(const std::string &msg) {
    write(LogLevel::Debug, std::string(), msg);
}

void dcron::Logger::info(const std::string &msg) {
    write(LogLevel::Info, std::string(), msg);
}

void dcron::Logger::warn(const std::string &msg) {
    write(LogLevel::Warn, std::string(), msg);
}

void dcron::Logger::error(const std::string &msg) {
    write(LogLevel::Error, std::string(), msg);
}

void dcron::Logger::jobEvent(LogLevel level, const std::string &jobName, const std::string &msg) {
    write(level, jobName, msg);
}

void dcron::Logger::write(LogLevel level, const std::string &jobName, const std::string &msg) {
    auto& mgr = dcron::core::LogManager::instance();

    // 还没有配置任何 sink（例如单元测试里）：直接打到控制台，保证日志不丢
    if (mgr.sinkCount() == 0) {
        if (static_cast<int>(level) < static_cast<int>(mgr.minLevel())) return;
        std::ostream& os = level >= LogLevel::Error ? std::cerr : std::cout;
        os << utils::now_string() << " [" << level_to_string(level) << "] "
           << (jobName.empty() ? std::string() : "[" + jobName + "] ") << msg << std::endl;
        return;
    }

    dcron::core::LogRecord rec;
    rec.jobName = jobName;
    rec.level = level;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();

    try {
        mgr.emit(rec);
    } catch (const std::exception& ex) {
        // sink 写失败（磁盘满等）：退回控制台
        std::cerr << utils::now_string() << " [" << level_to_string(level) << "] " << msg
                  << " (log sink failed: " << ex.what() << ")" << std::endl;
    }
}

std::string dcron::Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNK";
    }
}

dcron::LogLevel dcron::Logger::level_from_string(const std::string &s, LogLevel fallback) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::Debug;
    if (v == "info")  return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return fallback;
}
