#pragma once
#include <memory>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>

#include "log_record.h"
#include "log_sink.h"

namespace dcron::core {

// 所有日志的统一入口：分配 seq，按最小级别过滤，再分发给 sinks
class LogManager {
public:
    static LogManager& instance();

    void emit(const LogRecord& rec);

    void addSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setSinks(std::vector<std::shared_ptr<ILogSink>> sinks);

    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    std::size_t sinkCount() const;

private:
    LogManager() = default;

private:
    mutable std::mutex _mu;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
    std::atomic<int> _minLevel{static_cast<int>(LogLevel::Info)};
    std::uint64_t _nextSeq{1};
};

void emitEvent(const std::string& jobName, LogLevel level, const std::string& msg,
               const std::unordered_map<std::string, std::string>& extra = {});

} // namespace dcron::core
