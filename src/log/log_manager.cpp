#include "log_manager.h"
namespace dcron::core {

LogManager& LogManager::instance() {
    // 不析构：退出时还在跑的触发线程可能还要写日志
    static LogManager* g = new LogManager();
    return *g;
}

void LogManager::emit(const LogRecord& rec) {
    if (static_cast<int>(rec.level) < _minLevel.load(std::memory_order_relaxed)) {
        return;
    }

    LogRecord stored = rec;
    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;

    {
        std::lock_guard<std::mutex> lk(_mu);
        stored.seq = _nextSeq++;
        // 拷贝 sinks，避免锁内做 IO
        sinksSnapshot = _sinks;
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(stored);
    }
}

void LogManager::addSink(std::shared_ptr<ILogSink> sink)
{
    if (!sink) return;
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.push_back(std::move(sink));
}

void LogManager::clearSinks()
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.clear();
}

void LogManager::setSinks(std::vector<std::shared_ptr<ILogSink>> sinks)
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks = std::move(sinks);
}

void LogManager::setMinLevel(LogLevel level)
{
    _minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel LogManager::minLevel() const
{
    return static_cast<LogLevel>(_minLevel.load(std::memory_order_relaxed));
}

std::size_t LogManager::sinkCount() const
{
    std::lock_guard<std::mutex> lk(_mu);
    return _sinks.size();
}

void emitEvent(const std::string& jobName, LogLevel level, const std::string& msg,
               const std::unordered_map<std::string, std::string>& extra)
{
    LogRecord rec;
    rec.jobName = jobName;
    rec.level   = level;
    rec.message = msg;
    rec.fields  = extra;
    LogManager::instance().emit(rec);
}

} // namespace dcron::core
