#include "cron_scheduler.h"
#include <stdexcept>
#include <unordered_set>
#include "locker/nil_locker.h"
#include "log/logger.h"
#include "scheduler/duration.h"
#include "scheduler/timer_service.h"

namespace dcron::scheduler {

CronScheduler::CronScheduler(locker::LockerPtr locker, CronOptions opts)
    : _locker(std::move(locker)), _opts(std::move(opts))
{
    if (!_locker) {
        _locker = std::make_shared<locker::NilLocker>();
    }
    if (_opts.lockTtl <= std::chrono::milliseconds::zero()) {
        throw ConfigError("lock ttl must be positive, got " + std::to_string(_opts.lockTtl.count()) + "ms");
    }
    _tz = TimeZone::load(_opts.timezone);

    TimerService::instance().start(_opts.timerThreads);

    Logger::info("CronScheduler created, timezone=" + _tz->name() +
                 ", locker=" + _locker->name() +
                 ", lockTtl=" + formatDuration(_opts.lockTtl));
}

CronScheduler::~CronScheduler()
{
    stop();
}

std::shared_ptr<CronJob> CronScheduler::makeJob(const std::string& name, const std::string& expr, Task task) const
{
    if (name.empty()) {
        throw std::invalid_argument("add job: empty name");
    }
    auto schedule = parseSchedule(expr, _tz);

    ErrorHandler handler = _opts.errorHandler;
    return std::make_shared<CronJob>(name, expr, std::move(schedule), std::move(task),
                                     _locker, _opts.lockTtl, std::move(handler));
}

void CronScheduler::checkLockTtl(const CronJob& job) const
{
    // 锁的 TTL 不短于两次触发的间隔时，下一次触发可能因为锁还没过期被跳过
    try {
        const auto& s = job.scheduleRef();
        const auto a = s.next(std::chrono::system_clock::now());
        const auto b = s.next(a);
        if (b - a <= _opts.lockTtl) {
            Logger::jobEvent(LogLevel::Warn, job.name(),
                             "lock ttl " + formatDuration(_opts.lockTtl) +
                             " is not shorter than the activation interval " +
                             formatDuration(b - a) + "; activations may be skipped");
        }
    } catch (const ScheduleExhaustedError& ex) {
        Logger::jobEvent(LogLevel::Warn, job.name(), ex.what());
    }
}

void CronScheduler::ensureNotStartedLocked(const char* op) const
{
    if (_started || _stopped) {
        throw std::logic_error(std::string("CronScheduler::") + op + " called after start");
    }
}

void CronScheduler::add(const std::string& name, const std::string& expr, Task task)
{
    {
        std::lock_guard<std::mutex> lk(_mutex);
        ensureNotStartedLocked("add");
        if (_jobs.count(name)) {
            throw AlreadyExistsError(name);
        }
    }

    auto job = makeJob(name, expr, std::move(task));

    std::lock_guard<std::mutex> lk(_mutex);
    ensureNotStartedLocked("add");
    if (!_jobs.emplace(name, job).second) {
        throw AlreadyExistsError(name);
    }
    _order.push_back(name);
    Logger::jobEvent(LogLevel::Info, name, "registered, expr=\"" + expr + "\"");
    checkLockTtl(*job);
}

void CronScheduler::addJobs(const std::vector<JobSpec>& batch)
{
    std::lock_guard<std::mutex> lk(_mutex);
    ensureNotStartedLocked("addJobs");

    // 第一遍：名字冲突（批内 + 已注册）
    std::unordered_set<std::string> seen;
    for (const auto& spec : batch) {
        if (_jobs.count(spec.name) || !seen.insert(spec.name).second) {
            throw AlreadyExistsError(spec.name);
        }
    }

    // 第二遍：解析全部表达式，出错时带上 job 名
    std::vector<std::shared_ptr<CronJob>> built;
    built.reserve(batch.size());
    for (const auto& spec : batch) {
        try {
            built.push_back(makeJob(spec.name, spec.expr, spec.task));
        } catch (const ParseError& ex) {
            throw ParseError("add job " + spec.name + ": " + ex.what());
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument("add job " + spec.name + ": " + ex.what());
        }
    }

    // 全部通过才写入
    for (auto& job : built) {
        _order.push_back(job->name());
        Logger::jobEvent(LogLevel::Info, job->name(), "registered, expr=\"" + job->expr() + "\"");
        checkLockTtl(*job);
        _jobs.emplace(job->name(), std::move(job));
    }
}

void CronScheduler::start()
{
    startFrom(std::chrono::system_clock::now());
}

void CronScheduler::startFrom(Schedule::time_point t)
{
    std::vector<std::shared_ptr<CronJob>> jobs;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_stopped) {
            throw std::logic_error("CronScheduler::start called after stop");
        }
        if (_started) {
            return;
        }
        _started = true;
        for (const auto& name : _order) {
            jobs.push_back(_jobs.at(name));
        }
    }

    for (auto& job : jobs) {
        job->start(t);
    }
    Logger::info("CronScheduler started, jobs=" + std::to_string(jobs.size()));
}

void CronScheduler::stop()
{
    std::vector<std::shared_ptr<CronJob>> jobs;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_stopped) {
            return;
        }
        _stopped = true;
        for (const auto& kv : _jobs) {
            jobs.push_back(kv.second);
        }
    }

    for (auto& job : jobs) {
        job->stop();
    }
    Logger::info("CronScheduler stopped, jobs=" + std::to_string(jobs.size()));
}

bool CronScheduler::waitIdle(std::chrono::milliseconds timeout) const
{
    std::vector<std::shared_ptr<CronJob>> jobs;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        jobs.reserve(_jobs.size());
        for (const auto& kv : _jobs) {
            jobs.push_back(kv.second);
        }
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool idle = true;
    for (const auto& job : jobs) {
        if (!job->waitIdle(deadline)) {
            idle = false;
        }
    }
    return idle;
}

std::size_t CronScheduler::inFlight() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    std::size_t n = 0;
    for (const auto& kv : _jobs) {
        n += kv.second->inFlight();
    }
    return n;
}

std::vector<JobInfo> CronScheduler::listJobs() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    std::vector<JobInfo> out;
    out.reserve(_order.size());
    for (const auto& name : _order) {
        const auto& job = _jobs.at(name);
        out.push_back(JobInfo{job->name(), job->expr(), job->nextTime(), job->executed()});
    }
    return out;
}

std::size_t CronScheduler::size() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _jobs.size();
}

bool CronScheduler::contains(const std::string& name) const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _jobs.count(name) > 0;
}

} // namespace dcron::scheduler
