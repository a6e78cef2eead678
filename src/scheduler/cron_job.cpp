#include "cron_job.h"
#include <system_error>
#include <thread>
#include "core/utils.h"
#include "log/log_manager.h"
#include "log/logger.h"
#include "scheduler/timer_service.h"

namespace dcron::scheduler {

CronJob::CronJob(std::string name,
                 std::string expr,
                 std::shared_ptr<const Schedule> schedule,
                 Task task,
                 locker::LockerPtr locker,
                 std::chrono::milliseconds lockTtl,
                 ErrorHandler onError)
    : _name(std::move(name)),
      _expr(std::move(expr)),
      _schedule(std::move(schedule)),
      _task(std::move(task)),
      _locker(std::move(locker)),
      _lockTtl(lockTtl),
      _onError(std::move(onError))
{
    if (_name.empty()) {
        throw std::invalid_argument("CronJob: empty name");
    }
    if (!_schedule) {
        throw std::invalid_argument("CronJob " + _name + ": null schedule");
    }
    if (!_task) {
        throw std::invalid_argument("CronJob " + _name + ": empty task");
    }
    if (!_locker) {
        throw std::invalid_argument("CronJob " + _name + ": null locker");
    }
}

void CronJob::start(Schedule::time_point from)
{
    try {
        schedule(from);
    } catch (const ScheduleExhaustedError& ex) {
        report(ex);
        return;
    }
    Logger::jobEvent(LogLevel::Info, _name, "armed, expr=\"" + _expr + "\"");
}

void CronJob::schedule(Schedule::time_point prev)
{
    // ScheduleExhaustedError 直接抛给调用方
    const Schedule::time_point next = _schedule->next(prev);

    auto timer = std::make_shared<boost::asio::system_timer>(TimerService::instance().context());
    timer->expires_at(next);

    std::lock_guard<std::mutex> lk(_mutex);
    if (_stopped) {
        return;
    }
    _timer = timer;
    _next = next;

    std::weak_ptr<CronJob> weak = weak_from_this();
    _timer->async_wait([weak, next](const boost::system::error_code& ec) {
        // 被 cancel
        if (ec == boost::asio::error::operation_aborted) return;
        auto self = weak.lock();
        if (!self) return;
        if (ec) {
            Logger::jobEvent(LogLevel::Error, self->_name, "timer error: " + ec.message());
            return;
        }
        self->onTimer(next);
    });
}

void CronJob::onTimer(Schedule::time_point at)
{
    // 不在 io 线程里跑任务，直接起一个 detached 线程
    auto self = shared_from_this();
    {
        std::lock_guard<std::mutex> lk(_flightMutex);
        ++_inFlight;
    }
    try {
        std::thread([self, at] {
            self->fire(at);
            self->endFlight();
        }).detach();
    } catch (const std::system_error& ex) {
        endFlight();
        report(dcron::Error("job " + _name + ": cannot start worker thread: " + ex.what()));
    }
}

void CronJob::endFlight()
{
    std::lock_guard<std::mutex> lk(_flightMutex);
    --_inFlight;
    _flightCv.notify_all();
}

std::size_t CronJob::inFlight() const
{
    std::lock_guard<std::mutex> lk(_flightMutex);
    return _inFlight;
}

bool CronJob::waitIdle(std::chrono::steady_clock::time_point deadline) const
{
    std::unique_lock<std::mutex> lk(_flightMutex);
    return _flightCv.wait_until(lk, deadline, [this] { return _inFlight == 0; });
}

void CronJob::fire(Schedule::time_point at)
{
    if (_stopped) {
        return;
    }
    ++_fired;

    // 先续期，再抢锁，保证任务耗时不影响下一次到点
    try {
        schedule(at);
    } catch (const ScheduleExhaustedError& ex) {
        report(ex);
    }

    bool acquired = false;
    try {
        acquired = _locker->lock(_name, _lockTtl);
    } catch (const LockBackendError& ex) {
        report(ex);
        return;
    } catch (const std::exception& ex) {
        report(LockBackendError("lock " + _name + " via " + _locker->name() + ": " + ex.what()));
        return;
    }

    if (!acquired) {
        Logger::jobEvent(LogLevel::Debug, _name, "lock held elsewhere, skip this activation");
        return;
    }
    runTask(at);
}

void CronJob::runTask(Schedule::time_point at)
{
    ++_executed;
    const auto begin = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        _task();
        ok = true;
    } catch (const TaskError& ex) {
        report(ex);
    } catch (const std::exception& ex) {
        report(TaskError(_name, ex.what()));
    } catch (...) {
        report(TaskError(_name, "unknown exception"));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    core::emitEvent(_name, LogLevel::Info, "activation finished",
                    {{"scheduled", utils::formatUtc(at)},
                     {"elapsed_ms", std::to_string(elapsed.count())},
                     {"ok", ok ? "true" : "false"}});
}

void CronJob::stop()
{
    std::lock_guard<std::mutex> lk(_mutex);
    if (_stopped.exchange(true)) {
        return;
    }
    if (!_timer) {
        return;
    }
    // cancel 返回 0 表示 handler 已经在路上，此时靠 _stopped 拦住
    const std::size_t cancelled = _timer->cancel();
    if (cancelled > 0) {
        Logger::jobEvent(LogLevel::Debug, _name, "stopped, pending timer cancelled");
    } else {
        Logger::jobEvent(LogLevel::Debug, _name, "stopped while an activation was in flight");
    }
}

Schedule::time_point CronJob::nextTime() const
{
    std::lock_guard<std::mutex> lk(_mutex);
    return _next;
}

void CronJob::report(const dcron::Error& err) const
{
    Logger::jobEvent(LogLevel::Warn, _name, err.what());
    if (!_onError) {
        return;
    }
    try {
        _onError(err);
    } catch (const std::exception& ex) {
        Logger::jobEvent(LogLevel::Error, _name, std::string("error handler threw: ") + ex.what());
    } catch (...) {
        Logger::jobEvent(LogLevel::Error, _name, "error handler threw a non-standard exception");
    }
}

} // namespace dcron::scheduler
