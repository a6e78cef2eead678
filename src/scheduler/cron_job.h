#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/system_timer.hpp>
#include "core/errors.h"
#include "locker/locker.h"
#include "schedule.h"

namespace dcron::scheduler {

using Task = std::function<void()>;
using ErrorHandler = std::function<void(const dcron::Error&)>;

/**
 * @brief 一个自我续期的定时任务
 *
 * 每次到点：
 *   1. 已 stop 则直接返回
 *   2. 先为下一次到点挂好定时器
 *   3. 用 Locker 抢这次触发的锁
 *   4. 抢到了才执行任务
 *
 * 触发流程跑在独立的 detached 线程上，任务阻塞不影响后续定时器。
 * 异步路径上的所有错误都交给 ErrorHandler，不会往外抛。
 */
class CronJob : public std::enable_shared_from_this<CronJob> {
public:
    CronJob(std::string name,
            std::string expr,
            std::shared_ptr<const Schedule> schedule,
            Task task,
            locker::LockerPtr locker,
            std::chrono::milliseconds lockTtl,
            ErrorHandler onError);

    CronJob(const CronJob&) = delete;
    CronJob& operator=(const CronJob&) = delete;

    /// 第一次挂定时器；没有下一次触发时间时上报 ScheduleExhaustedError
    void start(Schedule::time_point from);

    /// 以 prev 为基准挂下一次定时器
    void schedule(Schedule::time_point prev);

    /// 取消定时器；不等待正在执行的任务。stop 之后最多还会有一次已经过了检查的执行
    void stop();

    bool stopped() const { return _stopped.load(); }

    const std::string& name() const { return _name; }
    const std::string& expr() const { return _expr; }
    const Schedule& scheduleRef() const { return *_schedule; }

    // 下一次到点时间（还没挂过定时器时为 epoch）
    Schedule::time_point nextTime() const;

    // 统计
    std::uint64_t fired() const { return _fired.load(); }
    std::uint64_t executed() const { return _executed.load(); }

    /// 已经交给 detached 线程、还没跑完的触发流程个数
    std::size_t inFlight() const;

    /// 等到 inFlight() == 0 或到 deadline；返回是否等到
    bool waitIdle(std::chrono::steady_clock::time_point deadline) const;

private:
    void onTimer(Schedule::time_point at);
    void fire(Schedule::time_point at);
    void runTask(Schedule::time_point at);
    void report(const dcron::Error& err) const;
    void endFlight();

private:
    std::string                                 _name;
    std::string                                 _expr;
    std::shared_ptr<const Schedule>             _schedule;
    Task                                        _task;
    locker::LockerPtr                           _locker;
    std::chrono::milliseconds                   _lockTtl;
    ErrorHandler                                _onError;

    mutable std::mutex                          _mutex;     // 保护 _timer / _next
    std::shared_ptr<boost::asio::system_timer>  _timer;
    Schedule::time_point                        _next{};
    std::atomic_bool                            _stopped{false};

    std::atomic<std::uint64_t>                  _fired{0};
    std::atomic<std::uint64_t>                  _executed{0};

    mutable std::mutex                          _flightMutex;
    mutable std::condition_variable             _flightCv;
    std::size_t                                 _inFlight{0};
};

} // namespace dcron::scheduler
