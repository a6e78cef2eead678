#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "locker/locker.h"
#include "scheduler/cron_job.h"
#include "scheduler/time_zone.h"

namespace dcron::scheduler {

struct CronOptions {
    std::string timezone{"UTC"};                // "UTC" / "Local" / IANA 名
    std::chrono::milliseconds lockTtl{1000};
    ErrorHandler errorHandler;                  // 为空时只写日志
    std::size_t timerThreads{1};
};

// addJobs 的一项
struct JobSpec {
    std::string name;
    std::string expr;
    Task task;
};

// listJobs 返回的快照
struct JobInfo {
    std::string name;
    std::string expr;
    Schedule::time_point next{};
    std::uint64_t executed{0};
};

/// CronScheduler：按名字持有一组 CronJob，统一启动 / 停止。
///
/// 生命周期：构造 -> add/addJobs -> start -> stop；stop 之后不能再 start。
/// 多个实例（可以在不同进程或机器上）共享同一个 Locker 时，同名 job 的每次到点只会执行一次。
class CronScheduler {
public:
    /// 时区非法或 lockTtl <= 0 时抛 ConfigError
    explicit CronScheduler(locker::LockerPtr locker, CronOptions opts = {});
    ~CronScheduler();

    CronScheduler(const CronScheduler&) = delete;
    CronScheduler& operator=(const CronScheduler&) = delete;

    /// 名字重复抛 AlreadyExistsError，表达式非法抛 ParseError；start 之后调用抛 std::logic_error
    void add(const std::string& name, const std::string& expr, Task task);

    /// 批量注册：先校验全部名字、解析全部表达式，任何一项失败都不改动已有 job
    void addJobs(const std::vector<JobSpec>& batch);

    void start();
    void startFrom(Schedule::time_point t);

    /// 停止所有 job；不等待正在执行的任务
    void stop();

    /// 等所有已触发的执行跑完，最多等 timeout；返回是否全部结束。stop() 本身不等
    bool waitIdle(std::chrono::milliseconds timeout) const;
    std::size_t inFlight() const;

    std::vector<JobInfo> listJobs() const;
    std::size_t size() const;
    bool contains(const std::string& name) const;

    const TimeZone& timeZone() const { return *_tz; }
    const locker::Locker& lockerRef() const { return *_locker; }

private:
    std::shared_ptr<CronJob> makeJob(const std::string& name, const std::string& expr, Task task) const;
    void checkLockTtl(const CronJob& job) const;
    void ensureNotStartedLocked(const char* op) const;

private:
    locker::LockerPtr                                           _locker;
    CronOptions                                                 _opts;
    std::shared_ptr<const TimeZone>                             _tz;

    mutable std::mutex                                          _mutex;
    std::unordered_map<std::string, std::shared_ptr<CronJob>>   _jobs;
    std::vector<std::string>                                    _order;     // 注册顺序
    bool                                                        _started{false};
    bool                                                        _stopped{false};
};

} // namespace dcron::scheduler
