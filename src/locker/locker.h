#pragma once
#include <chrono>
#include <memory>
#include <string>

namespace dcron::locker {

/// 分布式互斥：按 job 名拿一把带过期时间的锁。
///
/// lock() 返回 true 表示本实例拿到了锁，锁会在 ttl 到期后自动释放（没有 unlock）。
/// 返回 false 表示锁被别的实例持有。后端故障抛 dcron::LockBackendError。
/// 实现必须是线程安全的，多个 CronJob 会并发调用。
class Locker {
public:
    virtual ~Locker() = default;

    virtual bool lock(const std::string& job, std::chrono::milliseconds ttl) = 0;

    // 日志里用
    virtual std::string name() const = 0;
};

using LockerPtr = std::shared_ptr<Locker>;

} // namespace dcron::locker
