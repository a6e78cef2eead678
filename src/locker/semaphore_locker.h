#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include "locker.h"

namespace dcron::locker {

/// 进程内的锁：每个 job 名记一个过期时间点。
/// 同一进程里多个 CronScheduler 共享一个实例即可互斥。
class SemaphoreLocker : public Locker {
public:
    bool lock(const std::string& job, std::chrono::milliseconds ttl) override;
    std::string name() const override { return "memory"; }

    // 当前仍被持有的锁数量
    std::size_t held() const;

private:
    using Clock = std::chrono::steady_clock;

    mutable std::mutex _mutex;
    std::unordered_map<std::string, Clock::time_point> _expiry;
};

} // namespace dcron::locker
