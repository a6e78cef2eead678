#include "semaphore_locker.h"

namespace dcron::locker {

bool SemaphoreLocker::lock(const std::string& job, std::chrono::milliseconds ttl)
{
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lk(_mutex);

    auto it = _expiry.find(job);
    if (it != _expiry.end() && now < it->second) {
        return false;
    }
    _expiry[job] = now + ttl;
    return true;
}

std::size_t SemaphoreLocker::held() const
{
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lk(_mutex);
    std::size_t n = 0;
    for (const auto& kv : _expiry) {
        if (now < kv.second) ++n;
    }
    return n;
}

} // namespace dcron::locker
