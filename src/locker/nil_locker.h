#pragma once
#include "locker.h"

namespace dcron::locker {

// 单实例部署用：永远拿得到锁
class NilLocker : public Locker {
public:
    bool lock(const std::string&, std::chrono::milliseconds) override { return true; }
    std::string name() const override { return "none"; }
};

} // namespace dcron::locker
