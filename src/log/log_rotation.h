#pragma once
#include <cstdint>
#include <string>

namespace dcron::core {

// 按大小轮转，编号滚动（与 logrotate 相同）：
//   dcron.log      当前写入
//   dcron.log.1    最近一次轮转出来的
//   dcron.log.N    最旧的，N == maxFiles
struct RotationPolicy {
    std::uint64_t maxBytes = 10 * 1024 * 1024; // 0 表示不轮转
    int maxFiles = 5;
};

class LogRotation {
public:
    explicit LogRotation(RotationPolicy policy);

    // 当前大小加上这次要写的字节数超过上限时需要轮转
    bool shouldRotate(std::uint64_t currentSizeBytes, std::uint64_t addBytes) const;

    // base.(N-1) -> base.N ... base -> base.1，超出 maxFiles 的直接删掉
    void rotate(const std::string& basePath) const;

    static std::string numberedName(const std::string& basePath, int index);

private:
    RotationPolicy _p;
};

} // namespace dcron::core
