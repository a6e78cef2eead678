#include "log_rotation.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace dcron::core {

namespace {

// rename 跨文件系统会失败，退回 copy + remove
void moveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec)) {
        fs::remove(from, ec);
    }
}

} // namespace

LogRotation::LogRotation(RotationPolicy policy) : _p(policy) {}

bool LogRotation::shouldRotate(std::uint64_t currentSizeBytes, std::uint64_t addBytes) const {
    return _p.maxBytes != 0 && currentSizeBytes + addBytes > _p.maxBytes;
}

std::string LogRotation::numberedName(const std::string& basePath, int index) {
    return basePath + "." + std::to_string(index);
}

void LogRotation::rotate(const std::string& basePath) const {
    std::error_code ec;
    if (!fs::exists(basePath, ec)) return;

    // 不保留历史：直接截断
    if (_p.maxFiles <= 0) {
        fs::resize_file(basePath, 0, ec);
        return;
    }

    fs::remove(numberedName(basePath, _p.maxFiles), ec);
    for (int i = _p.maxFiles - 1; i >= 1; --i) {
        const fs::path from = numberedName(basePath, i);
        if (fs::exists(from, ec)) {
            moveFile(from, numberedName(basePath, i + 1));
        }
    }
    moveFile(basePath, numberedName(basePath, 1));
}

} // namespace dcron::core
