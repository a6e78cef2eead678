#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include "log_rotation.h"
#include "log_sink.h"

namespace dcron::core {

// 单行追加写文件；超过 rotateBytes 时按编号轮转
class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "./logs/dcron.log";
        std::size_t rotateBytes = 10 * 1024 * 1024;
        int maxFiles = 5;
        bool flushEachLine = false;
    };

    explicit FileLogSink(Options opt);
    ~FileLogSink() override;

    void consume(const LogRecord& rec) override;

    const std::string& path() const { return _opt.path; }

private:
    bool openLocked();

    Options _opt;
    LogRotation _rotation;
    std::ofstream _out;
    std::uint64_t _written{0};   // 当前文件大小
    std::mutex _mu;
};

} // namespace dcron::core
