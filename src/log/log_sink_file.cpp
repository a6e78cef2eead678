#include "log_sink_file.h"
#include <filesystem>
#include <system_error>
#include "log_formatter.h"

namespace fs = std::filesystem;

namespace dcron::core {

FileLogSink::FileLogSink(Options opt)
    : _opt(std::move(opt)),
      _rotation(RotationPolicy{_opt.rotateBytes, _opt.maxFiles}) {
}

FileLogSink::~FileLogSink() {
    std::lock_guard<std::mutex> lk(_mu);
    if (_out.is_open()) _out.flush();
}

bool FileLogSink::openLocked() {
    if (_out.is_open()) return true;
    if (_opt.path.empty()) return false;

    std::error_code ec;
    const fs::path parent = fs::path(_opt.path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    _out.open(_opt.path, std::ios::out | std::ios::app);
    if (!_out.is_open()) return false;

    const auto size = fs::file_size(_opt.path, ec);
    _written = ec ? 0 : static_cast<std::uint64_t>(size);
    return true;
}

void FileLogSink::consume(const LogRecord& rec) {
    const std::string line = LogFormatter::instance().formatLine(rec) + "\n";

    std::lock_guard<std::mutex> lk(_mu);
    if (!openLocked()) return;

    if (_written > 0 && _rotation.shouldRotate(_written, line.size())) {
        _out.close();
        _rotation.rotate(_opt.path);
        if (!openLocked()) return;
    }

    _out << line;
    _written += line.size();
    if (_opt.flushEachLine || rec.level >= LogLevel::Error) {
        _out.flush();
    }
}

} // namespace dcron::core
