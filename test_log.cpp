#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/utils.h"
#include "log/log_formatter.h"
#include "log/log_manager.h"
#include "log/log_rotation.h"
#include "log/log_sink_file.h"
#include "log/logger.h"

namespace fs = std::filesystem;
using namespace dcron;

// 把收到的记录存起来
class CaptureSink : public core::ILogSink {
public:
    void consume(const core::LogRecord& rec) override {
        std::lock_guard<std::mutex> lk(mu);
        records.push_back(rec);
    }
    std::mutex mu;
    std::vector<core::LogRecord> records;
};

static void test_level_strings() {
    assert(Logger::level_to_string(LogLevel::Warn) == "WARN");
    assert(Logger::level_from_string("DEBUG") == LogLevel::Debug);
    assert(Logger::level_from_string("warning") == LogLevel::Warn);
    assert(Logger::level_from_string("nonsense", LogLevel::Error) == LogLevel::Error);
    std::cout << "[OK] level strings\n";
}

static void test_formatter() {
    core::LogRecord r;
    r.jobName = "backup";
    r.level = LogLevel::Info;
    r.message = "line1\nsaid \"hi\"";
    r.seq = 12;
    r.fields["ok"] = "true";
    const std::string line = core::LogFormatter::instance().formatLine(r);
    assert(line.find("level=[INFO]") != std::string::npos);
    assert(line.find("seq=12") != std::string::npos);
    assert(line.find("job=backup") != std::string::npos);
    assert(line.find("msg=\"line1\\nsaid \\\"hi\\\"\"") != std::string::npos);
    assert(line.find(" ok=true") != std::string::npos);
    assert(line.find('\n') == std::string::npos);
    std::cout << "[OK] formatter: " << line << "\n";
}

static void test_manager_routing() {
    auto& lm = core::LogManager::instance();
    auto sink = std::make_shared<CaptureSink>();
    lm.setSinks({sink});
    lm.setMinLevel(LogLevel::Info);

    Logger::debug("filtered out");
    Logger::info("hello");
    Logger::jobEvent(LogLevel::Warn, "nightly", "lock held elsewhere");
    core::emitEvent("nightly", LogLevel::Error, "boom", {{"code", "3"}});

    {
        std::lock_guard<std::mutex> lk(sink->mu);
        assert(sink->records.size() == 3);
        assert(sink->records[0].message == "hello" && sink->records[0].jobName.empty());
        assert(sink->records[1].jobName == "nightly" && sink->records[1].level == LogLevel::Warn);
        assert(sink->records[2].fields.at("code") == "3");
        assert(sink->records[0].seq < sink->records[1].seq && sink->records[1].seq < sink->records[2].seq);
    }

    lm.clearSinks();
    assert(lm.sinkCount() == 0);
    std::cout << "[OK] LogManager routes by level and assigns seq\n";
}

static void test_rotation_policy() {
    core::RotationPolicy p;
    p.maxBytes = 100;
    p.maxFiles = 2;
    core::LogRotation rot(p);
    assert(!rot.shouldRotate(50, 50));
    assert(rot.shouldRotate(60, 50));

    core::RotationPolicy off;
    off.maxBytes = 0;
    assert(!core::LogRotation(off).shouldRotate(1000000, 1));
    std::cout << "[OK] rotation policy\n";
}

static void test_file_sink_rotates() {
    const fs::path dir = fs::temp_directory_path() / "dcron_test_log";
    std::error_code ec;
    fs::remove_all(dir, ec);

    core::FileLogSink::Options opt;
    opt.path = (dir / "dcron.log").string();
    opt.rotateBytes = 512;
    opt.maxFiles = 2;
    opt.flushEachLine = true;
    {
        core::FileLogSink sink(opt);
        for (int i = 0; i < 40; ++i) {
            core::LogRecord r;
            r.message = "message number " + std::to_string(i);
            r.seq = static_cast<std::uint64_t>(i);
            sink.consume(r);
        }
    }

    assert(fs::exists(opt.path));
    assert(fs::file_size(opt.path) <= 512);
    int rotated = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename() != "dcron.log") ++rotated;
    }
    assert(rotated == 2);
    assert(fs::exists(core::LogRotation::numberedName(opt.path, 1)));
    assert(fs::exists(core::LogRotation::numberedName(opt.path, 2)));
    assert(!fs::exists(core::LogRotation::numberedName(opt.path, 3)));

    std::ifstream ifs(opt.path);
    std::string last, line;
    while (std::getline(ifs, line)) last = line;
    assert(last.find("message number 39") != std::string::npos);

    fs::remove_all(dir, ec);
    std::cout << "[OK] file sink rotates and prunes (" << rotated << " rotated files)\n";
}

static void test_rotate_shifts_numbers() {
    const fs::path dir = fs::temp_directory_path() / "dcron_test_rotate";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    const std::string base = (dir / "a.log").string();

    core::RotationPolicy p;
    p.maxBytes = 1;
    p.maxFiles = 3;
    core::LogRotation rot(p);
    for (int i = 1; i <= 4; ++i) {
        std::ofstream(base) << "gen" << i;
        rot.rotate(base);
    }
    auto read = [](const std::string& path) {
        std::ifstream ifs(path);
        std::string s;
        std::getline(ifs, s);
        return s;
    };
    assert(!fs::exists(base));
    assert(read(core::LogRotation::numberedName(base, 1)) == "gen4");
    assert(read(core::LogRotation::numberedName(base, 2)) == "gen3");
    assert(read(core::LogRotation::numberedName(base, 3)) == "gen2");
    assert(!fs::exists(core::LogRotation::numberedName(base, 4)));

    fs::remove_all(dir, ec);
    std::cout << "[OK] rotate shifts numbered files\n";
}

static void test_utils() {
    const auto t = std::chrono::system_clock::time_point(std::chrono::seconds(86400 + 3661));
    assert(utils::formatUtc(t) == "1970-01-02T01:01:01Z");
    assert(utils::now_string().size() == 23);

    const auto ok = utils::run_command("echo hello");
    assert(ok.first == 0 && ok.second == "hello\n");
    const auto bad = utils::run_command("sh -c 'echo oops >&2; exit 3'");
    assert(bad.first == 3 && bad.second.find("oops") != std::string::npos);
    std::cout << "[OK] utils\n";
}

int main() {
    test_level_strings();
    test_formatter();
    test_manager_routing();
    test_rotation_policy();
    test_file_sink_rotates();
    test_rotate_shifts_numbers();
    test_utils();
    std::cout << "all log tests passed\n";
    return 0;
}
