#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

#include "core/config.h"
#include "core/errors.h"
#include "cron_app.h"
#include "locker/redis_locker.h"

using namespace dcron;

static void test_make_locker() {
    auto& cfg = Config::instance();

    cfg.reset();
    assert(CronApp::make_locker()->name() == "none");

    assert(cfg.loadFromString(R"({"locker": {"type": "memory"}})"));
    assert(CronApp::make_locker()->name() == "memory");

    assert(cfg.loadFromString(R"({"locker": {"type": "redis", "host": "redis.local", "port": 6380,
                                             "db": 2, "key_prefix": "svc:"}})"));
    auto l = CronApp::make_locker();
    assert(l->name() == "redis");
    auto redis = std::dynamic_pointer_cast<locker::RedisLocker>(l);
    assert(redis);
    assert(redis->options().host == "redis.local");
    assert(redis->options().port == 6380);
    assert(redis->options().db == 2);
    assert(redis->options().keyPrefix == "svc:");

    assert(cfg.loadFromString(R"({"locker": {"type": "zookeeper"}})"));
    bool threw = false;
    try {
        (void)CronApp::make_locker();
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    cfg.reset();
    std::cout << "[OK] locker built from config\n";
}

static void test_command_task() {
    auto ok = CronApp::make_command_task("echo", "echo hi");
    ok();

    auto fail = CronApp::make_command_task("false", "sh -c 'echo broken; exit 4'");
    bool threw = false;
    try {
        fail();
    } catch (const TaskError& ex) {
        threw = true;
        assert(ex.jobName() == "false");
        const std::string what = ex.what();
        assert(what.find("exited with 4") != std::string::npos);
        assert(what.find("broken") != std::string::npos);
    }
    assert(threw);
    std::cout << "[OK] shell command task\n";
}

// 收到 SIGTERM 时正在跑的命令要跑完，run() 才返回
static void test_shutdown_waits_for_running_commands() {
    const std::string marks = "/tmp/dcron_test_marks_" + std::to_string(getpid());
    const std::string conf = "/tmp/dcron_test_config_" + std::to_string(getpid()) + ".json";
    std::remove(marks.c_str());
    {
        std::ofstream ofs(conf);
        ofs << R"({
            "scheduler": { "timezone": "UTC", "lock_ttl_ms": 500, "shutdown_wait_ms": 5000 },
            "locker": { "type": "memory" },
            "log": { "path": "", "level": "warn" },
            "jobs": [ { "name": "slow", "expr": "* * * * * * *",
                        "command": "echo s >> )" << marks << R"(; sleep 1; echo d >> )" << marks << R"(" } ]
        })";
    }

    std::thread killer([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        kill(getpid(), SIGTERM);
    });
    CronApp app(conf);
    const int rc = app.run();
    killer.join();
    assert(rc == 0);

    int started = 0;
    int done = 0;
    std::ifstream ifs(marks);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line == "s") ++started;
        if (line == "d") ++done;
    }
    assert(started >= 1);
    assert(done == started);

    std::remove(marks.c_str());
    std::remove(conf.c_str());
    Config::instance().reset();
    std::cout << "[OK] shutdown waits for running commands (" << started << " runs)\n";
}

int main() {
    test_make_locker();
    test_command_task();
    test_shutdown_waits_for_running_commands();
    std::cout << "all app tests passed\n";
    return 0;
}
