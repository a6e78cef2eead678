#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/config.h"

using dcron::Config;

static void test_defaults() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.timezone() == "UTC");
    assert(cfg.lock_ttl_ms() == 1000);
    assert(cfg.timer_threads() == 1);
    assert(cfg.shutdown_wait_ms() == 10000);
    assert(cfg.locker_type() == "none");
    assert(cfg.log_path().empty());
    assert(cfg.log_level() == "info");
    assert(cfg.jobs().empty());
    std::cout << "[OK] built-in defaults\n";
}

static void test_load_from_string() {
    auto& cfg = Config::instance();
    cfg.reset();
    const bool ok = cfg.loadFromString(R"({
        "scheduler": { "timezone": "Asia/Shanghai", "lock_ttl_ms": 2000, "timer_threads": 2,
                       "shutdown_wait_ms": 500 },
        "locker": { "type": "redis", "host": "10.0.0.5", "port": 6380, "key_prefix": "app:" },
        "log": { "level": "debug" },
        "jobs": [
            { "name": "backup", "expr": "0 0 3 * * *", "command": "echo backup" },
            { "name": "ping",   "expr": "@every 30s",  "command": "true" }
        ]
    })");
    assert(ok);
    assert(cfg.timezone() == "Asia/Shanghai");
    assert(cfg.lock_ttl_ms() == 2000);
    assert(cfg.timer_threads() == 2);
    assert(cfg.shutdown_wait_ms() == 500);
    assert(cfg.locker_type() == "redis");
    assert(cfg.get<std::string>("locker.host") == "10.0.0.5");
    assert(cfg.get<int>("locker.port", 6379) == 6380);
    assert(cfg.get<int>("locker.db", 7) == 7);                       // 缺省
    assert(cfg.get<int>("locker.host", 42) == 42);                   // 类型不符
    assert(cfg.contains("locker.key_prefix"));
    assert(!cfg.contains("locker.password"));
    assert(cfg.log_level() == "debug");

    const auto jobs = cfg.jobs();
    assert(jobs.size() == 2);
    assert(jobs[0].name == "backup" && jobs[0].expr == "0 0 3 * * *" && jobs[0].command == "echo backup");
    assert(jobs[1].name == "ping" && jobs[1].expr == "@every 30s");
    std::cout << "[OK] load from string\n";
}

static void test_bad_input_keeps_previous() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.loadFromString(R"({"scheduler": {"timezone": "Local"}})"));
    assert(!cfg.loadFromString("{ not json"));
    assert(!cfg.loadFromString("[1, 2, 3]"));
    assert(cfg.timezone() == "Local");
    assert(!cfg.load("/nonexistent/dcron/config.json"));
    assert(cfg.timezone() == "Local");
    std::cout << "[OK] bad input keeps previous config\n";
}

static void test_malformed_job_entry() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.loadFromString(R"({"jobs": [{"name": "x", "expr": "@daily"}]})"));
    bool threw = false;
    try {
        (void)cfg.jobs();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] job entry without command rejected\n";
}

static void test_env_override() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.loadFromString(R"({"scheduler": {"timezone": "UTC", "lock_ttl_ms": 1000}})"));
    setenv("DCRON_TIMEZONE", "Europe/Berlin", 1);
    setenv("DCRON_LOCK_TTL_MS", "250", 1);
    setenv("DCRON_LOCKER", "memory", 1);
    setenv("DCRON_REDIS_PORT", "7000", 1);
    cfg.load_from_env();
    assert(cfg.timezone() == "Europe/Berlin");
    assert(cfg.lock_ttl_ms() == 250);
    assert(cfg.locker_type() == "memory");
    assert(cfg.get<int>("locker.port", 0) == 7000);
    unsetenv("DCRON_TIMEZONE");
    unsetenv("DCRON_LOCK_TTL_MS");
    unsetenv("DCRON_LOCKER");
    unsetenv("DCRON_REDIS_PORT");
    std::cout << "[OK] environment overrides\n";
}

static void test_load_file() {
    const std::string path = "dcron_test_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"locker": {"type": "memory"}, "log": {"path": "./logs/test.log"}})";
    }
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.load(path));
    assert(cfg.locker_type() == "memory");
    assert(cfg.log_path() == "./logs/test.log");
    std::remove(path.c_str());
    std::cout << "[OK] load from file\n";
}

int main() {
    test_defaults();
    test_load_from_string();
    test_bad_input_keeps_previous();
    test_malformed_job_entry();
    test_env_override();
    test_load_file();
    std::cout << "all config tests passed\n";
    return 0;
}
