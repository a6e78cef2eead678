#include "cron_app.h"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "core/config.h"
#include "core/errors.h"
#include "core/utils.h"
#include "locker/nil_locker.h"
#include "locker/redis_locker.h"
#include "locker/semaphore_locker.h"
#include "log/log_manager.h"
#include "log/log_sink_console.h"
#include "log/log_sink_file.h"
#include "log/logger.h"
#include "scheduler/timer_service.h"

namespace dcron {

CronApp::CronApp(std::string configPath) : m_configPath(std::move(configPath)) {
}

CronApp::~CronApp() {
    if (m_scheduler) {
        m_scheduler->stop();
    }
}

/**
 * @brief 启动 dcrond
 *
 * 配置、日志、Locker、job 注册任一步失败都会返回非 0；
 * 正常情况下阻塞到 SIGINT / SIGTERM。
 */
int CronApp::run() {
    // 1. 加载配置
    init_config();

    // 2. 初始化日志系统
    init_logger();
    Logger::info("===== dcrond starting =====");

    // 3. 建调度器并注册配置里的 job
    try {
        init_scheduler();
    } catch (const Error& ex) {
        Logger::error(std::string("dcrond: startup failed: ") + ex.what());
        return 1;
    } catch (const std::invalid_argument& ex) {
        Logger::error(std::string("dcrond: invalid configuration: ") + ex.what());
        return 1;
    }

    // 4. 启动并等待退出信号
    m_scheduler->start();
    wait_for_signal();

    shutdown();
    return 0;
}

void CronApp::shutdown() {
    m_scheduler->stop();

    // stop() 不等正在跑的任务；进程退出前给它们一个上限
    const auto wait = std::chrono::milliseconds(std::max(0LL, Config::instance().shutdown_wait_ms()));
    if (!m_scheduler->waitIdle(wait)) {
        Logger::warn(std::to_string(m_scheduler->inFlight()) + " activation(s) still running after " +
                     std::to_string(wait.count()) + "ms, exiting anyway");
    }
    scheduler::TimerService::instance().stop();
    Logger::info("===== dcrond stopped =====");

    // 释放 sinks，让文件 sink 析构时刷盘；之后的日志走控制台
    core::LogManager::instance().clearSinks();
}

void CronApp::init_config() {
    auto& cfg = Config::instance();
    namespace fs = std::filesystem;

    bool loaded = false;
    if (!m_configPath.empty()) {
        loaded = cfg.load(m_configPath);
    }
    if (!loaded) {
        loaded = cfg.load("/etc/dcron/config.json");
    }
    if (!loaded) {
        // 当前工作目录
        loaded = cfg.load("config.json");
    }
    if (!loaded) {
        // 源码默认配置
        loaded = cfg.load((fs::current_path() / "config" / "default_config.json").string());
    }
    if (!loaded) {
        Logger::warn("No config file found in fallback paths, using built-in defaults");
    }

    // 环境变量覆盖（Docker / 本地调试）
    cfg.load_from_env();
}

void CronApp::init_logger() {
    auto& cfg = Config::instance();
    auto& lm = core::LogManager::instance();

    lm.setMinLevel(Logger::level_from_string(cfg.log_level()));

    std::vector<std::shared_ptr<core::ILogSink>> sinks;
    sinks.push_back(std::make_shared<core::ConsoleLogSink>());

    // 空串表示只打到控制台
    const std::string logPath = cfg.log_path();
    if (!logPath.empty()) {
        std::error_code ec;
        std::filesystem::path p(logPath);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        if (ec) {
            Logger::warn("cannot create log directory for " + logPath + ": " + ec.message() +
                         ", logging to console only");
        } else {
            core::FileLogSink::Options opt;
            opt.path = logPath;
            opt.rotateBytes = cfg.get<std::size_t>("log.rotateBytes", 10 * 1024 * 1024);
            opt.maxFiles = cfg.get<int>("log.maxFiles", 5);
            opt.flushEachLine = cfg.get<bool>("log.flushEachLine", true);
            sinks.push_back(std::make_shared<core::FileLogSink>(opt));
        }
    }
    lm.setSinks(std::move(sinks));

    Logger::info(std::string("Logger initialized") +
                 (logPath.empty() ? " (console-only)" : (" (file=" + logPath + ")")));
}

locker::LockerPtr CronApp::make_locker() {
    auto& cfg = Config::instance();
    const std::string type = cfg.locker_type();

    if (type == "none" || type.empty()) {
        return std::make_shared<locker::NilLocker>();
    }
    if (type == "memory") {
        return std::make_shared<locker::SemaphoreLocker>();
    }
    if (type == "redis") {
        locker::RedisOptions opt;
        opt.host = cfg.get<std::string>("locker.host", opt.host);
        opt.port = static_cast<unsigned short>(cfg.get<int>("locker.port", opt.port));
        opt.password = cfg.get<std::string>("locker.password", "");
        opt.db = cfg.get<int>("locker.db", 0);
        opt.keyPrefix = cfg.get<std::string>("locker.key_prefix", opt.keyPrefix);
        opt.timeout = std::chrono::milliseconds(cfg.get<long long>("locker.timeout_ms", 2000));
        return std::make_shared<locker::RedisLocker>(opt);
    }
    throw ConfigError("unknown locker type: " + type);
}

scheduler::Task CronApp::make_command_task(const std::string& jobName, const std::string& command) {
    return [jobName, command]() {
        Logger::jobEvent(LogLevel::Info, jobName, "run: " + command);
        const auto [code, output] = utils::run_command(command);
        if (code != 0) {
            throw TaskError(jobName, "command exited with " + std::to_string(code) + ": " + output);
        }
        if (!output.empty()) {
            Logger::jobEvent(LogLevel::Debug, jobName, "output: " + output);
        }
    };
}

void CronApp::init_scheduler() {
    auto& cfg = Config::instance();

    scheduler::CronOptions opts;
    opts.timezone = cfg.timezone();
    opts.lockTtl = std::chrono::milliseconds(cfg.lock_ttl_ms());
    opts.timerThreads = static_cast<std::size_t>(std::max(1, cfg.timer_threads()));
    opts.errorHandler = [](const Error& err) {
        Logger::error(std::string("job error: ") + err.what());
    };

    m_scheduler = std::make_unique<scheduler::CronScheduler>(make_locker(), opts);

    std::vector<scheduler::JobSpec> batch;
    for (const auto& jc : cfg.jobs()) {
        batch.push_back(scheduler::JobSpec{jc.name, jc.expr, make_command_task(jc.name, jc.command)});
    }
    m_scheduler->addJobs(batch);

    if (batch.empty()) {
        Logger::warn("No jobs configured");
    }
}

void CronApp::wait_for_signal() {
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            Logger::info("received signal " + std::to_string(signo) + ", shutting down");
        }
    });
    ioc.run();
}

} // namespace dcron
