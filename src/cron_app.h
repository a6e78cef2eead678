#pragma once
#include <memory>
#include <string>
#include "locker/locker.h"
#include "scheduler/cron_scheduler.h"

namespace dcron {

/// dcrond 主程序：读配置 -> 初始化日志 -> 建 Locker -> 注册 job -> 等信号退出
class CronApp {
public:
    explicit CronApp(std::string configPath = {});
    ~CronApp();

    // 程序主入口，返回进程退出码
    int run();

    // 按配置构造 Locker；type 未知时抛 ConfigError
    static locker::LockerPtr make_locker();

    // 把 shell 命令包装成 Task；非 0 退出码抛 TaskError
    static scheduler::Task make_command_task(const std::string& jobName, const std::string& command);

private:
    void init_config();
    void init_logger();
    void init_scheduler();
    void wait_for_signal();
    void shutdown();

private:
    std::string m_configPath;
    std::unique_ptr<scheduler::CronScheduler> m_scheduler;
};

} // namespace dcron
