#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace dcron::scheduler {

/// 进程级定时器服务：一个 io_context + 少量线程跑 run()。
/// 所有 CronJob 的 system_timer 都挂在这里；到点后回调只负责把触发流程
/// 丢到独立线程，不在这里执行任务。
/// 实例在进程内不析构：detached 的触发线程在 main 返回后仍可能持有 system_timer。
class TimerService {
public:
    static TimerService& instance();

    /// 启动 n 个 io 线程；重复调用无效果
    void start(std::size_t threads = 1);
    void stop();

    bool running() const { return _running.load(); }

    boost::asio::io_context& context() { return _ioc; }

private:
    TimerService() = default;
    ~TimerService() = default;

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    void io_loop(std::size_t worker_id);

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context     _ioc;
    std::optional<WorkGuard>    _guard;
    std::vector<std::thread>    _threads;
    std::mutex                  _mutex;
    std::atomic_bool            _running{false};
};

} // namespace dcron::scheduler
