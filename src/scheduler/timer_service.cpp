#include "timer_service.h"
#include <exception>
#include "log/logger.h"

namespace dcron::scheduler {

TimerService& TimerService::instance()
{
    static TimerService* inst = new TimerService();
    return *inst;
}

void TimerService::start(std::size_t threads)
{
    std::lock_guard<std::mutex> lk(_mutex);
    if (_running) return;
    if (threads == 0) threads = 1;

    _ioc.restart();
    _guard.emplace(boost::asio::make_work_guard(_ioc));
    for (std::size_t i = 0; i < threads; ++i) {
        _threads.emplace_back([this, i] { io_loop(i); });
    }
    _running = true;
    Logger::info("TimerService started with " + std::to_string(threads) + " io threads");
}

void TimerService::stop()
{
    std::lock_guard<std::mutex> lk(_mutex);
    if (!_running.exchange(false)) return;

    _guard.reset();
    _ioc.stop();
    for (auto& th : _threads) {
        // 避免在 io 线程里 join 自己
        if (th.joinable() && th.get_id() != std::this_thread::get_id()) {
            th.join();
        } else if (th.joinable()) {
            th.detach();
        }
    }
    _threads.clear();
    Logger::info("TimerService stopped");
}

void TimerService::io_loop(std::size_t worker_id)
{
    while (true) {
        try {
            _ioc.run();
            break;
        } catch (const std::exception& ex) {
            // 回调里不应该抛异常，抛了就记下来继续跑
            Logger::error("TimerService io thread " + std::to_string(worker_id) +
                          " caught exception: " + ex.what());
        }
    }
}

} // namespace dcron::scheduler
