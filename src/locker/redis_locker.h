#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "locker.h"
#include "resp.h"

namespace dcron::locker {

struct RedisOptions {
    std::string host{"127.0.0.1"};
    unsigned short port{6379};
    std::string password;                       // 非空时连接后先 AUTH
    int db{0};                                  // 非 0 时连接后 SELECT
    std::string keyPrefix{"dcron:"};
    std::chrono::milliseconds timeout{2000};    // 单次网络操作超时
};

/**
 * @brief 基于单个 Redis 节点的锁：SET <prefix><job> <token> NX PX <ttl>
 *
 * - +OK  拿到锁
 * - nil  锁被别人持有
 * - -ERR 或网络故障抛 LockBackendError，连接断开，下次调用重连
 *
 * 单节点 Redis 故障切换时可能丢锁；需要高可用时应换成基于多数派的锁服务。
 */
class RedisLocker : public Locker {
public:
    explicit RedisLocker(RedisOptions opts);
    ~RedisLocker() override;

    bool lock(const std::string& job, std::chrono::milliseconds ttl) override;
    std::string name() const override { return "redis"; }

    const RedisOptions& options() const { return _opts; }

private:
    void connectLocked();
    void closeLocked();

    // 发送一条命令并读取一个回复；网络故障抛 LockBackendError
    resp::Reply commandLocked(const std::vector<std::string>& args);

    // 跑 io_context 直到操作完成或超时；超时则关闭 socket
    void runFor(std::chrono::milliseconds timeout);

    static std::string generateToken();

private:
    RedisOptions                    _opts;
    std::mutex                      _mutex;
    boost::asio::io_context         _ioc;
    boost::asio::ip::tcp::socket    _socket;
    bool                            _connected{false};
    std::string                     _rbuf;
};

} // namespace dcron::locker
