#include "redis_locker.h"
#include <array>
#include <optional>
#include <random>
#include <boost/asio/connect.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include "core/errors.h"
#include "log/logger.h"

namespace dcron::locker {

namespace net = boost::asio;
using tcp = net::ip::tcp;

RedisLocker::RedisLocker(RedisOptions opts)
    : _opts(std::move(opts)), _socket(_ioc)
{
    if (_opts.host.empty()) {
        throw ConfigError("redis locker: empty host");
    }
    if (_opts.timeout <= std::chrono::milliseconds::zero()) {
        _opts.timeout = std::chrono::milliseconds(2000);
    }
}

RedisLocker::~RedisLocker()
{
    std::lock_guard<std::mutex> lk(_mutex);
    closeLocked();
}

bool RedisLocker::lock(const std::string& job, std::chrono::milliseconds ttl)
{
    long long px = ttl.count();
    if (px <= 0) px = 1;

    std::lock_guard<std::mutex> lk(_mutex);
    if (!_connected) {
        connectLocked();
    }

    const resp::Reply r = commandLocked(
        {"SET", _opts.keyPrefix + job, generateToken(), "NX", "PX", std::to_string(px)});

    if (r.isOk()) return true;
    if (r.type == resp::Reply::Type::Nil) return false;
    if (r.type == resp::Reply::Type::Error) {
        closeLocked();
        throw LockBackendError("redis SET " + _opts.keyPrefix + job + ": " + r.str);
    }
    closeLocked();
    throw LockBackendError("redis SET " + _opts.keyPrefix + job + ": unexpected reply");
}

void RedisLocker::runFor(std::chrono::milliseconds timeout)
{
    _ioc.restart();
    _ioc.run_for(timeout);
    if (!_ioc.stopped()) {
        // 超时：关掉 socket 让挂起的操作以 operation_aborted 结束
        boost::system::error_code ignored;
        _socket.close(ignored);
        _ioc.run();
    }
}

void RedisLocker::connectLocked()
{
    const std::string endpoint = _opts.host + ":" + std::to_string(_opts.port);

    boost::system::error_code ec;
    tcp::resolver resolver(_ioc);
    const auto endpoints = resolver.resolve(_opts.host, std::to_string(_opts.port), ec);
    if (ec) {
        throw LockBackendError("redis resolve " + endpoint + " failed: " + ec.message());
    }

    ec = net::error::would_block;
    net::async_connect(_socket, endpoints,
                       [&](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
    runFor(_opts.timeout);
    if (ec || !_socket.is_open()) {
        closeLocked();
        throw LockBackendError("redis connect " + endpoint + " failed: " +
                               (ec == net::error::would_block || !ec ? std::string("timeout") : ec.message()));
    }

    boost::system::error_code ignored;
    _socket.set_option(tcp::no_delay(true), ignored);
    _rbuf.clear();
    _connected = true;

    if (!_opts.password.empty()) {
        const auto r = commandLocked({"AUTH", _opts.password});
        if (!r.isOk()) {
            closeLocked();
            throw LockBackendError("redis AUTH failed: " + r.str);
        }
    }
    if (_opts.db != 0) {
        const auto r = commandLocked({"SELECT", std::to_string(_opts.db)});
        if (!r.isOk()) {
            closeLocked();
            throw LockBackendError("redis SELECT " + std::to_string(_opts.db) + " failed: " + r.str);
        }
    }
    Logger::info("RedisLocker connected to " + endpoint);
}

void RedisLocker::closeLocked()
{
    if (_socket.is_open()) {
        boost::system::error_code ignored;
        _socket.shutdown(tcp::socket::shutdown_both, ignored);
        _socket.close(ignored);
    }
    _connected = false;
    _rbuf.clear();
}

resp::Reply RedisLocker::commandLocked(const std::vector<std::string>& args)
{
    const std::string req = resp::encodeCommand(args);

    boost::system::error_code ec = net::error::would_block;
    net::async_write(_socket, net::buffer(req),
                     [&](const boost::system::error_code& e, std::size_t) { ec = e; });
    runFor(_opts.timeout);
    if (ec) {
        closeLocked();
        throw LockBackendError("redis write failed: " +
                               (ec == net::error::would_block ? std::string("timeout") : ec.message()));
    }

    std::array<char, 512> chunk{};
    while (true) {
        std::size_t consumed = 0;
        std::optional<resp::Reply> reply;
        try {
            reply = resp::parseReply(_rbuf, consumed);
        } catch (const LockBackendError&) {
            closeLocked();
            throw;
        }
        if (reply) {
            _rbuf.erase(0, consumed);
            return std::move(*reply);
        }

        std::size_t n = 0;
        ec = net::error::would_block;
        _socket.async_read_some(net::buffer(chunk),
                                [&](const boost::system::error_code& e, std::size_t bytes) {
                                    ec = e;
                                    n = bytes;
                                });
        runFor(_opts.timeout);
        if (ec) {
            closeLocked();
            throw LockBackendError("redis read failed: " +
                                   (ec == net::error::would_block ? std::string("timeout") : ec.message()));
        }
        _rbuf.append(chunk.data(), n);
    }
}

std::string RedisLocker::generateToken()
{
    // 32 个 [a-zA-Z0-9] 字符，只用于区分持有者
    static const char charset[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(charset) - 2);

    std::string token;
    token.reserve(32);
    for (int i = 0; i < 32; ++i) {
        token.push_back(charset[dist(rng)]);
    }
    return token;
}

} // namespace dcron::locker
