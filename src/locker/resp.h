#pragma once
#include <optional>
#include <string>
#include <vector>

namespace dcron::locker::resp {

// RESP2 回复
struct Reply {
    enum class Type {
        Status,   // +OK
        Error,    // -ERR ...
        Integer,  // :1
        Bulk,     // $3\r\nfoo
        Nil,      // $-1 / *-1
        Array     // *2 ...
    };

    Type type{Type::Nil};
    std::string str;
    long long integer{0};
    std::vector<Reply> elements;

    bool isOk() const { return type == Type::Status && str == "OK"; }
};

/// 编码成 RESP 数组形式的命令：*N\r\n$len\r\narg\r\n...
std::string encodeCommand(const std::vector<std::string>& args);

/// 从 buf 里解析一个完整回复。
/// 数据还不完整时返回 std::nullopt；consumed 返回用掉的字节数。
/// 格式非法抛 dcron::LockBackendError。
std::optional<Reply> parseReply(const std::string& buf, std::size_t& consumed);

} // namespace dcron::locker::resp
