#include "resp.h"
#include <cctype>
#include "core/errors.h"

namespace dcron::locker::resp {

namespace {

constexpr const char* kCrlf = "\r\n";

long long parseInteger(const std::string& s)
{
    if (s.empty()) {
        throw LockBackendError("malformed RESP integer: empty");
    }
    std::size_t i = 0;
    bool neg = false;
    if (s[0] == '-' || s[0] == '+') {
        neg = s[0] == '-';
        i = 1;
    }
    if (i >= s.size()) {
        throw LockBackendError("malformed RESP integer: " + s);
    }
    long long v = 0;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw LockBackendError("malformed RESP integer: " + s);
        }
        v = v * 10 + (s[i] - '0');
    }
    return neg ? -v : v;
}

// pos 处开始解析；不完整返回 nullopt
std::optional<Reply> parseAt(const std::string& buf, std::size_t& pos)
{
    if (pos >= buf.size()) return std::nullopt;

    const std::size_t eol = buf.find(kCrlf, pos);
    if (eol == std::string::npos) return std::nullopt;

    const char prefix = buf[pos];
    const std::string line = buf.substr(pos + 1, eol - pos - 1);
    std::size_t next = eol + 2;

    Reply r;
    switch (prefix) {
    case '+':
        r.type = Reply::Type::Status;
        r.str = line;
        break;
    case '-':
        r.type = Reply::Type::Error;
        r.str = line;
        break;
    case ':':
        r.type = Reply::Type::Integer;
        r.integer = parseInteger(line);
        break;
    case '$': {
        const long long len = parseInteger(line);
        if (len < 0) {
            r.type = Reply::Type::Nil;
            break;
        }
        const std::size_t n = static_cast<std::size_t>(len);
        if (buf.size() < next + n + 2) return std::nullopt;
        if (buf.compare(next + n, 2, kCrlf) != 0) {
            throw LockBackendError("malformed RESP bulk string terminator");
        }
        r.type = Reply::Type::Bulk;
        r.str = buf.substr(next, n);
        next += n + 2;
        break;
    }
    case '*': {
        const long long count = parseInteger(line);
        if (count < 0) {
            r.type = Reply::Type::Nil;
            break;
        }
        r.type = Reply::Type::Array;
        for (long long i = 0; i < count; ++i) {
            auto elem = parseAt(buf, next);
            if (!elem) return std::nullopt;
            r.elements.push_back(std::move(*elem));
        }
        break;
    }
    default:
        throw LockBackendError(std::string("unexpected RESP type byte: ") + prefix);
    }

    pos = next;
    return r;
}

} // namespace

std::string encodeCommand(const std::vector<std::string>& args)
{
    std::string out = "*" + std::to_string(args.size()) + kCrlf;
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + kCrlf;
        out += a;
        out += kCrlf;
    }
    return out;
}

std::optional<Reply> parseReply(const std::string& buf, std::size_t& consumed)
{
    std::size_t pos = 0;
    auto r = parseAt(buf, pos);
    consumed = r ? pos : 0;
    return r;
}

} // namespace dcron::locker::resp
