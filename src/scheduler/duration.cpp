#include "duration.h"
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include "core/errors.h"

namespace dcron::scheduler {

namespace {

struct UnitEntry {
    const char* name;
    std::uint64_t ns;
};

// 长的前缀在前（"ms" 必须先于 "m"）
const UnitEntry kUnits[] = {
    {"ns", 1ULL},
    {"us", 1000ULL},
    {"\xC2\xB5s", 1000ULL},  // U+00B5 micro sign
    {"\xCE\xBCs", 1000ULL},  // U+03BC greek mu
    {"ms", 1000ULL * 1000},
    {"s",  1000ULL * 1000 * 1000},
    {"m",  60ULL * 1000 * 1000 * 1000},
    {"h",  3600ULL * 1000 * 1000 * 1000},
};

ParseError badDuration(const std::string& orig) {
    return ParseError("invalid duration \"" + orig + "\"");
}

} // namespace

std::chrono::nanoseconds parseDuration(const std::string& orig)
{
    constexpr std::uint64_t kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    std::size_t i = 0;
    bool neg = false;
    if (i < orig.size() && (orig[i] == '-' || orig[i] == '+')) {
        neg = orig[i] == '-';
        ++i;
    }
    if (orig.substr(i) == "0") {
        return std::chrono::nanoseconds(0);
    }
    if (i == orig.size()) {
        throw badDuration(orig);
    }

    std::uint64_t total = 0;
    while (i < orig.size()) {
        // 整数部分
        std::uint64_t whole = 0;
        const std::size_t intStart = i;
        while (i < orig.size() && orig[i] >= '0' && orig[i] <= '9') {
            if (whole > (kMax - 9) / 10) {
                throw ParseError("invalid duration \"" + orig + "\": overflow");
            }
            whole = whole * 10 + static_cast<std::uint64_t>(orig[i] - '0');
            ++i;
        }
        const bool haveInt = i > intStart;

        // 小数部分
        std::uint64_t frac = 0;
        std::uint64_t scale = 1;
        bool haveFrac = false;
        if (i < orig.size() && orig[i] == '.') {
            ++i;
            const std::size_t fracStart = i;
            while (i < orig.size() && orig[i] >= '0' && orig[i] <= '9') {
                // 超出精度的位直接丢弃
                if (scale <= std::numeric_limits<std::uint64_t>::max() / 100) {
                    frac = frac * 10 + static_cast<std::uint64_t>(orig[i] - '0');
                    scale *= 10;
                }
                ++i;
            }
            haveFrac = i > fracStart;
        }
        if (!haveInt && !haveFrac) {
            throw badDuration(orig);
        }

        // 单位
        const UnitEntry* unit = nullptr;
        for (const auto& u : kUnits) {
            if (orig.compare(i, std::char_traits<char>::length(u.name), u.name) == 0) {
                unit = &u;
                break;
            }
        }
        if (!unit) {
            throw ParseError("invalid duration \"" + orig + "\": missing or unknown unit");
        }
        i += std::char_traits<char>::length(unit->name);
        // "m" 后面紧跟 "s" 已在 "ms" 中匹配；这里只需确认后面不是字母
        if (i < orig.size() && ((orig[i] >= 'a' && orig[i] <= 'z') || (orig[i] >= 'A' && orig[i] <= 'Z'))) {
            throw ParseError("invalid duration \"" + orig + "\": unknown unit");
        }

        if (whole > kMax / unit->ns) {
            throw ParseError("invalid duration \"" + orig + "\": overflow");
        }
        std::uint64_t v = whole * unit->ns;
        if (frac > 0) {
            v += static_cast<std::uint64_t>(static_cast<long double>(frac) *
                                            (static_cast<long double>(unit->ns) / static_cast<long double>(scale)));
        }
        if (v > kMax - total) {
            throw ParseError("invalid duration \"" + orig + "\": overflow");
        }
        total += v;
    }

    const auto signedTotal = static_cast<std::int64_t>(total);
    return std::chrono::nanoseconds(neg ? -signedTotal : signedTotal);
}

std::string formatDuration(std::chrono::nanoseconds d)
{
    using namespace std::chrono;
    std::ostringstream oss;
    if (d.count() < 0) {
        oss << '-';
        d = -d;
    }
    if (d < seconds(1)) {
        if (d.count() % 1000000 == 0) oss << d.count() / 1000000 << "ms";
        else if (d.count() % 1000 == 0) oss << d.count() / 1000 << "us";
        else oss << d.count() << "ns";
        return oss.str();
    }
    const auto h = duration_cast<hours>(d);
    d -= h;
    const auto m = duration_cast<minutes>(d);
    d -= m;
    const auto s = duration_cast<seconds>(d);
    d -= s;
    if (h.count() > 0) oss << h.count() << 'h';
    if (m.count() > 0) oss << m.count() << 'm';
    oss << s.count();
    if (d.count() > 0) {
        const auto ms = duration_cast<milliseconds>(d).count();
        if (ms > 0) oss << '.' << std::setfill('0') << std::setw(3) << ms;
    }
    oss << 's';
    return oss.str();
}

} // namespace dcron::scheduler
