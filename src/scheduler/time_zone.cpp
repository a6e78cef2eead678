#include "time_zone.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/posix_time_zone.hpp>
#include "core/errors.h"

namespace dcron::scheduler {

namespace bg = boost::gregorian;

bool isLeapYear(int y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m)
{
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return kDays[m - 1];
}

// days_from_civil / civil_from_days 见 Howard Hinnant 的 chrono-Compatible Low-Level Date Algorithms
std::int64_t daysFromCivil(int y, int m, int d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2) / 5 + static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

int weekdayOf(int y, int m, int d)
{
    const std::int64_t z = daysFromCivil(y, m, d);
    return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

CivilTime civilFromSeconds(std::int64_t s)
{
    std::int64_t z = s >= 0 ? s / 86400 : (s - 86399) / 86400;
    std::int64_t secOfDay = s - z * 86400;

    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    CivilTime c;
    c.year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
    c.month = static_cast<int>(m);
    c.day = static_cast<int>(d);
    c.hour = static_cast<int>(secOfDay / 3600);
    c.minute = static_cast<int>(secOfDay % 3600 / 60);
    c.second = static_cast<int>(secOfDay % 60);
    return c;
}

std::int64_t secondsFromCivil(const CivilTime& c)
{
    return daysFromCivil(c.year, c.month, c.day) * 86400 + c.hour * 3600 + c.minute * 60 + c.second;
}

CivilTime TimeZone::toCivil(sys_seconds utc) const
{
    const auto local = utc + offsetAt(utc);
    return civilFromSeconds(local.time_since_epoch().count());
}

std::optional<sys_seconds> TimeZone::nextTransition(sys_seconds after, sys_seconds until) const
{
    // 没有规则可查：按小时探测，再二分到秒
    const auto off = offsetAt(after);
    sys_seconds lo = after;
    while (lo < until) {
        sys_seconds hi = std::min<sys_seconds>(lo + std::chrono::hours(1), until);
        if (offsetAt(hi) != off) {
            while (hi - lo > std::chrono::seconds(1)) {
                const sys_seconds mid = lo + (hi - lo) / 2;
                if (offsetAt(mid) == off) lo = mid;
                else hi = mid;
            }
            return hi;
        }
        lo = hi;
    }
    return std::nullopt;
}

namespace {

class FixedTimeZone : public TimeZone {
public:
    FixedTimeZone(std::string name, std::chrono::seconds offset)
        : TimeZone(std::move(name)), _offset(offset) {}

    std::chrono::seconds offsetAt(sys_seconds) const override { return _offset; }

    std::optional<sys_seconds> nextTransition(sys_seconds, sys_seconds) const override
    {
        return std::nullopt;
    }

private:
    std::chrono::seconds _offset;
};

class LocalTimeZone : public TimeZone {
public:
    LocalTimeZone() : TimeZone("Local") {}

    std::chrono::seconds offsetAt(sys_seconds utc) const override
    {
        const std::time_t t = static_cast<std::time_t>(utc.time_since_epoch().count());
        std::tm tm{};
        if (!localtime_r(&t, &tm)) {
            return std::chrono::seconds(0);
        }
        return std::chrono::seconds(tm.tm_gmtoff);
    }
};

// zoneinfo 末尾的 POSIX TZ 串和 boost::local_time::posix_time_zone 的写法不一样：
// 偏移量西正东负、DST 偏移是绝对值、缩写可以写成 <+05>、切换时刻可以为负或超过 24h。
// 这里只把它拆开，日期规则（Mm.w.d / Jn / n）交给 boost 计算
struct PosixFooter {
    long stdOffset{0};          // local - utc
    bool hasDst{false};
    long dstOffset{0};
    std::string startDate{"M3.2.0"};
    std::string endDate{"M11.1.0"};
    long startTime{2 * 3600};
    long endTime{2 * 3600};
};

class FooterReader {
public:
    explicit FooterReader(const std::string& s) : _s(s) {}

    PosixFooter read()
    {
        PosixFooter f;
        name();
        f.stdOffset = -hms();
        if (done()) {
            return f;
        }
        f.hasDst = true;
        name();
        f.dstOffset = f.stdOffset + 3600;
        if (!done() && peek() != ',') {
            f.dstOffset = -hms();
        }
        if (consume(',')) {
            rule(f.startDate, f.startTime);
            if (!consume(',')) fail("expected end rule");
            rule(f.endDate, f.endTime);
        }
        if (!done()) fail("trailing characters");
        return f;
    }

    [[noreturn]] void fail(const std::string& why) const
    {
        throw ConfigError("invalid POSIX TZ rule \"" + _s + "\": " + why);
    }

private:
    bool done() const { return _i >= _s.size(); }
    char peek() const { return done() ? '\0' : _s[_i]; }

    bool consume(char c)
    {
        if (peek() != c) return false;
        ++_i;
        return true;
    }

    void name()
    {
        const std::size_t begin = _i;
        if (consume('<')) {
            while (!done() && peek() != '>') ++_i;
            if (!consume('>')) fail("unterminated <name>");
        } else {
            while (std::isalpha(static_cast<unsigned char>(peek()))) ++_i;
        }
        if (_i == begin) fail("missing zone abbreviation");
    }

    // [+-]hh[:mm[:ss]]，返回秒
    long hms()
    {
        long sign = 1;
        if (consume('-')) sign = -1;
        else consume('+');
        long parts[3] = {0, 0, 0};
        for (int k = 0; k < 3; ++k) {
            if (k > 0 && !consume(':')) break;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected digits");
            long v = 0;
            while (std::isdigit(static_cast<unsigned char>(peek()))) v = v * 10 + (_s[_i++] - '0');
            parts[k] = v;
        }
        return sign * (parts[0] * 3600 + parts[1] * 60 + parts[2]);
    }

    void rule(std::string& date, long& timeOfDay)
    {
        const std::size_t begin = _i;
        while (!done() && peek() != ',' && peek() != '/') ++_i;
        date = _s.substr(begin, _i - begin);
        if (date.empty()) fail("empty transition date");
        if (consume('/')) {
            timeOfDay = hms();
        }
    }

    const std::string& _s;
    std::size_t _i{0};
};

// boost 的偏移量写法：local - utc，hh:mm:ss
std::string boostOffset(long seconds)
{
    std::ostringstream os;
    if (seconds < 0) {
        os << '-';
        seconds = -seconds;
    }
    os << seconds / 3600 << ':' << seconds % 3600 / 60 << ':' << seconds % 60;
    return os.str();
}

class PosixTimeZone : public TimeZone {
public:
    PosixTimeZone(std::string name, const std::string& rule)
        : TimeZone(std::move(name)), _footer(FooterReader(rule).read()), _rules(boostRule(rule, _footer))
    {
    }

    std::chrono::seconds offsetAt(sys_seconds utc) const override
    {
        if (!_footer.hasDst) {
            return std::chrono::seconds(_footer.stdOffset);
        }
        const std::int64_t t = utc.time_since_epoch().count();
        const int year = civilFromSeconds(t + _footer.stdOffset).year;
        if (!inBoostRange(year)) {
            return std::chrono::seconds(_footer.stdOffset);
        }
        const std::int64_t start = startUtc(year);
        const std::int64_t end = endUtc(year);
        bool inDst;
        if (start < end) {
            inDst = t >= start && t < end;
        } else {
            // 南半球：夏令时跨年
            inDst = !(t >= end && t < start);
        }
        return std::chrono::seconds(inDst ? _footer.dstOffset : _footer.stdOffset);
    }

    std::optional<sys_seconds> nextTransition(sys_seconds after, sys_seconds until) const override
    {
        if (!_footer.hasDst || until <= after) {
            return std::nullopt;
        }
        const std::int64_t lo = after.time_since_epoch().count();
        const std::int64_t hi = until.time_since_epoch().count();
        const int firstYear = civilFromSeconds(lo).year - 1;
        const int lastYear = civilFromSeconds(hi).year + 1;
        std::optional<std::int64_t> best;
        for (int y = firstYear; y <= lastYear; ++y) {
            if (!inBoostRange(y)) continue;
            for (std::int64_t x : {startUtc(y), endUtc(y)}) {
                if (x > lo && x <= hi && (!best || x < *best)) best = x;
            }
        }
        if (!best) {
            return std::nullopt;
        }
        return sys_seconds(std::chrono::seconds(*best));
    }

private:
    // boost::gregorian 只支持 1400-9999 年
    static bool inBoostRange(int year) { return year >= 1401 && year <= 9998; }

    static std::string boostRule(const std::string& rule, const PosixFooter& f)
    {
        std::string out = "STD" + boostOffset(f.stdOffset);
        if (f.hasDst) {
            // 切换时刻自己加，boost 只算日期
            out += "DST" + boostOffset(f.dstOffset - f.stdOffset) + "," + f.startDate + "/00:00," +
                   f.endDate + "/00:00";
        }
        try {
            // 先构造一次，让非法规则在这里报错
            boost::local_time::posix_time_zone check(out);
            if (f.hasDst) {
                (void)check.dst_local_start_time(2000);
                (void)check.dst_local_end_time(2000);
            }
        } catch (const std::exception& ex) {
            throw ConfigError("invalid POSIX TZ rule \"" + rule + "\": " + ex.what());
        }
        return out;
    }

    static std::int64_t daysSinceEpoch(const boost::posix_time::ptime& pt)
    {
        return (pt.date() - bg::date(1970, 1, 1)).days();
    }

    // 开始时刻按标准时间给出，结束时刻按夏令时给出
    std::int64_t startUtc(int year) const
    {
        const auto day = daysSinceEpoch(_rules.dst_local_start_time(static_cast<unsigned short>(year)));
        return day * 86400 + _footer.startTime - _footer.stdOffset;
    }

    std::int64_t endUtc(int year) const
    {
        const auto day = daysSinceEpoch(_rules.dst_local_end_time(static_cast<unsigned short>(year)));
        return day * 86400 + _footer.endTime - _footer.dstOffset;
    }

    PosixFooter _footer;
    boost::local_time::posix_time_zone _rules;
};

std::string zoneinfoDir()
{
    if (const char* p = std::getenv("TZDIR")) {
        if (*p) return p;
    }
    return "/usr/share/zoneinfo";
}

// TZif v2+ 文件末尾是 "\n<POSIX TZ 规则>\n"
std::string readFooter(const std::string& name)
{
    if (name.front() == '/' || name.find("..") != std::string::npos) {
        throw ConfigError("invalid time zone name: " + name);
    }
    const std::string path = zoneinfoDir() + "/" + name;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw ConfigError("unknown time zone " + name);
    }
    const std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (data.size() < 44 || data.compare(0, 4, "TZif") != 0) {
        throw ConfigError("not a TZif file: " + path);
    }
    if (data[4] < '2') {
        throw ConfigError("time zone file too old (no POSIX footer): " + path);
    }
    if (data.back() != '\n') {
        throw ConfigError("time zone file has no POSIX footer: " + path);
    }
    const std::size_t open = data.rfind('\n', data.size() - 2);
    if (open == std::string::npos) {
        throw ConfigError("time zone file has no POSIX footer: " + path);
    }
    std::string footer = data.substr(open + 1, data.size() - open - 2);
    if (footer.empty()) {
        throw ConfigError("time zone " + name + " has an empty POSIX footer");
    }
    return footer;
}

} // namespace

std::shared_ptr<const TimeZone> TimeZone::utc()
{
    static const std::shared_ptr<const TimeZone> kUtc =
        std::make_shared<FixedTimeZone>("UTC", std::chrono::seconds(0));
    return kUtc;
}

std::shared_ptr<const TimeZone> TimeZone::fromPosixRule(const std::string& name, const std::string& rule)
{
    return std::make_shared<PosixTimeZone>(name, rule);
}

std::shared_ptr<const TimeZone> TimeZone::load(const std::string& name)
{
    if (name.empty() || name == "UTC") {
        return utc();
    }
    if (name == "Local") {
        return std::make_shared<LocalTimeZone>();
    }
    return fromPosixRule(name, readFooter(name));
}

} // namespace dcron::scheduler
