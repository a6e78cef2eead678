#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dcron::scheduler {

using sys_seconds = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// 某个时区下的"墙上时间"，不带时区信息
struct CivilTime {
    int year{1970};
    int month{1};   // 1-12
    int day{1};     // 1-31
    int hour{0};    // 0-23
    int minute{0};  // 0-59
    int second{0};  // 0-59

    bool operator==(const CivilTime& o) const {
        return year == o.year && month == o.month && day == o.day &&
               hour == o.hour && minute == o.minute && second == o.second;
    }
    bool operator!=(const CivilTime& o) const { return !(*this == o); }
};

// 公历工具函数（proleptic Gregorian）
bool isLeapYear(int y);
int daysInMonth(int y, int m);
std::int64_t daysFromCivil(int y, int m, int d);
int weekdayOf(int y, int m, int d); // 0 = Sunday
CivilTime civilFromSeconds(std::int64_t s);
std::int64_t secondsFromCivil(const CivilTime& c);

/// 时区：负责 UTC 时刻 <-> 墙上时间 的换算。
///
/// 支持三种名字：
///  - "UTC"（或空串）
///  - "Local"：跟随进程的本地时区（localtime_r）
///  - IANA 名称，如 "Asia/Shanghai"：读取 zoneinfo 文件末尾的 POSIX TZ 规则
class TimeZone {
public:
    /// 按名字加载；未知时区抛 dcron::ConfigError
    static std::shared_ptr<const TimeZone> load(const std::string& name);

    static std::shared_ptr<const TimeZone> utc();

    /// 直接用 POSIX TZ 规则串构造，例如 "CST-8" 或 "EST5EDT,M3.2.0,M11.1.0"
    static std::shared_ptr<const TimeZone> fromPosixRule(const std::string& name, const std::string& rule);

    virtual ~TimeZone() = default;

    const std::string& name() const { return _name; }

    /// 该 UTC 时刻下的偏移量（local - utc）
    virtual std::chrono::seconds offsetAt(sys_seconds utc) const = 0;

    CivilTime toCivil(sys_seconds utc) const;

    /// (after, until] 内第一个偏移量切换的时刻；区间内偏移量不变时返回 nullopt。
    /// 默认实现按小时探测再二分，有规则的时区直接按规则算
    virtual std::optional<sys_seconds> nextTransition(sys_seconds after, sys_seconds until) const;

protected:
    explicit TimeZone(std::string name) : _name(std::move(name)) {}

private:
    std::string _name;
};

} // namespace dcron::scheduler
