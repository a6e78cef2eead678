#pragma once
#include <bitset>
#include <chrono>
#include <memory>
#include <string>
#include "schedule.h"
#include "time_zone.h"

namespace dcron::scheduler {

/**
 * @brief cron 表达式
 *
 * 支持 5 / 6 / 7 个字段：
 *   5: 分 时 日 月 周          （秒固定为 0）
 *   6: 秒 分 时 日 月 周
 *   7: 秒 分 时 日 月 周 年    （年 1970-2099）
 *
 * 每个字段支持 * ? 列表 范围 步长；月份 JAN-DEC、星期 SUN-SAT（不区分大小写），
 * 星期 7 等同于 0；日字段可以写 L 表示当月最后一天。
 * 日和周都被限定时，任意一个匹配即可（Vixie cron 规则）。
 *
 * 所有字段在构造时给定的时区里求值。
 */
class CronExpr : public Schedule
{
public:
    static constexpr int kMinYear = 1970;
    static constexpr int kMaxYear = 2099;

    /// 非法表达式抛 dcron::ParseError
    explicit CronExpr(const std::string& spec,
                      std::shared_ptr<const TimeZone> tz = TimeZone::utc());

    /// 严格晚于 prev 的第一个匹配时刻；2099 年之后不再有时抛 dcron::ScheduleExhaustedError
    time_point next(time_point prev) const override;

    std::string describe() const override { return _spec; }

    const std::string& spec() const { return _spec; }
    const TimeZone& timeZone() const { return *_tz; }

private:
    std::string _spec;
    std::shared_ptr<const TimeZone> _tz;

    std::bitset<60> _seconds;
    std::bitset<60> _minutes;
    std::bitset<24> _hours;
    std::bitset<32> _days;      // 1-31
    std::bitset<13> _months;    // 1-12
    std::bitset<7> _weekdays;   // 0 = Sunday
    std::bitset<kMaxYear - kMinYear + 1> _years;

    bool _dayStar{true};
    bool _weekdayStar{true};
    bool _lastDay{false};

private:
    void parse(const std::string& spec);

    bool dayMatches(int year, int month, int day) const;

    // 从 c 开始（含）找第一个匹配的墙上时间；超出年份范围返回 false
    bool findCivil(CivilTime& c) const;
};

} // namespace dcron::scheduler
