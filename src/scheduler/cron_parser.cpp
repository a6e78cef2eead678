#include "cron_parser.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>
#include "core/errors.h"
#include "core/utils.h"

namespace dcron::scheduler {

namespace {

const std::array<const char*, 12> kMonthNames = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
const std::array<const char*, 7> kWeekdayNames = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

// 别名统一展开成 7 字段
std::string expandAlias(const std::string& spec)
{
    if (spec == "@annually" || spec == "@yearly") return "0 0 0 1 1 * *";
    if (spec == "@monthly") return "0 0 0 1 * * *";
    if (spec == "@weekly") return "0 0 0 * * 0 *";
    if (spec == "@daily" || spec == "@midnight") return "0 0 0 * * * *";
    if (spec == "@hourly") return "0 0 * * * * *";
    throw ParseError("unknown cron alias: " + spec);
}

std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

struct FieldSpec {
    const char* what;
    int min;
    int max;
    const char* const* names;   // 可为空
    std::size_t nameCount;
    int nameBase;               // names[0] 对应的数值
};

// 纯数字或名字
int parseValue(const std::string& s, const FieldSpec& f)
{
    if (s.empty()) {
        throw ParseError(std::string("empty value in ") + f.what + " field");
    }
    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (s.size() > 4) {
            throw ParseError(std::string("value out of range in ") + f.what + " field: " + s);
        }
        return std::stoi(s);
    }
    if (f.names) {
        const std::string u = upper(s);
        for (std::size_t i = 0; i < f.nameCount; ++i) {
            if (u == f.names[i]) return f.nameBase + static_cast<int>(i);
        }
    }
    throw ParseError(std::string("invalid value in ") + f.what + " field: " + s);
}

// 把一个字段解析成值集合（下标即数值），star 表示字段是否以 * 或 ? 开头
std::vector<bool> parseField(const std::string& field, const FieldSpec& f, bool allowQuestion,
                             bool allowLast, bool& star, bool& last)
{
    if (field.empty()) {
        throw ParseError(std::string("empty ") + f.what + " field");
    }
    star = field[0] == '*' || (allowQuestion && field[0] == '?');
    last = false;
    std::vector<bool> seen(static_cast<std::size_t>(f.max + 1), false);

    std::size_t start = 0;
    while (true) {
        const std::size_t end = field.find(',', start);
        const std::string token = field.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (token.empty()) {
            throw ParseError(std::string("empty list item in ") + f.what + " field");
        }

        if (allowLast && upper(token) == "L") {
            last = true;
        } else {
            int step = 1;
            const std::size_t slash = token.find('/');
            const std::string base = slash == std::string::npos ? token : token.substr(0, slash);
            if (slash != std::string::npos) {
                const std::string stepText = token.substr(slash + 1);
                if (stepText.empty() ||
                    !std::all_of(stepText.begin(), stepText.end(), [](unsigned char c) { return std::isdigit(c); }) ||
                    stepText.size() > 4) {
                    throw ParseError(std::string("invalid step in ") + f.what + " field: " + token);
                }
                step = std::stoi(stepText);
                if (step <= 0) {
                    throw ParseError(std::string("step must be positive in ") + f.what + " field: " + token);
                }
            }

            int lo = f.min;
            int hi = f.max;
            if (base == "*" || (allowQuestion && base == "?")) {
                // 全范围
            } else {
                const std::size_t dash = base.find('-');
                if (dash == std::string::npos) {
                    lo = parseValue(base, f);
                    // "a/n" 表示从 a 开始到最大值
                    hi = slash == std::string::npos ? lo : f.max;
                } else {
                    lo = parseValue(base.substr(0, dash), f);
                    hi = parseValue(base.substr(dash + 1), f);
                }
            }
            if (lo < f.min || hi > f.max || lo > hi) {
                throw ParseError(std::string("value out of range in ") + f.what + " field: " + token);
            }
            for (int v = lo; v <= hi; v += step) {
                seen[static_cast<std::size_t>(v)] = true;
            }
        }

        if (end == std::string::npos) break;
        start = end + 1;
    }
    return seen;
}

template <std::size_t N>
void assign(std::bitset<N>& bits, const std::vector<bool>& seen, int offset = 0)
{
    for (std::size_t v = 0; v < seen.size(); ++v) {
        if (seen[v]) bits.set(v - static_cast<std::size_t>(offset));
    }
}

void nextDay(CivilTime& c)
{
    c.hour = c.minute = c.second = 0;
    if (++c.day > daysInMonth(c.year, c.month)) {
        c.day = 1;
        if (++c.month > 12) {
            c.month = 1;
            ++c.year;
        }
    }
}

void nextHour(CivilTime& c)
{
    c.minute = c.second = 0;
    if (++c.hour > 23) nextDay(c);
}

void nextMinute(CivilTime& c)
{
    c.second = 0;
    if (++c.minute > 59) nextHour(c);
}

void nextSecond(CivilTime& c)
{
    if (++c.second > 59) nextMinute(c);
}

} // namespace

CronExpr::CronExpr(const std::string& spec, std::shared_ptr<const TimeZone> tz)
    : _spec(spec), _tz(tz ? std::move(tz) : TimeZone::utc())
{
    parse(spec);
}

void CronExpr::parse(const std::string& spec)
{
    std::string text = utils::trim(spec);
    if (!text.empty() && text[0] == '@') {
        text = expandAlias(text);
    }

    std::vector<std::string> fields;
    std::istringstream iss(text);
    std::string f;
    while (iss >> f) {
        fields.push_back(f);
    }

    switch (fields.size()) {
    case 5:
        fields.insert(fields.begin(), "0");
        fields.push_back("*");
        break;
    case 6:
        fields.push_back("*");
        break;
    case 7:
        break;
    default:
        throw ParseError("cron expression needs 5, 6 or 7 fields: \"" + spec + "\"");
    }

    static const FieldSpec kSecond{"second", 0, 59, nullptr, 0, 0};
    static const FieldSpec kMinute{"minute", 0, 59, nullptr, 0, 0};
    static const FieldSpec kHour{"hour", 0, 23, nullptr, 0, 0};
    static const FieldSpec kDay{"day-of-month", 1, 31, nullptr, 0, 0};
    static const FieldSpec kMonth{"month", 1, 12, kMonthNames.data(), kMonthNames.size(), 1};
    static const FieldSpec kWeekday{"day-of-week", 0, 7, kWeekdayNames.data(), kWeekdayNames.size(), 0};
    static const FieldSpec kYear{"year", kMinYear, kMaxYear, nullptr, 0, 0};

    bool star = false;
    bool last = false;

    assign(_seconds, parseField(fields[0], kSecond, false, false, star, last));
    assign(_minutes, parseField(fields[1], kMinute, false, false, star, last));
    assign(_hours, parseField(fields[2], kHour, false, false, star, last));

    assign(_days, parseField(fields[3], kDay, true, true, _dayStar, _lastDay));
    assign(_months, parseField(fields[4], kMonth, false, false, star, last));

    auto weekdays = parseField(fields[5], kWeekday, true, false, _weekdayStar, last);
    if (weekdays[7]) {
        weekdays[0] = true;   // 7 == Sunday
        weekdays[7] = false;
    }
    weekdays.resize(7);
    assign(_weekdays, weekdays);

    // 年份下标从 kMinYear 开始
    assign(_years, parseField(fields[6], kYear, false, false, star, last), kMinYear);
}

bool CronExpr::dayMatches(int year, int month, int day) const
{
    const bool domOk = _days.test(static_cast<std::size_t>(day)) ||
                       (_lastDay && day == daysInMonth(year, month));
    const bool dowOk = _weekdays.test(static_cast<std::size_t>(weekdayOf(year, month, day)));
    if (_dayStar && _weekdayStar) return domOk && dowOk;
    if (_dayStar) return dowOk;
    if (_weekdayStar) return domOk;
    return domOk || dowOk;
}

bool CronExpr::findCivil(CivilTime& c) const
{
    if (c.year < kMinYear) {
        c = CivilTime{kMinYear, 1, 1, 0, 0, 0};
    }
    while (true) {
        if (c.year > kMaxYear) {
            return false;
        }
        if (!_years.test(static_cast<std::size_t>(c.year - kMinYear))) {
            c = CivilTime{c.year + 1, 1, 1, 0, 0, 0};
            continue;
        }
        if (!_months.test(static_cast<std::size_t>(c.month))) {
            c.day = 1;
            c.hour = c.minute = c.second = 0;
            if (++c.month > 12) {
                c.month = 1;
                ++c.year;
            }
            continue;
        }
        if (!dayMatches(c.year, c.month, c.day)) {
            nextDay(c);
            continue;
        }
        if (!_hours.test(static_cast<std::size_t>(c.hour))) {
            nextHour(c);
            continue;
        }
        if (!_minutes.test(static_cast<std::size_t>(c.minute))) {
            nextMinute(c);
            continue;
        }
        if (!_seconds.test(static_cast<std::size_t>(c.second))) {
            nextSecond(c);
            continue;
        }
        return true;
    }
}

Schedule::time_point CronExpr::next(time_point prev) const
{
    // 按"偏移量不变"的区间逐段找：区间内墙上时间和 UTC 一一对应，
    // 跨过切换点就从切换点重新开始，缺口里的时间自然被跳过，回拨的那一小时也会再走一遍
    sys_seconds from = std::chrono::floor<std::chrono::seconds>(prev) + std::chrono::seconds(1);
    while (true) {
        const std::chrono::seconds off = _tz->offsetAt(from);
        CivilTime c = civilFromSeconds((from + off).time_since_epoch().count());
        if (!findCivil(c)) {
            throw ScheduleExhaustedError("cron \"" + _spec + "\" has no activation after " +
                                         std::to_string(kMaxYear));
        }
        const sys_seconds t = sys_seconds(std::chrono::seconds(secondsFromCivil(c))) - off;
        const auto change = _tz->nextTransition(from, t);
        if (!change) {
            return time_point(t.time_since_epoch());
        }
        from = *change;
    }
}

} // namespace dcron::scheduler
