#include "schedule.h"
#include "cron_parser.h"
#include "duration.h"
#include "core/errors.h"
#include "core/utils.h"

namespace dcron::scheduler {

namespace {

constexpr const char* kEveryPrefix = "@every";

} // namespace

EverySchedule::EverySchedule(std::chrono::seconds step) : _step(step)
{
    if (_step <= std::chrono::seconds::zero()) {
        _step = std::chrono::seconds(1);
    }
}

Schedule::time_point EverySchedule::next(time_point prev) const
{
    const auto t = std::chrono::floor<std::chrono::seconds>(prev + _step);
    return time_point(t.time_since_epoch());
}

std::string EverySchedule::describe() const
{
    return std::string(kEveryPrefix) + " " + formatDuration(_step);
}

std::shared_ptr<const Schedule> every(std::chrono::nanoseconds d)
{
    return std::make_shared<EverySchedule>(std::chrono::duration_cast<std::chrono::seconds>(d));
}

std::shared_ptr<const Schedule> parseSchedule(const std::string& expr, std::shared_ptr<const TimeZone> tz)
{
    const std::string s = utils::trim(expr);
    if (s.compare(0, 6, kEveryPrefix) == 0 && (s.size() == 6 || s[6] == ' ' || s[6] == '\t')) {
        const std::string literal = utils::trim(s.substr(6));
        if (literal.empty()) {
            throw ParseError("missing duration after @every");
        }
        return every(parseDuration(literal));
    }
    return std::make_shared<CronExpr>(s, std::move(tz));
}

} // namespace dcron::scheduler
