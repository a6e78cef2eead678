#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "time_zone.h"

namespace dcron::scheduler {

/// 触发时间计划：给定上一次触发时刻，返回下一次触发时刻。
/// 约定 next(t) > t；构造后不可变，可以被多个线程共享。
class Schedule {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Schedule() = default;

    virtual time_point next(time_point prev) const = 0;

    // 日志里用的描述
    virtual std::string describe() const = 0;
};

// 固定间隔
class EverySchedule : public Schedule {
public:
    explicit EverySchedule(std::chrono::seconds step);

    time_point next(time_point prev) const override;
    std::string describe() const override;

    std::chrono::seconds step() const { return _step; }

private:
    std::chrono::seconds _step;
};

/// 按秒截断，结果 <= 0 时取 1 秒
std::shared_ptr<const Schedule> every(std::chrono::nanoseconds d);

/// "@every <duration>" 或 cron 表达式（含 @daily 等别名）；非法时抛 dcron::ParseError
std::shared_ptr<const Schedule> parseSchedule(const std::string& expr,
                                              std::shared_ptr<const TimeZone> tz = TimeZone::utc());

} // namespace dcron::scheduler
