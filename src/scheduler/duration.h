#pragma once
#include <chrono>
#include <string>

namespace dcron::scheduler {

/// 解析 duration 字面量，例如 "300ms"、"1.5h"、"2h45m"、"-1s"。
/// 语法：[-+]? (<decimal><unit>)+ ，单位 ns/us/µs/μs/ms/s/m/h；单独的 "0" 合法。
/// 非法时抛 dcron::ParseError。
std::chrono::nanoseconds parseDuration(const std::string& s);

// 反向格式化，主要用于日志
std::string formatDuration(std::chrono::nanoseconds d);

} // namespace dcron::scheduler
