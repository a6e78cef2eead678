#pragma once

#include <string>
#include <chrono>
#include <utility>
namespace dcron {
namespace utils {

// 当前时间，格式：YYYY-MM-DD HH:MM:SS.mmm（本地时区）
std::string now_string();

std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

// UTC，格式：YYYY-MM-DDTHH:MM:SSZ
std::string formatUtc(const std::chrono::system_clock::time_point& ts);

// 去掉首尾空白（空格、tab、换行）
std::string trim(const std::string& s);

// 执行 shell 命令，返回 {exit code, stdout}
std::pair<int, std::string> run_command(const std::string& cmd);
} // namespace utils
} // namespace dcron
