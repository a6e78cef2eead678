#include "utils.h"
#include <array>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>

namespace dcron {
namespace utils {

std::string now_string() {
    return formatTimestampMs(std::chrono::system_clock::now());
}

std::string formatTimestampMs(const std::chrono::system_clock::time_point &ts)
{
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds(1000);

    std::tm buf{};
    localtime_r(&t, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string formatUtc(const std::chrono::system_clock::time_point &ts)
{
    std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(ts));
    std::tm buf{};
    gmtime_r(&t, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string trim(const std::string &s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::pair<int, std::string> run_command(const std::string &cmd)
{
    std::array<char, 256> buffer{};
    std::string result;

    // 2>&1：失败时把 stderr 一并带回去，便于写进错误信息
    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (!pipe) {
        return { -1, "popen() failed" };
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result += buffer.data();
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return { -1, result };
    }
    if (WIFEXITED(status)) {
        return { WEXITSTATUS(status), result };
    }
    return { 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0), result };
}

} // namespace utils
} // namespace dcron
