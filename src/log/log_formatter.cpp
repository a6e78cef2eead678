#include "log_formatter.h"
#include <sstream>
#include "core/utils.h"
namespace dcron::core {

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

std::string LogFormatter::escapeMsg_(const std::string& s) {
    // 单行日志，最小转义
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c == '"')  out += "\\\"";
        else out += c;
    }
    return out;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream oss;

    oss << "ts=[" << utils::formatTimestampMs(r.ts) << ']'
        << " level=[" << Logger::level_to_string(r.level) << "]"
        << " seq=" << static_cast<unsigned long long>(r.seq);

    if (!r.jobName.empty()) oss << " job=" << r.jobName;

    oss << " msg=\"" << escapeMsg_(r.message) << "\"";

    for (const auto& kv : r.fields) {
        oss << " " << kv.first << "=" << escapeMsg_(kv.second);
    }

    return oss.str();
}

} // namespace dcron::core
