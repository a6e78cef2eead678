#include "config.h"
#include <cstdlib>          // getenv
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "log/logger.h"
namespace dcron {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() : _root(nlohmann::json::object()) {
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::warn("Config file not found: " + path + ", using defaults");
        return false;
    }

    std::stringstream ss;
    ss << ifs.rdbuf();
    if (!loadFromString(ss.str())) {
        Logger::error("Failed to parse config file: " + path);
        return false;
    }
    Logger::info("Config loaded from: " + path);
    return true;
}

bool Config::loadFromString(const std::string& text) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            Logger::error("Config root must be a JSON object");
            return false;
        }
        std::lock_guard<std::mutex> lk(_mu);
        _root = std::move(j);
        return true;
    }
    catch (const nlohmann::json::exception& ex) {
        Logger::error(std::string("Config parse error: ") + ex.what());
        return false;
    }
}

void Config::load_from_env() {
    if (const char* p = std::getenv("DCRON_TIMEZONE")) {
        set_("scheduler.timezone", p);
    }
    if (const char* p = std::getenv("DCRON_LOCK_TTL_MS")) {
        set_("scheduler.lock_ttl_ms", std::atoll(p));
    }
    if (const char* p = std::getenv("DCRON_LOCKER")) {
        set_("locker.type", p);
    }
    if (const char* p = std::getenv("DCRON_REDIS_HOST")) {
        set_("locker.host", p);
    }
    if (const char* p = std::getenv("DCRON_REDIS_PORT")) {
        set_("locker.port", std::atoi(p));
    }
    if (const char* p = std::getenv("DCRON_LOG")) {
        set_("log.path", p);
    }
}

bool Config::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lk(_mu);
    return find_(key) != nullptr;
}

std::vector<JobConfig> Config::jobs() const {
    std::lock_guard<std::mutex> lk(_mu);
    std::vector<JobConfig> out;
    auto it = _root.find("jobs");
    if (it == _root.end() || !it->is_array()) {
        return out;
    }
    for (const auto& j : *it) {
        if (!j.is_object()
            || !j.contains("name") || !j["name"].is_string()
            || !j.contains("expr") || !j["expr"].is_string()
            || !j.contains("command") || !j["command"].is_string()) {
            throw std::invalid_argument("job entry requires string fields name, expr and command: " + j.dump());
        }
        JobConfig jc;
        jc.name = j["name"].get<std::string>();
        jc.expr = j["expr"].get<std::string>();
        jc.command = j["command"].get<std::string>();
        out.push_back(std::move(jc));
    }
    return out;
}

void Config::reset() {
    std::lock_guard<std::mutex> lk(_mu);
    _root = nlohmann::json::object();
}

const nlohmann::json* Config::find_(const std::string& key) const {
    const nlohmann::json* node = &_root;
    std::size_t start = 0;
    while (start <= key.size()) {
        const std::size_t dot = key.find('.', start);
        const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return node;
}

void Config::set_(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lk(_mu);
    nlohmann::json* node = &_root;
    std::size_t start = 0;
    for (;;) {
        const std::size_t dot = key.find('.', start);
        const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) *node = nlohmann::json::object();
        if (dot == std::string::npos) {
            (*node)[part] = std::move(value);
            return;
        }
        node = &(*node)[part];
        start = dot + 1;
    }
}

} // namespace dcron
