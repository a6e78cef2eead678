#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

namespace dcron {

// 配置文件里的一条 job：{"name": "...", "expr": "...", "command": "..."}
struct JobConfig {
    std::string name;
    std::string expr;
    std::string command;
};

class Config {
public:
    // 单例接口
    static Config& instance();

    // 加载 JSON 配置文件；失败返回 false 并保留当前配置
    bool load(const std::string& path);

    // 直接从字符串加载（测试用）
    bool loadFromString(const std::string& text);

    // 从环境变量覆盖配置
    void load_from_env();

    // 点分路径取值，例如 get<int>("locker.port", 6379)
    template <typename T>
    T get(const std::string& key, T def = T{}) const {
        std::lock_guard<std::mutex> lk(_mu);
        const nlohmann::json* node = find_(key);
        if (!node || node->is_null()) return def;
        try {
            return node->get<T>();
        } catch (const nlohmann::json::exception&) {
            return def;
        }
    }

    bool contains(const std::string& key) const;

    // 常用配置
    std::string timezone() const { return get<std::string>("scheduler.timezone", "UTC"); }
    long long lock_ttl_ms() const { return get<long long>("scheduler.lock_ttl_ms", 1000); }
    int timer_threads() const { return get<int>("scheduler.timer_threads", 1); }
    long long shutdown_wait_ms() const { return get<long long>("scheduler.shutdown_wait_ms", 10000); }
    std::string locker_type() const { return get<std::string>("locker.type", "none"); }
    std::string log_path() const { return get<std::string>("log.path", ""); }
    std::string log_level() const { return get<std::string>("log.level", "info"); }

    // jobs 数组；条目缺字段时抛 std::invalid_argument
    std::vector<JobConfig> jobs() const;

    void reset();

private:
    Config();                           // 私有构造
    Config(const Config&) = delete;     // 禁止拷贝
    Config& operator=(const Config&) = delete;

    const nlohmann::json* find_(const std::string& key) const;
    void set_(const std::string& key, nlohmann::json value);

private:
    mutable std::mutex _mu;
    nlohmann::json _root;
};

} // namespace dcron
