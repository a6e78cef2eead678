#pragma once
#include <stdexcept>
#include <string>

namespace dcron {

// 所有调度相关错误的基类；异步路径上通过 ErrorHandler 回调上报，不会跨 timer 抛出
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 注册时 job 名冲突
class AlreadyExistsError : public Error {
public:
    explicit AlreadyExistsError(const std::string& jobName)
        : Error("add job " + jobName + ": already exists"), _jobName(jobName) {}
    const std::string& jobName() const { return _jobName; }

private:
    std::string _jobName;
};

// 表达式 / duration 字面量非法
class ParseError : public Error {
public:
    using Error::Error;
};

// 时区、选项等构造期配置错误
class ConfigError : public Error {
public:
    using Error::Error;
};

// Locker 后端失败（网络等），本次触发跳过
class LockBackendError : public Error {
public:
    using Error::Error;
};

// 任务本身失败
class TaskError : public Error {
public:
    TaskError(const std::string& jobName, const std::string& what)
        : Error("job " + jobName + ": " + what), _jobName(jobName) {}
    const std::string& jobName() const { return _jobName; }

private:
    std::string _jobName;
};

// 表达式在可表示范围内不再有下一次触发时间
class ScheduleExhaustedError : public Error {
public:
    using Error::Error;
};

} // namespace dcron
