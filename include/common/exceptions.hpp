#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runexec {

struct runexec_exception : std::exception {
    runexec_exception();
    explicit runexec_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runexec_exception &ex);

    template <typename T>
    runexec_exception operator<<(const T &t) const {
        return runexec_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示请求的限制无法在当前系统上实施
 * 比如缺少 cpuacct cgroup 时要求 soft time limit，或者 sudo 无法切换到指定用户。
 * 这类错误总是在创建子进程之前抛出，不会部分生效。
 */
struct configuration_error : public runexec_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示被测命令无法启动（可执行文件不存在、没有权限、工作目录无效等）
 */
struct spawn_error : public runexec_exception {
    spawn_error();
    explicit spawn_error(const std::string &message);
};

/**
 * @brief 表示 runexec 自身的内部错误
 */
struct internal_error : public runexec_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace runexec
