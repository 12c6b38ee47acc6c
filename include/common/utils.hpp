#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace runexec {

/**
 * @brief 抛出带有 errno 描述的 std::system_error
 * @param err errno
 * @param format fmt 格式串，描述失败的操作
 */
template <typename... Args>
void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw std::system_error(err, std::system_category(), fmt::format(format, std::forward<Args>(args)...));
}

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序通过 boost::lexical_cast 转换为字符串并装入容器
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 在当前进程的环境变量基础上覆盖 overrides，生成 execve 所需的 KEY=VALUE 列表
 * 必须在 fork 之前调用，子进程中只允许使用 async-signal-safe 的函数
 */
std::vector<std::string> make_environment(const std::map<std::string, std::string> &overrides);

/**
 * @brief 将 std::string 列表转换为以 nullptr 结尾的 char* 数组，供 execve 使用
 * 返回的指针引用 list 中的字符串，list 的生命周期必须长于返回值
 */
std::vector<char *> make_argv(std::vector<std::string> &list);

/**
 * @brief 执行外部命令并等待其结束
 * @param env 额外的环境变量
 * @param args 外部命令的路径 (args[0]) 和 参数
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::map<std::string, std::string> &env, std::vector<std::string> args);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     // 相当于 system("sudo --non-interactive -u nobody true");
 *     int exitcode = call_process("sudo", "--non-interactive", "-u", "nobody", "true");
 * @endcode
 */
template <typename... Args>
int call_process_env(std::map<std::string, std::string> const &env, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(env, std::move(list));
}

template <typename... Args>
int call_process(Args &&... args) {
    return call_process_env({}, args...);
}

/**
 * @brief 将命令行参数用单个空格连接起来，作为日志文件的第一行
 */
std::string join_command_line(const std::vector<std::string> &args);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 从单调时钟计时，用于统计 wall time
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runexec
