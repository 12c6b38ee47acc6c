#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace runexec {

/**
 * @brief 一次运行的日志文件
 * 日志文件以 LOG_HEADER_LINES 行的头部开始：第一行是实际执行的命令行，
 * 之后是两个空行、80 个 '-' 组成的分隔线以及两个空行。子进程的 stdout 和 stderr 从第 7 行开始写入。
 *
 * 运行结束后调用 finalize 关闭文件并按照限制缩减文件大小，头部总是被完整保留。
 */
struct output_log {
    /**
     * @brief 创建（或者截断）日志文件并写入头部
     * @param path 日志文件路径
     * @param command_line 实际执行的命令行
     * @throw std::system_error 当文件无法创建或写入时
     */
    output_log(const std::filesystem::path &path, const std::string &command_line);
    ~output_log();

    output_log(const output_log &) = delete;
    output_log &operator=(const output_log &) = delete;

    /**
     * @brief 日志文件的描述符，子进程将 stdout 和 stderr 重定向到这里
     * 描述符设置了 O_CLOEXEC，dup2 得到的副本不受影响
     */
    int fd() const;

    /**
     * @brief 头部的字节数
     */
    std::size_t header_size() const;

    const std::filesystem::path &path() const;

    /**
     * @brief 关闭文件，如果指定了 max_size 则将文件缩减到该大小以内
     * @return 文件是否被缩减
     */
    bool finalize(std::optional<std::size_t> max_size);

    /**
     * @brief 关闭并删除日志文件，用于子进程没能启动的情况
     */
    void discard();

private:
    void close_fd();

    std::filesystem::path file;
    int log_fd = -1;
    std::size_t header_bytes = 0;
};

/**
 * @brief 生成日志文件的头部
 */
std::string make_log_header(const std::string &command_line);

}  // namespace runexec
