#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "run_spec.hpp"

/**
 * 批量执行相关函数
 * 调度层将一组 run_unit 放入并发队列，由若干个 worker 线程取出执行。
 * 每个 worker 线程拥有一个 run_executor，同一时间只运行一个命令。
 *
 * 中断通过 cancellation_token 传递：调用 cancel() 之后，所有正在运行的命令会被
 * run_executor::stop() 终止，尚未开始的命令不会再启动。被中断的运行不会得到结果，
 * 它们的日志文件会被删除（DEBUG 模式下重命名为 <log>.killed），不会看起来像是完整的日志。
 */
namespace runexec {

/**
 * @brief 一次运行的调度单元
 */
struct run_unit {
    virtual ~run_unit() = default;

    virtual std::vector<std::string> command_line() const = 0;

    virtual std::filesystem::path log_file() const = 0;

    /**
     * @brief 用于日志输出的唯一标识
     */
    virtual std::string identifier() const = 0;

    /**
     * @brief 运行正常结束（没有被中断）时调用，每个调度单元最多调用一次
     */
    virtual void set_result(const run_result &result) = 0;
};

/**
 * @brief 在线程之间共享的中断标记
 */
struct cancellation_token {
    using callback = std::function<void()>;

    /**
     * @brief 标记为已中断，并调用所有已注册的回调，只有第一次调用有效
     */
    void cancel();

    bool cancelled() const;

    /**
     * @brief 注册中断时的回调，如果已经被中断，回调会被立即调用
     * @return 回调的编号，用于 unsubscribe
     */
    std::size_t subscribe(callback cb);

    void unsubscribe(std::size_t id);

private:
    mutable std::mutex mut;
    bool is_cancelled = false;
    std::size_t next_id = 0;
    std::map<std::size_t, callback> callbacks;
};

/**
 * @brief 批量运行的公共参数
 */
struct benchmark_options {
    /**
     * @brief 每次运行的资源限制，cores 会被 cores_per_run 的分配覆盖
     */
    resource_limits limits;

    std::optional<std::size_t> max_log_size;

    /**
     * @brief 以该用户身份运行，为空时以当前用户运行
     */
    std::optional<std::string> user;

    std::map<std::string, std::string> environment;

    std::filesystem::path work_dir;

    /**
     * @brief worker 线程数
     */
    unsigned threads = 1;

    /**
     * @brief 为每个 worker 分配的互不相交的 CPU 核心数，0 表示不分配
     */
    unsigned cores_per_run = 0;

    /**
     * @brief 被中断的运行保留日志文件，重命名为 <log>.killed
     */
    bool debug = false;
};

/**
 * @brief 为每个 worker 分配 CPU 核心
 * @return 第 i 个 worker 使用的核心
 * @throw configuration_error 机器的核心数不够分配
 */
std::vector<std::vector<int>> assign_cores(unsigned threads, unsigned cores_per_run, unsigned cpu_count);

/**
 * @brief 处理被中断的运行的日志文件
 */
void abandon_log(const std::filesystem::path &log_file, bool debug);

/**
 * @brief 使用 options.threads 个 worker 线程运行所有的调度单元，阻塞直到全部完成或者被中断
 * 单个运行的失败（比如命令无法启动）只会被记录在日志中，不影响其他运行。
 * @return 是否全部运行完成（没有被中断）
 * @throw configuration_error 参数无法在当前系统上实施，此时没有任何运行被启动
 */
bool execute_runs(const std::vector<std::shared_ptr<run_unit>> &units, const benchmark_options &options,
                  cancellation_token &token);

}  // namespace runexec
