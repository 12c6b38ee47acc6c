#pragma once

#include <sys/types.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "accounting.hpp"
#include "elevation.hpp"
#include "run_spec.hpp"

namespace runexec {

/**
 * @brief 一次运行所处的状态
 * not_started -> running -> {exited_normally, terminated}
 */
enum class run_state {
    not_started,
    running,
    exited_normally,  // 进程自行退出
    terminated        // 进程被信号终止，不一定有终止原因
};

/**
 * @brief 运行单个被测命令并测量其资源消耗
 *
 * 1. 在 fork 之前完成所有的参数检查，无法实施的限制抛出 configuration_error，不会部分生效
 * 2. 子进程拥有独立的进程组，标准输出和标准错误被重定向到日志文件
 * 3. 如果系统支持，进程树被放入独立的 cgroup 中统计 CPU 时间和内存，并施加内存和 CPU 核心限制
 * 4. 资源监控线程在超限时杀死进程组，并记录终止原因
 * 5. 运行结束后杀死进程组中残留的进程，收集统计数据，缩减日志文件
 *
 * 同一个 run_executor 同时只能有一次 execute_run，但是 stop() 可以在任意线程中调用。
 */
struct run_executor {
    /**
     * @param user 以该用户身份（用户名或者 "#uid"）通过 sudo 运行命令，为空时以当前用户运行
     * @throw configuration_error 用户不存在或者 sudo 无法使用
     */
    explicit run_executor(const std::optional<std::string> &user = {});

    virtual ~run_executor() = default;

    run_executor(const run_executor &) = delete;
    run_executor &operator=(const run_executor &) = delete;

    /**
     * @brief 运行命令直到其结束、超过限制或者被 stop() 终止
     * @param cancelled 进入运行状态时检查一次，返回 true 时视为 stop() 已经被调用，
     *        用于处理在 execute_run 开始之前请求的终止
     * @return 运行结果，超限、被杀死、非零返回值都不会抛出异常
     * @throw configuration_error 请求的限制无法在当前系统上实施
     * @throw spawn_error 命令无法启动，此时日志文件被删除
     * @throw std::system_error 系统调用失败
     */
    run_result execute_run(const run_spec &spec, const std::function<bool()> &cancelled = {});

    /**
     * @brief 终止当前正在运行的命令，没有正在运行的命令时什么也不做
     * 可以在其他线程中调用，可以重复调用，不会抛出异常。
     * 真正终止了进程时，运行结果的终止原因为 killed。
     */
    void stop() noexcept;

    /**
     * @brief 最近一次运行的状态
     */
    run_state state() const;

    const accounting_support &support() const;

protected:
    /**
     * @brief 创建本次运行的资源统计，系统不支持 cgroup 时返回空
     */
    virtual std::unique_ptr<accounting> make_accounting(const resource_limits &limits);

private:
    void validate(const run_spec &spec) const;

    /**
     * @brief 记录终止原因并向进程组发送信号，只有第一个终止原因会被记录
     */
    void terminate(termination_reason reason, int signal);

    // 调用前必须持有 mut
    void signal_process_group(int signal);

    std::unique_ptr<privilege_elevation> elevation;
    const accounting_support &cgroup_support;

    mutable std::mutex mut;
    run_state current_state = run_state::not_started;
    pid_t child_pid = -1;
    bool reaped = false;
    bool stopping = false;
    std::optional<termination_reason> reason;
};

}  // namespace runexec
