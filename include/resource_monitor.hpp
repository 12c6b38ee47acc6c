#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "accounting.hpp"
#include "common/utils.hpp"
#include "run_spec.hpp"

namespace runexec {

/**
 * @brief 资源监控线程
 * 在后台周期性采样进程树的 CPU 时间、时钟时间和内存状态，发现超过限制时通过回调杀死进程树。
 *
 * 1. 超过 soft CPU time limit：发送 SIGTERM，终止原因为 cputime-soft，之后继续监控其他限制
 * 2. 超过 hard CPU time limit、wall time limit、内存限制：发送 SIGKILL，终止原因分别为
 *    cputime、walltime、memory，之后监控线程退出
 *
 * 同一次采样中多个限制同时超过时，按 soft、hard、wall、memory 的顺序处理。
 * 未设置 wall time limit 但设置了 CPU time limit 时，使用 CPU time limit + WALLTIME_BACKSTOP_OVERHEAD
 * 作为兜底的 wall time limit。
 *
 * 两次采样之间的间隔根据离最近的限制还剩多少时间计算，并且不超过 MONITOR_MAX_INTERVAL。
 *
 * 采样失败时无法再实施任何限制，此时以终止原因 killed 发送 SIGKILL，之后监控线程退出。
 */
struct resource_monitor {
    /**
     * @brief 超限时的回调
     * @param reason 终止原因
     * @param signal 应当发送给进程树的信号
     */
    using limit_callback = std::function<void(termination_reason reason, int signal)>;

    /**
     * @param limits 资源限制
     * @param acct 进程树的资源统计，为空时只能检查时钟时间
     * @param on_limit 超限时的回调，在监控线程中调用
     */
    resource_monitor(const resource_limits &limits, accounting *acct, limit_callback on_limit);

    ~resource_monitor();

    resource_monitor(const resource_monitor &) = delete;
    resource_monitor &operator=(const resource_monitor &) = delete;

    /**
     * @brief 启动监控线程
     * @param since wall time 的起点，通常是进程开始运行的时刻
     */
    void start(const elapsed_time &since = elapsed_time());

    /**
     * @brief 停止并等待监控线程退出，可以重复调用
     */
    void stop();

    /**
     * @brief 实际生效的 wall time limit（包括兜底限制）
     */
    std::optional<double> wall_time_limit() const;

private:
    void run();
    void watch();

    std::optional<double> hard_cpu_time, soft_cpu_time, wall_time;
    bool limit_memory;
    unsigned cpu_count;

    accounting *acct;
    limit_callback on_limit;
    elapsed_time clock;

    std::thread thd;
    std::mutex mut;
    std::condition_variable cond;
    bool finished = false;
};

}  // namespace runexec
