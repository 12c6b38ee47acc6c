#pragma once

#include <string>

namespace runexec {

/**
 * @brief 没有指定 wall time limit 但指定了 CPU time limit 时，
 * wall time 的兜底限制为 CPU time limit 加上这个值（秒）
 * 确保监控线程以及被测程序不会无限期地运行（比如程序一直在 sleep）
 */
extern double WALLTIME_BACKSTOP_OVERHEAD;

/**
 * @brief 监控线程两次采样之间的最长间隔（秒）
 * 决定了超限后最多多久才能被发现，也是内存采样的周期
 */
extern double MONITOR_MAX_INTERVAL;

/**
 * @brief 监控线程两次采样之间的最短间隔（秒），避免忙等
 */
extern double MONITOR_MIN_INTERVAL;

/**
 * @brief 为每次运行创建的 cgroup 的名称前缀
 * cgroup 将被创建在 runexec 自身所在 cgroup 之下：<current cgroup>/<CGROUP_PREFIX>_<pid>_<n>
 * 可以通过环境变量 RUNEXEC_CGROUP_PREFIX 修改
 */
extern std::string CGROUP_PREFIX;

/**
 * @brief 日志文件头部的行数
 * 第一行为执行的命令行，之后是为其他模块写入元数据预留的行
 */
constexpr int LOG_HEADER_LINES = 6;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，被中断的运行的日志文件不会被删除，而是重命名为 <log>.killed，
 * 以便手动检查。
 */
extern bool DEBUG;

}  // namespace runexec
