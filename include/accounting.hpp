#pragma once

#include <sys/types.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "run_spec.hpp"

namespace runexec {

/**
 * @brief 对一次运行的整个进程树进行资源统计
 * 资源监控线程通过这个接口采样，run_executor 在运行结束时通过它收集最终数据
 */
struct accounting {
    virtual ~accounting() = default;

    /**
     * @brief 将进程 pid 移入统计范围，之后它 fork 出的进程也会被统计
     */
    virtual void attach(pid_t pid) = 0;

    /**
     * @brief 杀死统计范围内所有的进程
     */
    virtual void kill_all() = 0;

    /**
     * @brief 是否已经通过 cpuset 将进程树限制在指定的核心上
     */
    virtual bool has_cpuset() const = 0;

    /**
     * @brief 所有任务（包括已经退出的子孙进程）累计消耗的 CPU 时间，单位为秒
     */
    virtual double cpu_time() = 0;

    /**
     * @brief 每个 CPU 核心上消耗的 CPU 时间，只包含消耗不为零的核心
     */
    virtual std::map<int, double> cpu_time_per_core() = 0;

    /**
     * @brief 内存使用峰值（字节），不支持时返回空
     */
    virtual std::optional<int64_t> memory_peak() = 0;

    /**
     * @brief 进程树是否已经用完了内存限制（发生了 OOM）
     */
    virtual bool memory_exhausted() = 0;
};

/**
 * @brief 当前系统可用的 cgroup 资源管控器
 * 只有挂载了且 runexec 有权限在自身所在 cgroup 下创建子 cgroup 的 controller 才算可用
 */
struct accounting_support {
    bool cpuacct = false;
    bool memory = false;
    bool cpuset = false;

    /**
     * @brief 检测系统对 cgroup 的支持情况，结果会被缓存
     */
    static const accounting_support &probe();
};

/**
 * @brief 基于 cgroup v1（libcgroup）的资源统计
 * 构造时在内核中创建 cgroup 并写入资源限制，析构时杀死 cgroup 内所有残留进程并删除 cgroup。
 *
 * 1. cpuacct：统计 CPU 时间（总量以及每个核心）
 * 2. memory：限制内存，关闭 OOM killer，以便由资源监控线程发现 OOM 并记录终止原因
 * 3. cpuset：将进程树限制在指定的 CPU 核心上
 */
struct cgroup_accounting : public accounting {
    cgroup_accounting(const accounting_support &support, const resource_limits &limits);
    ~cgroup_accounting() override;

    cgroup_accounting(const cgroup_accounting &) = delete;
    cgroup_accounting &operator=(const cgroup_accounting &) = delete;

    /**
     * @brief 将进程 pid 移入所有创建的 cgroup
     */
    void attach(pid_t pid) override;

    /**
     * @brief 杀死 cgroup 内所有的进程，确保被测程序 fork 出来的子进程都不会留驻系统
     */
    void kill_all() override;

    double cpu_time() override;
    std::map<int, double> cpu_time_per_core() override;
    std::optional<int64_t> memory_peak() override;
    bool memory_exhausted() override;

    bool has_cpuset() const override;

private:
    std::string read_value(const std::string &controller, const std::string &file) const;

    std::string name;
    // controller -> 在该 controller 层级下的 cgroup 路径
    std::map<std::string, std::string> cgroups;
    std::map<std::string, std::string> mounts;
};

}  // namespace runexec
