#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "exit_status.hpp"

namespace runexec {

/**
 * @brief runexec 自己检测并强制执行的终止原因
 * 只有当 runexec 亲自发现超限并杀死进程时才会记录。
 * 进程自行退出、或者被继承来的系统限制（比如 ulimit）先一步杀死时，没有终止原因。
 */
enum class termination_reason {
    cputime,       // 超过 hard CPU time limit，SIGKILL
    cputime_soft,  // 超过 soft CPU time limit，SIGTERM
    walltime,      // 超过 wall time limit，SIGKILL
    memory,        // 超过内存限制，SIGKILL
    killed         // 被 run_executor::stop() 终止，SIGKILL
};

std::string to_string(termination_reason reason);

std::optional<termination_reason> parse_termination_reason(const std::string &text);

/**
 * @brief 子进程标准输入的来源
 */
struct input_source {
    enum class kind {
        null_device,      // /dev/null（默认）
        file_descriptor,  // 调用者提供的可读文件描述符，不会被关闭
        file,             // 打开指定的文件
        inherit           // 继承调用者自己的标准输入
    };

    kind type = kind::null_device;
    int fd = -1;
    std::filesystem::path path;

    static input_source null_device();
    static input_source from_fd(int fd);
    static input_source from_file(const std::filesystem::path &path);
    static input_source inherit();
};

/**
 * @brief 资源限制，未设置的限制不做检查
 */
struct resource_limits {
    /**
     * @brief CPU 时间硬限制（秒），超过后立即 SIGKILL
     */
    std::optional<double> hard_cpu_time;

    /**
     * @brief CPU 时间软限制（秒），超过后发送 SIGTERM
     */
    std::optional<double> soft_cpu_time;

    /**
     * @brief 时钟时间限制（秒）
     */
    std::optional<double> wall_time;

    /**
     * @brief 内存限制（字节）
     */
    std::optional<int64_t> memory;

    /**
     * @brief 允许使用的 CPU 核心，为空时不限制
     */
    std::vector<int> cores;
};

/**
 * @brief 一次运行的全部参数，传给 execute_run 之后不再修改
 */
struct run_spec {
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录，为空时继承调用者的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 在调用者环境变量基础上覆盖或新增的环境变量
     */
    std::map<std::string, std::string> environment;

    input_source input;

    /**
     * @brief 日志文件路径，保存命令行和子进程的 stdout/stderr
     */
    std::filesystem::path output_path;

    /**
     * @brief 日志文件的最大大小（字节），为空时不限制
     */
    std::optional<std::size_t> max_output_size;

    resource_limits limits;
};

/**
 * @brief 一次运行的结果，每次 execute_run 产生一次
 */
struct run_result {
    /**
     * @brief 时钟时间，从子进程开始执行到被回收，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief CPU 时间，包括所有子孙进程，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 每个 CPU 核心上消耗的 CPU 时间，只在有 cpuacct 统计时提供
     */
    std::map<int, double> cpu_time_per_core;

    /**
     * @brief 内存使用峰值（字节），只在有 memory cgroup 时提供
     */
    std::optional<int64_t> memory;

    exit_status exit;

    std::optional<termination_reason> reason;

    /**
     * @brief 通过 sudo 运行时，修正后的目标进程返回值
     */
    std::optional<int> return_value;

    /**
     * @brief 转换为扁平的键值对：cputime, walltime, memory, exitcode,
     * terminationreason, returnvalue, cputime-cpu<N>
     */
    std::map<std::string, std::string> to_map() const;
};

}  // namespace runexec
