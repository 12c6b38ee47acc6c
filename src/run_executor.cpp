#include "run_executor.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "output_log.hpp"
#include "resource_monitor.hpp"

namespace runexec {
using namespace std;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

/**
 * @brief 子进程在 exec 之前失败时，通过管道报告给父进程的信息
 */
struct spawn_failure {
    int stage;
    int err;
};

enum spawn_stage {
    STAGE_SYNC,
    STAGE_STDIN,
    STAGE_STDOUT,
    STAGE_RLIMIT,
    STAGE_CHDIR,
    STAGE_EXEC
};

static string describe_stage(int stage, const run_spec &spec) {
    switch (stage) {
        case STAGE_SYNC: return "waiting for parent";
        case STAGE_STDIN: return "redirecting standard input";
        case STAGE_STDOUT: return "redirecting output to " + spec.output_path.string();
        case STAGE_RLIMIT: return "setting cpu time limit";
        case STAGE_CHDIR: return "changing directory to " + spec.work_dir.string();
        case STAGE_EXEC: return "executing " + spec.command[0];
        default: return "starting command";
    }
}

/**
 * @brief 子进程中报告错误并退出，只能使用 async-signal-safe 的函数
 */
[[noreturn]] static void child_fail(int fd, int stage) {
    spawn_failure failure = {stage, errno};
    if (write(fd, &failure, sizeof(failure)) < 0) {
        // 父进程会因为读到 EOF 而认为 exec 成功，只能依靠返回值 127 判断
    }
    _exit(127);
}

static bool is_valid_limit(const optional<double> &value) {
    return !value || (isfinite(*value) && *value >= 0);
}

run_executor::run_executor(const optional<string> &user)
    : cgroup_support(accounting_support::probe()) {
    if (user) elevation = make_unique<privilege_elevation>(*user);
}

const accounting_support &run_executor::support() const {
    return cgroup_support;
}

run_state run_executor::state() const {
    scoped_lock lock(mut);
    return current_state;
}

void run_executor::validate(const run_spec &spec) const {
    auto &limits = spec.limits;

    if (spec.command.empty())
        throw configuration_error("Command line must not be empty.");
    if (spec.output_path.empty())
        throw configuration_error("Output file must be specified.");

    if (!is_valid_limit(limits.hard_cpu_time))
        throw configuration_error("Time limit must be a non-negative finite number.");
    if (!is_valid_limit(limits.soft_cpu_time))
        throw configuration_error("Soft time limit must be a non-negative finite number.");
    if (!is_valid_limit(limits.wall_time))
        throw configuration_error("Wall time limit must be a non-negative finite number.");
    if (limits.memory && *limits.memory <= 0)
        throw configuration_error("Memory limit must be positive.");

    if (limits.soft_cpu_time && limits.hard_cpu_time && *limits.soft_cpu_time > *limits.hard_cpu_time)
        throw configuration_error("Soft time limit cannot be larger than the hard time limit.");

    if (limits.soft_cpu_time && !cgroup_support.cpuacct)
        throw configuration_error("Soft time limit cannot be specified without cpuacct cgroup.");
    if (limits.wall_time && !cgroup_support.cpuacct)
        throw configuration_error("Wall time limit is not implemented for systems without cpuacct cgroup.");
    if (limits.memory && !cgroup_support.memory)
        throw configuration_error("Memory limit specified, but cannot be implemented without cgroup support.");

    int cpu_count = thread::hardware_concurrency();
    for (int core : limits.cores) {
        if (core < 0 || (cpu_count > 0 && core >= cpu_count))
            throw configuration_error(fmt::format("CPU core {} is not available, this machine has {} cores.", core, cpu_count));
    }

    if (spec.input.type == input_source::kind::file_descriptor && fcntl(spec.input.fd, F_GETFD) < 0)
        throw configuration_error(fmt::format("Input file descriptor {} is not valid.", spec.input.fd));
}

unique_ptr<accounting> run_executor::make_accounting(const resource_limits &limits) {
    if (cgroup_support.cpuacct || cgroup_support.memory || (cgroup_support.cpuset && !limits.cores.empty()))
        return make_unique<cgroup_accounting>(cgroup_support, limits);
    return nullptr;
}

void run_executor::signal_process_group(int signal) {
    if (child_pid <= 0 || reaped) return;

    if (elevation) {
        if (!elevation->kill(child_pid, signal))
            LOG(ERROR) << "unable to send signal " << signal << " to process group " << child_pid;
        return;
    }

    // 进程组可能已经不存在了，这不是错误
    if (kill(-child_pid, signal) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send signal " << signal << " to process group " << child_pid << ": " << strerror(errno);
}

void run_executor::terminate(termination_reason new_reason, int signal) {
    scoped_lock lock(mut);
    if (current_state != run_state::running || reaped) return;
    if (!reason) reason = new_reason;
    signal_process_group(signal);
}

void run_executor::stop() noexcept {
    try {
        scoped_lock lock(mut);
        if (current_state != run_state::running || reaped || stopping) return;
        stopping = true;
        if (!reason) reason = termination_reason::killed;
        LOG(INFO) << "stopping process group " << child_pid;
        // child_pid 还没有确定时，execute_run 在 fork 之后会检查 stopping
        signal_process_group(SIGKILL);
    } catch (std::exception &ex) {
        LOG(ERROR) << "unable to stop run: " << ex.what();
    }
}

run_result run_executor::execute_run(const run_spec &spec, const function<bool()> &cancelled) {
    validate(spec);
    auto &limits = spec.limits;

    {
        scoped_lock lock(mut);
        if (current_state == run_state::running)
            throw internal_error("execute_run is already running on this executor");
        current_state = run_state::running;
        child_pid = -1;
        reaped = false;
        stopping = false;
        reason.reset();
    }
    bool spawned = false;
    defer {
        scoped_lock lock(mut);
        if (current_state == run_state::running)
            current_state = spawned ? run_state::terminated : run_state::not_started;
    };
    // stop() 在进入运行状态之前调用时什么也不做，因此在这里补上
    if (cancelled && cancelled()) {
        scoped_lock lock(mut);
        stopping = true;
        if (!reason) reason = termination_reason::killed;
    }

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此所有的内存分配都在 fork 之前完成
    vector<string> args, envs;
    if (elevation) {
        args = elevation->wrap(spec.command, spec.environment);
        envs = make_environment({});
    } else {
        args = spec.command;
        envs = make_environment(spec.environment);
    }
    vector<char *> argv = make_argv(args), envp = make_argv(envs);
    string command_line = join_command_line(args);

    int input_fd = -1;
    bool close_input = false;
    switch (spec.input.type) {
        case input_source::kind::null_device:
            input_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (input_fd < 0) error(errno, "opening /dev/null");
            close_input = true;
            break;
        case input_source::kind::file:
            input_fd = open(spec.input.path.c_str(), O_RDONLY | O_CLOEXEC);
            if (input_fd < 0)
                throw spawn_error(fmt::format("opening input file '{}': {}", spec.input.path.string(), strerror(errno)));
            close_input = true;
            break;
        case input_source::kind::file_descriptor:
            input_fd = spec.input.fd;
            break;
        case input_source::kind::inherit:
            break;
    }
    defer {
        if (close_input) close(input_fd);
    };

    unique_ptr<accounting> acct = make_accounting(limits);

    bool use_affinity = !limits.cores.empty() && !(acct && acct->has_cpuset());
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    for (int core : limits.cores) CPU_SET(core, &cpuset);

    bool set_cpu_rlimit = limits.hard_cpu_time.has_value();
    struct rlimit cpu_rlimit = {};
    if (set_cpu_rlimit) {
        // 有 cpuacct 时由监控线程负责终止进程，RLIMIT_CPU 只作为兜底
        rlim_t seconds = (rlim_t)ceil(*limits.hard_cpu_time);
        if (cgroup_support.cpuacct) seconds += 1;
        cpu_rlimit.rlim_cur = cpu_rlimit.rlim_max = seconds;
    }

    struct sigaction default_action;
    memset(&default_action, 0, sizeof(default_action));
    default_action.sa_handler = SIG_DFL;
    sigemptyset(&default_action.sa_mask);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    output_log log(spec.output_path, command_line);
    // 命令没有成功启动时日志文件中只有头部，删除它
    bool keep_log = false;
    defer {
        if (!keep_log) log.discard();
    };

    int sync_pipe[2], err_pipe[2];
    if (pipe2(sync_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(sync_pipe[0]), close(sync_pipe[1]);
        error(err, "creating pipe");
    }

    const char *work_dir = spec.work_dir.empty() ? nullptr : spec.work_dir.c_str();

    pid_t pid = fork();
    switch (pid) {
        case -1: {
            int err = errno;
            close(sync_pipe[0]), close(sync_pipe[1]);
            close(err_pipe[0]), close(err_pipe[1]);
            error(err, "unable to fork for {}", spec.command[0]);
        } break;
        case 0: {  // 子进程
            int report_fd = err_pipe[PIPE_IN];
            setpgid(0, 0);

            // 恢复默认的信号处理，父进程可能屏蔽了 SIGINT 和 SIGTERM
            for (int sig = 1; sig < NSIG; ++sig) {
                if (sig == SIGKILL || sig == SIGSTOP) continue;
                sigaction(sig, &default_action, nullptr);
            }
            sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

            // 等待父进程将我们放入 cgroup
            char go;
            ssize_t nread;
            do {
                nread = read(sync_pipe[PIPE_OUT], &go, 1);
            } while (nread < 0 && errno == EINTR);
            if (nread != 1) child_fail(report_fd, STAGE_SYNC);

            if (input_fd >= 0 && dup2(input_fd, STDIN_FILENO) < 0)
                child_fail(report_fd, STAGE_STDIN);
            if (dup2(log.fd(), STDOUT_FILENO) < 0 || dup2(log.fd(), STDERR_FILENO) < 0)
                child_fail(report_fd, STAGE_STDOUT);

            if (set_cpu_rlimit && setrlimit(RLIMIT_CPU, &cpu_rlimit) != 0)
                child_fail(report_fd, STAGE_RLIMIT);
            if (work_dir && chdir(work_dir) != 0)
                child_fail(report_fd, STAGE_CHDIR);

            execvpe(argv[0], argv.data(), envp.data());
            child_fail(report_fd, STAGE_EXEC);
        } break;
        default:
            break;
    }

    // 父进程
    close(sync_pipe[PIPE_OUT]);
    close(err_pipe[PIPE_IN]);
    // 父子进程都调用 setpgid，避免在子进程调用之前向进程组发送信号
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "setpgid for " << pid << ": " << strerror(errno);

    bool child_reaped = false;
    defer {
        close(err_pipe[PIPE_OUT]);
        if (sync_pipe[PIPE_IN] >= 0) close(sync_pipe[PIPE_IN]);
        if (!child_reaped) {
            // 出现异常时确保子进程被杀死并回收
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
            }
            scoped_lock lock(mut);
            reaped = true;
        }
    };

    // 在子进程开始运行之前绑定核心，使得 CPU 时间只统计在指定的核心上
    if (use_affinity && sched_setaffinity(pid, sizeof(cpuset), &cpuset) != 0)
        error(errno, "setting cpu affinity of process {}", pid);
    if (acct) acct->attach(pid);

    elapsed_time clock;
    {
        char go = 1;
        if (write(sync_pipe[PIPE_IN], &go, 1) != 1) error(errno, "starting child process {}", pid);
        close(sync_pipe[PIPE_IN]);
        sync_pipe[PIPE_IN] = -1;
    }

    {
        scoped_lock lock(mut);
        child_pid = pid;
        if (stopping) {
            LOG(INFO) << "run was stopped before it started";
            signal_process_group(SIGKILL);
        }
    }

    {
        spawn_failure failure;
        ssize_t nread;
        do {
            nread = read(err_pipe[PIPE_OUT], &failure, sizeof(failure));
        } while (nread < 0 && errno == EINTR);

        if (nread == sizeof(failure)) {
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
            }
            child_reaped = true;
            {
                scoped_lock lock(mut);
                reaped = true;
            }
            string message = fmt::format("{}: {}", describe_stage(failure.stage, spec), strerror(failure.err));
            LOG(WARNING) << "cannot start command: " << message;
            throw spawn_error(message);
        }
    }
    spawned = true;
    keep_log = true;
    LOG(INFO) << "started process " << pid << ": " << command_line;

    resource_monitor monitor(limits, acct.get(), [this](termination_reason r, int sig) { terminate(r, sig); });
    bool monitored = limits.hard_cpu_time || limits.soft_cpu_time || limits.wall_time || limits.memory;
    if (monitored) monitor.start(clock);

    int status = 0;
    struct rusage usage;
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "waiting for process {}", pid);
    }
    double wall_time = clock.seconds();
    child_reaped = true;
    {
        scoped_lock lock(mut);
        reaped = true;
    }
    monitor.stop();

    // 杀死进程组以及 cgroup 中残留的子孙进程
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH && errno != EPERM)
        LOG(ERROR) << "unable to kill process group " << pid << ": " << strerror(errno);
    if (acct) acct->kill_all();

    run_result result;
    result.wall_time = wall_time;
    if (acct && cgroup_support.cpuacct) {
        result.cpu_time = acct->cpu_time();
        result.cpu_time_per_core = acct->cpu_time_per_core();
    } else {
        result.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                          usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    }
    if (acct && cgroup_support.memory) {
        try {
            result.memory = acct->memory_peak();
        } catch (cgroup_exception &ex) {
            LOG(WARNING) << "unable to read memory usage of process " << pid << ": " << ex.what();
        }
    }

    if (elevation) {
        result.exit = elevation->translate(status);
        if (!result.exit.signal) result.return_value = result.exit.value;
    } else {
        result.exit = exit_status::from_raw(status);
    }

    {
        scoped_lock lock(mut);
        result.reason = reason;

        // 进程在被杀死之前已经自行退出
        if (result.reason && *result.reason != termination_reason::cputime_soft && !result.exit.signal) {
            LOG(INFO) << "process " << pid << " exited before " << to_string(*result.reason) << " was enforced";
            result.reason.reset();
        }
        // 内存耗尽时进程可能在监控线程发现之前就被杀死了
        if (!result.reason && limits.memory && result.exit.signal == SIGKILL && acct && acct->memory_exhausted())
            result.reason = termination_reason::memory;

        current_state = (result.reason || result.exit.signal) ? run_state::terminated : run_state::exited_normally;
    }

    LOG(INFO) << fmt::format("process {} finished: {}, walltime {:.3f}s, cputime {:.3f}s{}",
                             pid, to_string(result.exit), result.wall_time, result.cpu_time,
                             result.reason ? ", terminated because of " + to_string(*result.reason) : "");

    log.finalize(spec.max_output_size);
    return result;
}

}  // namespace runexec
