#include "resource_monitor.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <algorithm>
#include <chrono>
#include "common/utils.hpp"
#include "config.hpp"

namespace runexec {
using namespace std;

resource_monitor::resource_monitor(const resource_limits &limits, accounting *acct, limit_callback on_limit)
    : hard_cpu_time(limits.hard_cpu_time),
      soft_cpu_time(limits.soft_cpu_time),
      wall_time(limits.wall_time),
      limit_memory(limits.memory.has_value()),
      acct(acct),
      on_limit(move(on_limit)) {
    if (!wall_time && (hard_cpu_time || soft_cpu_time)) {
        wall_time = max(hard_cpu_time.value_or(0), soft_cpu_time.value_or(0)) + WALLTIME_BACKSTOP_OVERHEAD;
    }

    cpu_count = limits.cores.empty() ? thread::hardware_concurrency() : limits.cores.size();
    if (cpu_count == 0) cpu_count = 1;
}

resource_monitor::~resource_monitor() {
    stop();
}

optional<double> resource_monitor::wall_time_limit() const {
    return wall_time;
}

void resource_monitor::start(const elapsed_time &since) {
    clock = since;
    thd = thread([this] { run(); });
}

void resource_monitor::stop() {
    {
        scoped_lock lock(mut);
        finished = true;
    }
    cond.notify_all();
    if (thd.joinable()) thd.join();
}

void resource_monitor::run() {
    try {
        watch();
    } catch (exception &ex) {
        LOG(ERROR) << "unable to sample resource usage, killing process group: " << ex.what();
        try {
            on_limit(termination_reason::killed, SIGKILL);
        } catch (exception &kill_ex) {
            LOG(ERROR) << "unable to kill process group: " << kill_ex.what();
        }
    }
}

void resource_monitor::watch() {
    bool soft_limit_fired = false;

    while (true) {
        double used_wall_time = clock.seconds();
        double used_cpu_time = acct ? acct->cpu_time() : 0;

        if (soft_cpu_time && !soft_limit_fired && used_cpu_time >= *soft_cpu_time) {
            LOG(WARNING) << "soft cpu time limit exceeded (" << used_cpu_time << "s), sending SIGTERM";
            on_limit(termination_reason::cputime_soft, SIGTERM);
            soft_limit_fired = true;
        }
        if (hard_cpu_time && used_cpu_time >= *hard_cpu_time) {
            LOG(WARNING) << "hard cpu time limit exceeded (" << used_cpu_time << "s), sending SIGKILL";
            on_limit(termination_reason::cputime, SIGKILL);
            break;
        }
        if (wall_time && used_wall_time >= *wall_time) {
            LOG(WARNING) << "wall time limit exceeded (" << used_wall_time << "s), sending SIGKILL";
            on_limit(termination_reason::walltime, SIGKILL);
            break;
        }
        if (limit_memory && acct && acct->memory_exhausted()) {
            LOG(WARNING) << "memory limit exceeded, sending SIGKILL";
            on_limit(termination_reason::memory, SIGKILL);
            break;
        }

        // CPU 时间最快按 cpu_count 倍的速度增长
        double remaining = MONITOR_MAX_INTERVAL;
        if (hard_cpu_time)
            remaining = min(remaining, (*hard_cpu_time - used_cpu_time) / cpu_count);
        if (soft_cpu_time && !soft_limit_fired)
            remaining = min(remaining, (*soft_cpu_time - used_cpu_time) / cpu_count);
        if (wall_time)
            remaining = min(remaining, *wall_time - used_wall_time);
        remaining = max(remaining, MONITOR_MIN_INTERVAL);

        unique_lock lock(mut);
        if (cond.wait_for(lock, chrono::duration<double>(remaining), [this] { return finished; }))
            break;
    }
}

}  // namespace runexec
