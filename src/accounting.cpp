#include "accounting.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <sstream>
#include "cgroup.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace runexec {
using namespace std;
namespace fs = std::filesystem;

static const struct timespec killdelay = {0, 20000000L};  // 0.02s
static const int KILL_ATTEMPTS = 50;

static atomic<unsigned> cgroup_counter{0};

static bool controller_usable(const string &controller) {
    auto mount = cgroup_guard::mount_point(controller);
    if (!mount) {
        LOG(INFO) << "cgroup controller " << controller << " is not mounted";
        return false;
    }
    string current;
    try {
        current = cgroup_guard::current_path(controller);
    } catch (cgroup_exception &ex) {
        LOG(WARNING) << "cannot determine current cgroup of " << controller << ": " << ex.what();
        return false;
    }
    fs::path dir = fs::path(*mount) / fs::path(current).relative_path();
    if (access(dir.c_str(), W_OK) != 0) {
        LOG(INFO) << "cgroup " << dir.string() << " is not writable, " << controller << " unavailable";
        return false;
    }
    return true;
}

const accounting_support &accounting_support::probe() {
    static const accounting_support support = [] {
        accounting_support result;
        try {
            cgroup_guard::init();
        } catch (cgroup_exception &ex) {
            LOG(WARNING) << "cgroups are not available: " << ex.what();
            return result;
        }
        result.cpuacct = controller_usable("cpuacct");
        result.memory = controller_usable("memory");
        result.cpuset = controller_usable("cpuset");
        LOG(INFO) << "cgroup support: cpuacct=" << result.cpuacct
                  << " memory=" << result.memory
                  << " cpuset=" << result.cpuset;
        return result;
    }();
    return support;
}

cgroup_accounting::cgroup_accounting(const accounting_support &support, const resource_limits &limits) {
    name = fmt::format("{}_{}_{}", CGROUP_PREFIX, getpid(), cgroup_counter++);

    vector<string> controllers;
    if (support.cpuacct) controllers.push_back("cpuacct");
    if (support.memory) controllers.push_back("memory");
    // cpuset 必须设置了 cpuset.cpus 才能移入进程，因此只在指定了核心时创建
    if (support.cpuset && !limits.cores.empty()) controllers.push_back("cpuset");

    for (auto &controller : controllers) {
        fs::path current = cgroup_guard::current_path(controller);
        cgroups[controller] = (current / name).string();
        mounts[controller] = *cgroup_guard::mount_point(controller);
    }

    try {
        for (auto &controller : controllers) {
            cgroup_guard cg(cgroups[controller]);
            cgroup_ctrl ctrl = cg.add_controller(controller);

            if (controller == "memory" && limits.memory) {
                // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
                ctrl.add_value("memory.limit_in_bytes", *limits.memory);
                fs::path parent = fs::path(mounts[controller]) / fs::path(cgroups[controller]).parent_path().relative_path();
                if (fs::exists(parent / "memory.memsw.limit_in_bytes"))
                    ctrl.add_value("memory.memsw.limit_in_bytes", *limits.memory);
                else
                    LOG(WARNING) << "swap accounting is not enabled, memory limit does not include swap";
                // 关闭 OOM killer，内存耗尽时进程会被挂起，由资源监控线程杀死并记录原因
                ctrl.add_value("memory.oom_control", (int64_t)1);
            }

            if (controller == "cpuset") {
                vector<string> cores;
                for (int core : limits.cores) cores.push_back(std::to_string(core));
                fs::path parent = fs::path(mounts[controller]) / fs::path(cgroups[controller]).parent_path().relative_path();
                string mems = boost::algorithm::trim_copy(read_file_content(parent / "cpuset.mems", "0"));
                ctrl.add_value("cpuset.mems", mems.empty() ? "0" : mems);
                ctrl.add_value("cpuset.cpus", boost::algorithm::join(cores, ","));
            }

            cg.create_cgroup(1);
            LOG(INFO) << "created cgroup " << cgroups[controller] << " for " << controller;
        }
    } catch (...) {
        // 构造失败时析构函数不会被调用，需要删除已经创建的 cgroup
        for (auto &[controller, path] : cgroups) {
            try {
                cgroup_guard cg(path);
                cg.add_controller(controller);
                cg.delete_cgroup();
            } catch (cgroup_exception &ex) {
                LOG(ERROR) << "unable to remove cgroup " << path << ": " << ex.what();
            }
        }
        throw;
    }
}

cgroup_accounting::~cgroup_accounting() {
    kill_all();
    for (auto &[controller, path] : cgroups) {
        try {
            cgroup_guard cg(path);
            cg.add_controller(controller);
            cg.delete_cgroup();
        } catch (cgroup_exception &ex) {
            LOG(ERROR) << "unable to remove cgroup " << path << ": " << ex.what();
        }
    }
}

void cgroup_accounting::attach(pid_t pid) {
    for (auto &[controller, path] : cgroups) {
        cgroup_guard cg(path);
        cg.get_cgroup();  // prepare for attach
        cg.attach_task(pid);
    }
}

void cgroup_accounting::kill_all() {
    if (cgroups.empty()) return;
    auto &[controller, path] = *cgroups.begin();

    for (int attempt = 0; attempt < KILL_ATTEMPTS; ++attempt) {
        vector<pid_t> pids;
        try {
            pids = cgroup_guard::tasks(path, controller);
        } catch (cgroup_exception &ex) {
            LOG(ERROR) << "unable to list tasks of cgroup " << path << ": " << ex.what();
            return;
        }
        if (pids.empty()) return;

        for (pid_t pid : pids) {
            LOG(INFO) << "killing process " << pid << " left in cgroup " << path;
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "unable to kill process " << pid << ": " << strerror(errno);
        }
        nanosleep(&killdelay, nullptr);
    }
    LOG(ERROR) << "processes are still alive in cgroup " << path;
}

static map<int, double> cpu_time_per_core_from(const string &usage_percpu) {
    map<int, double> result;
    istringstream in(usage_percpu);
    int64_t usage;
    for (int core = 0; in >> usage; ++core)
        if (usage > 0) result[core] = usage / 1e9;
    return result;
}

string cgroup_accounting::read_value(const string &controller, const string &file) const {
    fs::path path = fs::path(mounts.at(controller)) / fs::path(cgroups.at(controller)).relative_path() / file;
    return read_file_content(path);
}

double cgroup_accounting::cpu_time() {
    if (!cgroups.count("cpuacct")) return 0;
    string usage = boost::algorithm::trim_copy(read_value("cpuacct", "cpuacct.usage"));
    if (usage.empty()) return 0;
    return boost::lexical_cast<int64_t>(usage) / 1e9;  // in ns
}

map<int, double> cgroup_accounting::cpu_time_per_core() {
    if (!cgroups.count("cpuacct")) return {};
    cgroup_guard guard(cgroups.at("cpuacct"));
    guard.get_cgroup();  // prepare for get_controller
    cgroup_ctrl ctrl = guard.get_controller("cpuacct");
    return cpu_time_per_core_from(ctrl.get_value_string("cpuacct.usage_percpu"));
}

optional<int64_t> cgroup_accounting::memory_peak() {
    if (!cgroups.count("memory")) return {};
    cgroup_guard guard(cgroups.at("memory"));
    guard.get_cgroup();  // prepare for get_controller
    cgroup_ctrl ctrl = guard.get_controller("memory");
    try {
        return ctrl.get_value_int64("memory.memsw.max_usage_in_bytes");
    } catch (cgroup_exception &) {
        // 没有开启 swap accounting
        return ctrl.get_value_int64("memory.max_usage_in_bytes");
    }
}

bool cgroup_accounting::memory_exhausted() {
    if (!cgroups.count("memory")) return false;
    istringstream fin(read_value("memory", "memory.oom_control"));
    string token;
    while (fin >> token) {
        int64_t value;
        if (!(fin >> value)) break;
        if (token == "under_oom" && value > 0) return true;
        if (token == "oom_kill" && value > 0) return true;
    }
    return false;
}

bool cgroup_accounting::has_cpuset() const {
    return cgroups.count("cpuset") > 0;
}

}  // namespace runexec
