#include "cgroup.hpp"

#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>

namespace runexec {
using namespace std;

cgroup_exception::cgroup_exception(std::string cgroup_op, int err) {
    if (err == ECGOTHER) {
        errmsg += "libcgroup: ";
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(cgroup_get_last_errno());
    } else {
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(err);
    }
}

const char *cgroup_exception::what() const noexcept {
    return errmsg.c_str();
}

void cgroup_exception::ensure(std::string cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    cgroup_exception::ensure(
        "cgroup_init",
        cgroup_init());
}

void cgroup_ctrl::add_value(const std::string &name, int64_t value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

void cgroup_ctrl::add_value(const std::string &name, const string &value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_string({}, {})", name, value),
        cgroup_add_value_string(ctrl, name.c_str(), value.c_str()));
}

int64_t cgroup_ctrl::get_value_int64(const std::string &name) {
    int64_t value;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

string cgroup_ctrl::get_value_string(const std::string &name) {
    char *value = nullptr;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_string({})", name),
        cgroup_get_value_string(ctrl, name.c_str(), &value));
    string result(value ? value : "");
    free(value);
    return result;
}

cgroup_guard::cgroup_guard(const std::string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_exception::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const std::string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

cgroup_ctrl cgroup_guard::get_controller(const std::string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::attach_task(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

void cgroup_guard::delete_cgroup() {
    cgroup_exception::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

vector<pid_t> cgroup_guard::tasks(const std::string &cgroup_name, const std::string &controller) {
    vector<pid_t> result;
    void *handle = nullptr;
    pid_t pid;

    int ret = cgroup_get_task_begin(cgroup_name.c_str(), controller.c_str(), &handle, &pid);
    while (ret == 0) {
        result.push_back(pid);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    if (ret != ECGEOF)
        throw cgroup_exception(fmt::format("cgroup_get_task({})", cgroup_name), ret);
    return result;
}

optional<string> cgroup_guard::mount_point(const std::string &controller) {
    char *mount = nullptr;
    if (cgroup_get_subsys_mount_point(controller.c_str(), &mount) != 0 || !mount)
        return {};
    string result(mount);
    free(mount);
    return result;
}

string cgroup_guard::current_path(const std::string &controller) {
    char *path = nullptr;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_current_controller_path({})", controller),
        cgroup_get_current_controller_path(getpid(), controller.c_str(), &path));
    string result(path ? path : "/");
    free(path);
    return result;
}

}  // namespace runexec
