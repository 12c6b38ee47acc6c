#include "elevation.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"

namespace runexec {
using namespace std;

privilege_elevation::privilege_elevation(const string &user) : username(user) {
    if (resolve_user(user) < 0)
        throw configuration_error(fmt::format("Unknown user {}.", user));

    int exitcode = call_process("sudo", "--non-interactive", "-u", user, "true");
    if (exitcode != 0)
        throw configuration_error(fmt::format("Cannot execute benchmark as user {}, "
                                              "please fix your sudo setup to allow this without password "
                                              "(sudo exited with {}).",
                                              user, exitcode));
    LOG(INFO) << "running commands as user " << user;
}

const string &privilege_elevation::user() const {
    return username;
}

vector<string> privilege_elevation::wrap(const vector<string> &command, const map<string, string> &environment) const {
    vector<string> result = {"sudo", "--non-interactive", "-u", username, "--"};
    if (!environment.empty()) {
        result.push_back("env");
        for (auto &[key, value] : environment)
            result.push_back(key + "=" + value);
    }
    result.insert(result.end(), command.begin(), command.end());
    return result;
}

bool privilege_elevation::kill(int pgid, int signal) const {
    // kill 返回 1 可能是进程组已经结束了
    int exitcode = call_process("sudo", "--non-interactive", "-u", username,
                                "kill", "-s", std::to_string(signal), "--", "-" + std::to_string(pgid));
    if (exitcode != 0)
        LOG(WARNING) << "sudo kill -s " << signal << " -- -" << pgid << " exited with " << exitcode;
    return exitcode == 0 || exitcode == 1;
}

exit_status privilege_elevation::translate(int raw) const {
    return exit_status::from_elevated_raw(raw);
}

}  // namespace runexec
