#include "run_spec.hpp"
#include <fmt/core.h>

namespace runexec {
using namespace std;

string to_string(termination_reason reason) {
    switch (reason) {
        case termination_reason::cputime:
            return "cputime";
        case termination_reason::cputime_soft:
            return "cputime-soft";
        case termination_reason::walltime:
            return "walltime";
        case termination_reason::memory:
            return "memory";
        case termination_reason::killed:
            return "killed";
    }
    return "unknown";
}

optional<termination_reason> parse_termination_reason(const string &text) {
    for (auto reason : {termination_reason::cputime, termination_reason::cputime_soft,
                        termination_reason::walltime, termination_reason::memory,
                        termination_reason::killed})
        if (to_string(reason) == text) return reason;
    return {};
}

input_source input_source::null_device() {
    return input_source();
}

input_source input_source::from_fd(int fd) {
    input_source input;
    input.type = kind::file_descriptor;
    input.fd = fd;
    return input;
}

input_source input_source::from_file(const filesystem::path &path) {
    input_source input;
    input.type = kind::file;
    input.path = path;
    return input;
}

input_source input_source::inherit() {
    input_source input;
    input.type = kind::inherit;
    return input;
}

map<string, string> run_result::to_map() const {
    map<string, string> result;
    result["walltime"] = fmt::format("{:.9f}", wall_time);
    result["cputime"] = fmt::format("{:.9f}", cpu_time);
    if (memory) result["memory"] = std::to_string(*memory);
    result["exitcode"] = std::to_string(exit.raw);
    if (reason) result["terminationreason"] = to_string(*reason);
    if (return_value) result["returnvalue"] = std::to_string(*return_value);
    for (auto &[core, time] : cpu_time_per_core)
        result[fmt::format("cputime-cpu{}", core)] = fmt::format("{:.9f}", time);
    return result;
}

}  // namespace runexec
