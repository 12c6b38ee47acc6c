#include "exit_status.hpp"
#include <fmt/core.h>
#include <string.h>
#include <sys/wait.h>
#include "common/exceptions.hpp"

namespace runexec {
using namespace std;

static const int SIGNAL_MASK = 0x7F;
static const int CORE_DUMP_FLAG = 0x80;
static const int VALUE_MASK = 0x7F;

exit_status exit_status::from_raw(int raw) {
    exit_status status;
    status.raw = raw;
    if (WIFEXITED(raw)) {
        status.value = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.signal = WTERMSIG(raw);
        status.core_dumped = WCOREDUMP(raw);
    } else if (WIFSTOPPED(raw)) {
        status.signal = WSTOPSIG(raw);
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", raw));
    }
    return status;
}

exit_status exit_status::from_elevated_raw(int raw) {
    if ((raw & SIGNAL_MASK) != 0)
        return from_raw(raw);

    // 提权工具自身正常退出，它的返回值其实是目标进程的状态：第 0-6 位是信号，第 8-14 位是返回值
    int target = raw >> 8;
    exit_status status;
    status.raw = raw;
    int signal = target & SIGNAL_MASK;
    if (signal) status.signal = signal;
    status.value = (target >> 8) & VALUE_MASK;
    return status;
}

int exit_status::encode_elevated(int value, int signal) {
    return (((value & VALUE_MASK) << 8) | (signal & SIGNAL_MASK)) << 8;
}

exit_status exit_status::exited(int value) {
    exit_status status;
    status.value = value;
    status.raw = status.to_raw();
    return status;
}

exit_status exit_status::signaled(int signal, bool core_dumped) {
    exit_status status;
    status.signal = signal;
    status.core_dumped = core_dumped;
    status.raw = status.to_raw();
    return status;
}

int exit_status::to_raw() const {
    if (signal)
        return (*signal & SIGNAL_MASK) | (core_dumped ? CORE_DUMP_FLAG : 0);
    return (value & 0xFF) << 8;
}

bool exit_status::operator==(const exit_status &other) const {
    return value == other.value && signal == other.signal && core_dumped == other.core_dumped;
}

bool exit_status::operator!=(const exit_status &other) const {
    return !(*this == other);
}

string to_string(const exit_status &status) {
    if (status.signal)
        return fmt::format("signal {} ({}){}", *status.signal, strsignal(*status.signal),
                           status.core_dumped ? ", core dumped" : "");
    return fmt::format("exit value {}", status.value);
}

}  // namespace runexec
