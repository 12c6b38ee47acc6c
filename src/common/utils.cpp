#include "common/utils.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <csignal>

extern char **environ;

namespace runexec {
using namespace std;

vector<string> make_environment(const map<string, string> &overrides) {
    map<string, string> merged;
    for (char **entry = environ; entry && *entry; ++entry) {
        string kv(*entry);
        auto idx = kv.find('=');
        if (idx == string::npos) continue;
        merged[kv.substr(0, idx)] = kv.substr(idx + 1);
    }
    for (auto &[key, value] : overrides)
        merged[key] = value;

    vector<string> result;
    for (auto &[key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

vector<char *> make_argv(vector<string> &list) {
    vector<char *> argv;
    for (auto &arg : list) argv.push_back(arg.data());
    argv.push_back(nullptr);
    return argv;
}

int exec_program(const map<string, string> &env, vector<string> args) {
    vector<string> envs = make_environment(env);
    vector<char *> argv = make_argv(args), envp = make_argv(envs);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            error(errno, "unable to fork for {}", args[0]);
            break;
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            execvpe(argv[0], argv.data(), envp.data());
            _exit(EXIT_FAILURE);
        default: {  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) error(errno, "waiting for {}", args[0]);
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
        }
    }
    return -1;
}

string join_command_line(const vector<string> &args) {
    return boost::algorithm::join(args, " ");
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace runexec
