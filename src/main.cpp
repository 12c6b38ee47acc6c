#include <glog/logging.h>
#include <signal.h>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options/errors.hpp>
#include <iostream>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "options.hpp"
#include "run_executor.hpp"

using namespace std;
using namespace runexec;

enum exit_code {
    EXIT_OK = 0,
    EXIT_INVALID_OPTIONS = 1,
    EXIT_CONFIGURATION_ERROR = 2,
    EXIT_SPAWN_ERROR = 3,
    EXIT_INTERNAL_ERROR = 4
};

/**
 * @brief 在独立的线程中等待 SIGINT 和 SIGTERM，收到信号时终止正在运行的命令
 * 信号在所有线程中都被屏蔽，因此 run_executor::stop() 不会在信号处理函数中被调用
 */
static void signal_loop(sigset_t sigs, run_executor &executor, atomic<bool> &interrupted) {
    while (true) {
        int sig;
        if (sigwait(&sigs, &sig) != 0) continue;
        if (sig == SIGUSR1) break;  // execute_run 已经结束
        LOG(WARNING) << "received signal " << sig << ", killing the command";
        interrupted = true;
        executor.stop();
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    runexec_options opt;
    try {
        opt = parse_options(argc, argv);
    } catch (boost::program_options::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << "Usage: " << argv[0] << " [options] -- command [args...]" << endl;
        return EXIT_INVALID_OPTIONS;
    }

    if (opt.help) {
        cout << "runexec: execute a command once, enforce resource limits and measure its resource usage." << endl
             << "Usage: " << argv[0] << " [options] -- command [args...]" << endl
             << opt.usage << endl;
        return EXIT_OK;
    }

    if (opt.version) {
        cout << "runexec" << endl;
        return EXIT_OK;
    }

    CGROUP_PREFIX = get_env("RUNEXEC_CGROUP_PREFIX", CGROUP_PREFIX);
    DEBUG = opt.debug || !get_env("DEBUG", "").empty();
    if (DEBUG) FLAGS_alsologtostderr = true;

    // 必须在创建任何线程之前屏蔽信号，这样所有的线程都会继承信号屏蔽字
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    sigaddset(&sigs, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    try {
        run_executor executor(opt.user);

        atomic<bool> interrupted{false};
        thread signal_thread(signal_loop, sigs, ref(executor), ref(interrupted));
        defer {
            pthread_kill(signal_thread.native_handle(), SIGUSR1);
            signal_thread.join();
        };
        run_result result = executor.execute_run(opt.spec, [&interrupted] { return interrupted.load(); });

        // std::map 保证按键排序
        for (auto &[key, value] : result.to_map())
            cout << key << "=" << value << endl;
        return EXIT_OK;
    } catch (configuration_error &ex) {
        cerr << ex.what() << endl;
        return EXIT_CONFIGURATION_ERROR;
    } catch (spawn_error &ex) {
        cerr << ex.what() << endl;
        return EXIT_SPAWN_ERROR;
    } catch (std::exception &ex) {
        LOG(ERROR) << "runexec failed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_INTERNAL_ERROR;
    }
}
