#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "run_executor.hpp"

namespace runexec {
using namespace std;

void cancellation_token::cancel() {
    map<size_t, callback> to_call;
    {
        scoped_lock lock(mut);
        if (is_cancelled) return;
        is_cancelled = true;
        to_call = callbacks;
    }
    // 回调中可能会调用 unsubscribe，因此不能持有锁
    for (auto &[id, cb] : to_call) cb();
}

bool cancellation_token::cancelled() const {
    scoped_lock lock(mut);
    return is_cancelled;
}

size_t cancellation_token::subscribe(callback cb) {
    size_t id;
    {
        scoped_lock lock(mut);
        id = next_id++;
        if (!is_cancelled) {
            callbacks[id] = move(cb);
            return id;
        }
    }
    cb();
    return id;
}

void cancellation_token::unsubscribe(size_t id) {
    scoped_lock lock(mut);
    callbacks.erase(id);
}

vector<vector<int>> assign_cores(unsigned threads, unsigned cores_per_run, unsigned cpu_count) {
    vector<vector<int>> result(threads);
    if (cores_per_run == 0) return result;
    if ((size_t)threads * cores_per_run > cpu_count)
        throw configuration_error(fmt::format("Cannot run {} runs in parallel with {} cores each, this machine has only {} cores.",
                                              threads, cores_per_run, cpu_count));
    for (unsigned i = 0; i < threads; ++i)
        for (unsigned j = 0; j < cores_per_run; ++j)
            result[i].push_back(i * cores_per_run + j);
    return result;
}

void abandon_log(const filesystem::path &log_file, bool debug) {
    error_code ec;
    if (debug) {
        filesystem::path killed = log_file;
        killed += ".killed";
        filesystem::rename(log_file, killed, ec);
        if (ec) LOG(ERROR) << "unable to rename log file " << log_file << ": " << ec.message();
    } else {
        filesystem::remove(log_file, ec);
        if (ec) LOG(ERROR) << "unable to remove log file " << log_file << ": " << ec.message();
    }
}

/**
 * @brief worker 线程函数
 * 从队列中取出调度单元并运行，直到队列为空或者被中断
 */
static void worker_loop(size_t worker_id, run_executor &executor, const vector<int> &cores,
                        concurrent_queue<shared_ptr<run_unit>> &queue,
                        const benchmark_options &options, cancellation_token &token) {
    while (!token.cancelled()) {
        shared_ptr<run_unit> unit;
        // 队列在 worker 启动前就已经填满，为空时说明已经没有任务了
        if (!queue.try_pop(unit)) break;

        size_t subscription = token.subscribe([&executor] { executor.stop(); });
        defer {
            token.unsubscribe(subscription);
        };
        if (token.cancelled()) break;

        run_spec spec;
        spec.command = unit->command_line();
        spec.output_path = unit->log_file();
        spec.max_output_size = options.max_log_size;
        spec.environment = options.environment;
        spec.work_dir = options.work_dir;
        spec.limits = options.limits;
        if (!cores.empty()) spec.limits.cores = cores;

        LOG(INFO) << "worker " << worker_id << " starting run " << unit->identifier();
        try {
            // cancel() 可能发生在上面的检查之后、execute_run 进入运行状态之前，此时 stop() 不起作用
            run_result result = executor.execute_run(spec, [&token] { return token.cancelled(); });
            if (token.cancelled()) {
                LOG(INFO) << "run " << unit->identifier() << " was interrupted";
                abandon_log(spec.output_path, options.debug || DEBUG);
                continue;
            }
            unit->set_result(result);
        } catch (runexec_exception &ex) {
            LOG(ERROR) << "run " << unit->identifier() << " failed: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        } catch (std::exception &ex) {
            LOG(ERROR) << "run " << unit->identifier() << " failed: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    LOG(INFO) << "worker " << worker_id << " finished";
}

bool execute_runs(const vector<shared_ptr<run_unit>> &units, const benchmark_options &options,
                  cancellation_token &token) {
    unsigned threads = max(1u, options.threads);
    vector<vector<int>> cores = assign_cores(threads, options.cores_per_run, thread::hardware_concurrency());

    // 在启动线程之前创建所有的 executor，使得配置错误在启动任何运行之前被发现
    vector<unique_ptr<run_executor>> executors;
    for (unsigned i = 0; i < threads; ++i)
        executors.push_back(make_unique<run_executor>(options.user));

    concurrent_queue<shared_ptr<run_unit>> queue;
    for (auto &unit : units) queue.push(unit);

    vector<thread> workers;
    for (unsigned i = 0; i < threads; ++i)
        workers.emplace_back(worker_loop, i, ref(*executors[i]), cref(cores[i]), ref(queue), cref(options), ref(token));
    for (auto &worker : workers) worker.join();

    return !token.cancelled();
}

}  // namespace runexec
