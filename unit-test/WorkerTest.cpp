#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace runexec;

/**
 * @brief 记录运行结果的调度单元
 */
struct test_run_unit : public run_unit {
    test_run_unit(vector<string> command, path log, string id)
        : command(move(command)), log(move(log)), id(move(id)) {}

    vector<string> command_line() const override { return command; }
    path log_file() const override { return log; }
    string identifier() const override { return id; }

    void set_result(const run_result &r) override {
        scoped_lock lock(mut);
        ++result_count;
        result = r;
    }

    int results() {
        scoped_lock lock(mut);
        return result_count;
    }

    vector<string> command;
    path log;
    string id;

    mutex mut;
    int result_count = 0;
    run_result result;
};

/**
 * @brief 在 worker 取出命令行的时候中断整个运行
 * 此时 worker 已经检查过中断标志，但是 execute_run 还没有开始
 */
struct cancelling_run_unit : public test_run_unit {
    cancelling_run_unit(vector<string> command, path log, string id, cancellation_token &token)
        : test_run_unit(move(command), move(log), move(id)), token(token) {}

    vector<string> command_line() const override {
        token.cancel();
        return command;
    }

    cancellation_token &token;
};

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = temp_directory_path() / ("runexec_worker_" + to_string(getpid()));
        create_directories(dir);
    }

    void TearDown() override {
        remove_all(dir);
    }

    shared_ptr<test_run_unit> make_unit(const vector<string> &command, const string &id) {
        return make_shared<test_run_unit>(command, dir / (id + ".log"), id);
    }

    path dir;
};

TEST_F(WorkerTest, RunAllUnits) {
    vector<shared_ptr<test_run_unit>> units;
    vector<shared_ptr<run_unit>> queue;
    for (int i = 0; i < 6; ++i) {
        units.push_back(make_unit({"echo", "run" + to_string(i)}, "run" + to_string(i)));
        queue.push_back(units.back());
    }

    benchmark_options options;
    options.threads = 3;
    cancellation_token token;
    EXPECT_TRUE(execute_runs(queue, options, token));

    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(units[i]->results(), 1);
        EXPECT_EQ(units[i]->result.exit.raw, 0);
        string content = read_file_content(units[i]->log);
        EXPECT_NE(content.find("\nrun" + to_string(i) + "\n"), string::npos);
    }
}

TEST_F(WorkerTest, FailedUnitDoesNotStopOthers) {
    auto missing = make_unit({"/nonexistent/runexec-missing"}, "missing");
    auto good = make_unit({"true"}, "good");

    benchmark_options options;
    cancellation_token token;
    EXPECT_TRUE(execute_runs({missing, good}, options, token));

    EXPECT_EQ(missing->results(), 0);
    EXPECT_FALSE(exists(missing->log));
    EXPECT_EQ(good->results(), 1);
}

TEST_F(WorkerTest, CancelStopsRuns) {
    vector<shared_ptr<test_run_unit>> units;
    vector<shared_ptr<run_unit>> queue;
    for (int i = 0; i < 4; ++i) {
        units.push_back(make_unit({"sleep", "10"}, "sleep" + to_string(i)));
        queue.push_back(units.back());
    }

    benchmark_options options;
    options.threads = 2;
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::seconds(1));
        token.cancel();
    });

    auto start = chrono::steady_clock::now();
    EXPECT_FALSE(execute_runs(queue, options, token));
    canceller.join();
    EXPECT_LT(chrono::duration<double>(chrono::steady_clock::now() - start).count(), 5);

    for (auto &unit : units) {
        EXPECT_EQ(unit->results(), 0);
        EXPECT_FALSE(exists(unit->log));
    }
}

TEST_F(WorkerTest, CancelBeforeRunStarts) {
    cancellation_token token;
    auto unit = make_shared<cancelling_run_unit>(vector<string>{"sleep", "10"}, dir / "late.log", "late", token);

    auto start = chrono::steady_clock::now();
    EXPECT_FALSE(execute_runs({unit}, benchmark_options(), token));
    EXPECT_LT(chrono::duration<double>(chrono::steady_clock::now() - start).count(), 5);

    EXPECT_EQ(unit->results(), 0);
    EXPECT_FALSE(exists(unit->log));
}

TEST_F(WorkerTest, CancelledLogIsKeptInDebugMode) {
    auto unit = make_unit({"sleep", "10"}, "debug");

    benchmark_options options;
    options.debug = true;
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(500));
        token.cancel();
    });
    EXPECT_FALSE(execute_runs({unit}, options, token));
    canceller.join();

    EXPECT_EQ(unit->results(), 0);
    EXPECT_FALSE(exists(unit->log));
    EXPECT_TRUE(exists(dir / "debug.log.killed"));
}

TEST_F(WorkerTest, CancellationToken) {
    cancellation_token token;
    atomic<int> calls{0};
    size_t id = token.subscribe([&] { ++calls; });
    size_t removed = token.subscribe([&] { calls += 100; });
    token.unsubscribe(removed);
    EXPECT_NE(id, removed);
    EXPECT_FALSE(token.cancelled());

    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(calls.load(), 1);

    // 已经中断后注册的回调立即执行
    token.subscribe([&] { calls += 10; });
    EXPECT_EQ(calls.load(), 11);
}

TEST_F(WorkerTest, AssignCores) {
    auto cores = assign_cores(2, 2, 4);
    ASSERT_EQ(cores.size(), 2u);
    EXPECT_EQ(cores[0], vector<int>({0, 1}));
    EXPECT_EQ(cores[1], vector<int>({2, 3}));

    EXPECT_TRUE(assign_cores(3, 0, 1)[2].empty());
    EXPECT_THROW(assign_cores(3, 2, 4), configuration_error);
}
