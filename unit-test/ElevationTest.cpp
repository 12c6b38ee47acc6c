#include <signal.h>
#include <unistd.h>
#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "config.hpp"
#include "elevation.hpp"
#include "gtest/gtest.h"
#include "run_executor.hpp"

using namespace std;
using namespace std::filesystem;
using namespace runexec;

TEST(ElevationTest, UnknownUser) {
    EXPECT_THROW(privilege_elevation("runexec-no-such-user"), configuration_error);
    EXPECT_THROW({ run_executor executor(string("runexec-no-such-user")); }, configuration_error);
}

TEST(ElevationTest, ResolveUser) {
    EXPECT_EQ(resolve_user("root"), 0);
    EXPECT_EQ(resolve_user("#0"), 0);
    EXPECT_EQ(resolve_user("#abc"), -1);
    EXPECT_EQ(resolve_user("runexec-no-such-user"), -1);
}

/**
 * @brief 通过 sudo 以当前用户的身份运行命令
 * 需要 sudo 可以免密码执行，否则跳过这些测试
 */
class RunExecutorWithSudoTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = temp_directory_path() / ("runexec_sudo_" + to_string(getpid()) + ".log");
        user = "#" + to_string(getuid());
        try {
            elevation = make_unique<privilege_elevation>(user);
        } catch (configuration_error &ex) {
            GTEST_SKIP() << ex.what();
        }
    }

    void TearDown() override {
        remove(log);
    }

    run_spec make_spec(const vector<string> &command) {
        run_spec spec;
        spec.command = command;
        spec.output_path = log;
        return spec;
    }

    path log;
    string user;
    unique_ptr<privilege_elevation> elevation;
};

TEST_F(RunExecutorWithSudoTest, WrapCommand) {
    auto wrapped = elevation->wrap({"echo", "hi"}, {{"A", "1"}});
    vector<string> expected = {"sudo", "--non-interactive", "-u", user, "--", "env", "A=1", "echo", "hi"};
    EXPECT_EQ(wrapped, expected);

    auto plain = elevation->wrap({"true"}, {});
    EXPECT_EQ(plain.back(), "true");
    EXPECT_EQ(plain[plain.size() - 2], "--");
}

TEST_F(RunExecutorWithSudoTest, SimpleCommand) {
    run_executor executor(user);
    run_result result = executor.execute_run(make_spec({"echo", "TEST_TOKEN"}));

    EXPECT_EQ(result.exit.raw, 0);
    EXPECT_EQ(result.return_value, 0);
    EXPECT_FALSE(result.reason);

    string content = read_file_content(log);
    EXPECT_EQ(content.substr(0, content.find('\n')), "sudo --non-interactive -u " + user + " -- echo TEST_TOKEN");
    EXPECT_NE(content.find("TEST_TOKEN\n", content.find('\n')), string::npos);
}

TEST_F(RunExecutorWithSudoTest, ExitValueIsTargetStatus) {
    // sudo 的返回值被解释为目标进程的状态，返回值 15 表示目标进程被 SIGTERM 终止
    run_executor executor(user);
    run_result result = executor.execute_run(make_spec({"sh", "-c", "exit 15"}));

    EXPECT_EQ(result.exit.raw, SIGTERM << 8);
    EXPECT_EQ(result.exit.signal, SIGTERM);
    EXPECT_FALSE(result.return_value);
    EXPECT_EQ(result.to_map()["exitcode"], std::to_string(SIGTERM << 8));
}

TEST_F(RunExecutorWithSudoTest, Environment) {
    run_executor executor(user);
    run_spec spec = make_spec({"sh", "-c", "echo $RUNEXEC_TEST_VALUE"});
    spec.environment["RUNEXEC_TEST_VALUE"] = "TEST_TOKEN";
    run_result result = executor.execute_run(spec);

    EXPECT_EQ(result.exit.raw, 0);
    EXPECT_NE(read_file_content(log).find("\nTEST_TOKEN\n"), string::npos);
}

TEST_F(RunExecutorWithSudoTest, Stop) {
    run_executor executor(user);
    thread stopper([&] {
        this_thread::sleep_for(chrono::seconds(1));
        executor.stop();
    });
    run_result result = executor.execute_run(make_spec({"sleep", "10"}));
    stopper.join();

    EXPECT_EQ(result.reason, termination_reason::killed);
    EXPECT_TRUE(result.exit.signal);
    EXPECT_LT(result.wall_time, 5);
}
