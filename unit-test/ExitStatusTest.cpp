#include <signal.h>
#include "exit_status.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runexec;

TEST(ExitStatusTest, DecodeNormalExit) {
    exit_status status = exit_status::from_raw(3 << 8);
    EXPECT_EQ(status.raw, 768);
    EXPECT_EQ(status.value, 3);
    EXPECT_FALSE(status.signal);
    EXPECT_FALSE(status.core_dumped);

    EXPECT_EQ(exit_status::from_raw(0), exit_status::exited(0));
}

TEST(ExitStatusTest, DecodeSignal) {
    exit_status status = exit_status::from_raw(SIGKILL);
    EXPECT_EQ(status.raw, 9);
    EXPECT_EQ(status.value, 0);
    EXPECT_EQ(status.signal, SIGKILL);
    EXPECT_FALSE(status.core_dumped);

    exit_status dumped = exit_status::from_raw(SIGSEGV | 0x80);
    EXPECT_EQ(dumped.signal, SIGSEGV);
    EXPECT_TRUE(dumped.core_dumped);
    EXPECT_EQ(dumped.to_raw(), SIGSEGV | 0x80);
}

TEST(ExitStatusTest, EncodeMatchesWaitStatus) {
    EXPECT_EQ(exit_status::exited(1).to_raw(), 256);
    EXPECT_EQ(exit_status::signaled(SIGTERM).to_raw(), 15);
    EXPECT_EQ(exit_status::exited(0).raw, 0);
}

TEST(ExitStatusTest, ElevatedSignalIsForwarded) {
    // sudo 转发了杀死目标进程的信号
    exit_status status = exit_status::from_elevated_raw(SIGKILL);
    EXPECT_EQ(status.signal, SIGKILL);
    EXPECT_EQ(status.raw, 9);
}

TEST(ExitStatusTest, ElevatedStatusIsReinterpreted) {
    // sudo 正常退出，返回值 15 表示目标进程被 SIGTERM 终止
    exit_status status = exit_status::from_elevated_raw(SIGTERM << 8);
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_EQ(status.value, 0);
    EXPECT_FALSE(status.core_dumped);
    EXPECT_EQ(status.raw, SIGTERM << 8);

    // 目标进程的 core dump 位被清除
    exit_status dumped = exit_status::from_elevated_raw((SIGSEGV | 0x80) << 8);
    EXPECT_EQ(dumped.signal, SIGSEGV);
    EXPECT_FALSE(dumped.core_dumped);

    exit_status clean = exit_status::from_elevated_raw(0);
    EXPECT_FALSE(clean.signal);
    EXPECT_EQ(clean.value, 0);
}

TEST(ExitStatusTest, EncodeElevated) {
    EXPECT_EQ(exit_status::encode_elevated(0, SIGTERM), SIGTERM << 8);
    EXPECT_EQ(exit_status::encode_elevated(1, 0), 1 << 16);
    EXPECT_EQ(exit_status::encode_elevated(0x80 | 5, 0x80 | SIGINT), ((5 << 8) | SIGINT) << 8);
}

TEST(ExitStatusTest, ElevatedRoundTrip) {
    for (int value = 0; value <= 0x7F; value += 3) {
        for (int signal = 0; signal <= 0x7F; signal += 5) {
            int raw = exit_status::encode_elevated(value, signal);
            ASSERT_EQ(raw & 0x7F, 0) << "value " << value << ", signal " << signal;

            exit_status status = exit_status::from_elevated_raw(raw);
            EXPECT_EQ(status.value, value);
            if (signal) {
                EXPECT_EQ(status.signal, signal);
            } else {
                EXPECT_FALSE(status.signal);
            }
            EXPECT_FALSE(status.core_dumped);
            EXPECT_EQ(status.raw, raw);
        }
    }
}

TEST(ExitStatusTest, UnknownStatusIsRejected) {
    // 低 7 位为 0x7F 但不是暂停状态
    EXPECT_THROW(exit_status::from_raw(0xFF), internal_error);
}

TEST(ExitStatusTest, ToString) {
    EXPECT_EQ(to_string(exit_status::exited(2)), "exit value 2");
    EXPECT_EQ(to_string(exit_status::signaled(SIGKILL)).substr(0, 8), "signal 9");
}
