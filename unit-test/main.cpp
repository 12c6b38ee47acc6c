#include <glog/logging.h>
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 测试创建的 cgroup 与正式运行的区分开，便于清理
    runexec::CGROUP_PREFIX = runexec::get_env("RUNEXEC_CGROUP_PREFIX", "runexec_test");
    if (getenv("DEBUG")) runexec::DEBUG = true;
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
