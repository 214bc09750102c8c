#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "process/subprocess.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 被测进程提前关闭管道时不能让测试进程被 SIGPIPE 杀死
    sandbox::process::ignore_sigpipe();
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
