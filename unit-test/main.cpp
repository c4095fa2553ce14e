#include <glog/logging.h>
#include "config.hpp"
#include "gmock/gmock.h"
#include "grade/registry.hpp"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    codebench::register_builtin_graders();
    // 测试中的死循环用例需要等待超时，缩短时间上限以加快测试
    codebench::EXECUTION_TIME_LIMIT = 2;
    if (getenv("DEBUG")) codebench::DEBUG = true;
  }
  void TearDown() override {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
