#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    if (getenv("DEBUG")) {
      executor::DEBUG = true;
      FLAGS_v = 1;
    }
    executor::WORKSPACE_DIR = std::filesystem::temp_directory_path() / "executor-test";
    std::filesystem::create_directories(executor::WORKSPACE_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(executor::WORKSPACE_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
