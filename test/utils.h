#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <pygrade/paths.h>
#include <pygrade/runner.h>
#include <pygrade/catalog.h>

// Saves the runner settings and restores them when the test ends
class RunnerSettings : public ::testing::Test {
  std::string interpreter_;
  long wall_time_, max_output_;
 protected:
  void SetUp() override {
    interpreter_ = kInterpreter;
    wall_time_ = kWallTime;
    max_output_ = kMaxOutput;
  }
  void TearDown() override {
    kInterpreter = interpreter_;
    kWallTime = wall_time_;
    kMaxOutput = max_output_;
  }
};

// files left in kTempRoot
std::vector<fs::path> TempRootEntries();

Exercise MakeExercise(const std::string& id, TestSpec tests);

#endif // TEST_UTILS_H_
