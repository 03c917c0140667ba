#include "utils.h"

#include <filesystem>

std::vector<fs::path> TempRootEntries() {
  std::vector<fs::path> ret;
  for (auto& entry : fs::directory_iterator(kTempRoot)) ret.push_back(entry.path());
  return ret;
}

Exercise MakeExercise(const std::string& id, TestSpec tests) {
  Exercise ret;
  ret.id = id;
  ret.title = id;
  ret.tests = std::move(tests);
  return ret;
}
