#ifndef INCLUDE_PYGRADE_PATHS_H_
#define INCLUDE_PYGRADE_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// directory holding the per-run source files
extern fs::path kTempRoot;

// mkstemps(3) template for a run's source file and the length of its suffix
std::string TempSourceTemplate();
constexpr int kTempSourceSuffixLen = 3; // ".py"

#endif  // INCLUDE_PYGRADE_PATHS_H_
