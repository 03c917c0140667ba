#ifndef PYGRADE_UTILS_H_
#define PYGRADE_UTILS_H_

#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <pygrade/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// Close every descriptor >= minfd; async-signal-safe unless close_range(2) is unavailable
int CloseFrom(int minfd);

bool RemoveFile(const fs::path&);

// Python repr() of a str, used in feedback messages
std::string QuoteText(const std::string&);
// JSON dump that replaces invalid UTF-8 instead of throwing
std::string DumpJson(const nlohmann::json&, int indent = -1);

#endif  // PYGRADE_UTILS_H_
