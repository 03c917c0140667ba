#include <pygrade/paths.h>

namespace {

fs::path DefaultTempRoot() {
  std::error_code ec;
  fs::path ret = fs::temp_directory_path(ec);
  if (ec) return "/tmp";
  return ret;
}

} // namespace

fs::path kTempRoot = DefaultTempRoot();

std::string TempSourceTemplate() {
  return (kTempRoot / "pygrade-XXXXXX.py").string();
}
