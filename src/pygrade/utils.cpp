#include "utils.h"

#include <fcntl.h>
#include <dirent.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <cerrno>
#include <cstdlib>
#include <cstdint>
#include <cstring>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

Verdict AbrToVerdict(const std::string& str) {
  for (int i = (int)Verdict::AC; i <= (int)Verdict::TLE; i++) {
    if (str == kVerdictAbrTable[i]) return (Verdict)i;
  }
  return Verdict::NUL;
}

static const char* kTestTypeTable[] = {
#define X(name, tag) tag,
  ENUM_TEST_TYPE_
#undef X
};

const char* TestTypeName(TestType type) {
  return kTestTypeTable[(int)type];
}

TestType GetTestType(const std::string& str) {
  for (int i = 0; i < (int)TestType::UNKNOWN; i++) {
    if (str == kTestTypeTable[i]) return (TestType)i;
  }
  return TestType::UNKNOWN;
}

#define X(...) X_RETURN_ARG1(RequestStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RequestStatusName, RequestStatus, ENUM_REQUEST_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG3

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, (unsigned)minfd, ~0U, 0) == 0) return 0;
  if (errno != ENOSYS) return -1;
#endif
  // kernel < 5.9
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}

bool RemoveFile(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

namespace {

// Decode one UTF-8 sequence at pos; 0 if it is malformed
size_t DecodeUtf8(const std::string& str, size_t pos, uint32_t& cp) {
  auto byte = [&](size_t i) { return static_cast<unsigned char>(str[i]); };
  unsigned char lead = byte(pos);
  size_t len;
  uint32_t min;
  if (lead < 0x80) {
    cp = lead;
    return 1;
  } else if ((lead & 0xe0) == 0xc0) {
    len = 2, min = 0x80, cp = lead & 0x1f;
  } else if ((lead & 0xf0) == 0xe0) {
    len = 3, min = 0x800, cp = lead & 0x0f;
  } else if ((lead & 0xf8) == 0xf0) {
    len = 4, min = 0x10000, cp = lead & 0x07;
  } else {
    return 0;
  }
  if (pos + len > str.size()) return 0;
  for (size_t i = 1; i < len; i++) {
    if ((byte(pos + i) & 0xc0) != 0x80) return 0;
    cp = cp << 6 | (byte(pos + i) & 0x3f);
  }
  if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp < 0xe000)) return 0;
  return len;
}

} // namespace

std::string QuoteText(const std::string& str) {
  char quote = '\'';
  if (str.find('\'') != std::string::npos && str.find('"') == std::string::npos) quote = '"';
  std::string ret(1, quote);
  for (size_t pos = 0; pos < str.size();) {
    uint32_t cp;
    size_t len = DecodeUtf8(str, pos, cp);
    if (!len) {
      ret += "\xef\xbf\xbd"; // U+FFFD
      pos++;
      continue;
    }
    if (cp == '\\' || cp == static_cast<uint32_t>(quote)) {
      ret += '\\';
      ret += static_cast<char>(cp);
    } else if (cp == '\n') {
      ret += "\\n";
    } else if (cp == '\r') {
      ret += "\\r";
    } else if (cp == '\t') {
      ret += "\\t";
    } else if (cp < 0x20 || (cp >= 0x7f && cp < 0xa1) || cp == 0xad) {
      ret += fmt::format("\\x{:02x}", cp);
    } else {
      ret.append(str, pos, len);
    }
    pos += len;
  }
  ret += quote;
  return ret;
}

std::string DumpJson(const nlohmann::json& json, int indent) {
  return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
