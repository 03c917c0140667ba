#include <pygrade/runner.h>

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <pygrade/paths.h>
#include "utils.h"

std::string kInterpreter = "python3";
std::vector<std::string> kInterpreterArgs = {"-S", "-E", "-s"};
long kWallTime = 2L * 1'000'000; // 2s
long kMaxOutput = 16 * 1024; // 16M
const char kTimeoutMessage[] = "Execution timed out";

namespace {

using Clock = std::chrono::steady_clock;

constexpr char kDefaultPath[] = "/usr/local/bin:/usr/bin:/bin";

class FileDescriptor {
  int fd_;
 public:
  explicit FileDescriptor(int fd = -1) : fd_(fd) {}
  ~FileDescriptor() { Close(); }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const { return fd_; }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

// both ends are close-on-exec so that concurrent spawns never inherit them
void MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) throw TransportError(errno, "pipe2");
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
}

class TempSource { // RAII source file
  fs::path path_;
 public:
  explicit TempSource(const std::string& body) {
    std::string name = TempSourceTemplate();
    int fd = mkstemps(name.data(), kTempSourceSuffixLen);
    if (fd < 0) throw TransportError(errno, "mkstemps " + name);
    for (size_t written = 0; written < body.size();) {
      ssize_t n = write(fd, body.data() + written, body.size() - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        int err = errno;
        close(fd);
        RemoveFile(name);
        throw TransportError(err, "write " + name);
      }
      written += n;
    }
    if (close(fd) < 0) {
      int err = errno;
      RemoveFile(name);
      throw TransportError(err, "close " + name);
    }
    path_ = name;
    spdlog::debug("Created source file {} ({} bytes)", path_.c_str(), body.size());
  }
  ~TempSource() { RemoveFile(path_); }
  TempSource(const TempSource&) = delete;
  TempSource& operator=(const TempSource&) = delete;

  const fs::path& Path() const { return path_; }
};

/// child
// Only async-signal-safe calls between fork and exec; errno of a failed exec
//   is written to the report pipe, which is otherwise closed by the exec
[[noreturn]] void ExecChild(int fd_input, int fd_output, int fd_error, int fd_report,
                            char* const* argv, char* const* envp) {
  constexpr int kReportFd = 3;
  int err;
  sigset_t mask;
  setpgid(0, 0);
  sigemptyset(&mask);
  sigprocmask(SIG_SETMASK, &mask, nullptr);
  if (dup2(fd_input, 0) < 0 || dup2(fd_output, 1) < 0 || dup2(fd_error, 2) < 0 ||
      dup2(fd_report, kReportFd) < 0 || fcntl(kReportFd, F_SETFD, FD_CLOEXEC) < 0) {
    err = errno;
    IGNORE_RETURN(write(fd_report, &err, sizeof(err)));
    _exit(127);
  }
  if (CloseFrom(kReportFd + 1) < 0) goto fail;
  execvpe(argv[0], argv, envp);
fail:
  err = errno;
  IGNORE_RETURN(write(kReportFd, &err, sizeof(err)));
  _exit(127);
}

/// parent
inline int RemainingMs(Clock::time_point deadline) {
  auto now = Clock::now();
  if (now >= deadline) return 0;
  return std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
}

void KillGroup(pid_t pid) {
  // the child is the leader of its own process group; take its descendants down too
  if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pid, strerror(errno));
  }
}

int Reap(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("waitpid {} failed: {}", pid, strerror(errno));
      return 0;
    }
  }
  return status;
}

} // namespace

ExecutionResult Execute(const std::string& source, const std::string& preset, long wall_time) {
  if (wall_time <= 0) wall_time = kWallTime;
  std::string body = preset;
  if (!body.empty() && body.back() != '\n') body += '\n';
  body += source;
  TempSource file(body);

  std::vector<std::string> command = {kInterpreter};
  command.insert(command.end(), kInterpreterArgs.begin(), kInterpreterArgs.end());
  command.push_back(file.Path().string());
  const char* path_env = getenv("PATH");
  std::vector<std::string> envs = {
    std::string("PATH=") + (path_env ? path_env : kDefaultPath),
    "LANG=C.UTF-8",
    "LC_ALL=C.UTF-8",
  };
  // prepare everything the child needs before fork
  std::vector<char*> argv, envp;
  for (auto& i : command) argv.push_back(i.data());
  argv.push_back(nullptr);
  for (auto& i : envs) envp.push_back(i.data());
  envp.push_back(nullptr);

  FileDescriptor devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (devnull.Get() < 0) throw TransportError(errno, "open /dev/null");
  FileDescriptor out_r, out_w, err_r, err_w, report_r, report_w;
  MakePipe(out_r, out_w);
  MakePipe(err_r, err_w);
  MakePipe(report_r, report_w);

  auto start = Clock::now();
  auto deadline = start + std::chrono::microseconds(wall_time);
  pid_t pid = fork();
  if (pid < 0) throw TransportError(errno, "fork");
  if (pid == 0) {
    ExecChild(devnull.Get(), out_w.Get(), err_w.Get(), report_w.Get(), argv.data(), envp.data());
  }
  setpgid(pid, pid); // also done by the child; whichever runs first wins
  spdlog::debug("Spawned pid={} command={} wall_time={}", pid, fmt::format("{}", command), wall_time);
  devnull.Close();
  out_w.Close();
  err_w.Close();
  report_w.Close();
  {
    int exec_errno = 0;
    ssize_t n;
    while ((n = read(report_r.Get(), &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
    if (n > 0) {
      Reap(pid);
      throw TransportError(exec_errno, "exec " + kInterpreter);
    }
  }

  ExecutionResult ret;
  const size_t max_bytes = (size_t)kMaxOutput * 1024;
  struct pollfd fds[2] = {{out_r.Get(), POLLIN, 0}, {err_r.Get(), POLLIN, 0}};
  std::string* bufs[2] = {&ret.output, &ret.error};
  int open_streams = 2;
  while (open_streams > 0 && !ret.outputkill) {
    int timeout_ms = RemainingMs(deadline);
    if (timeout_ms <= 0) {
      ret.timekill = true;
      break;
    }
    int res = poll(fds, 2, timeout_ms);
    if (res < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      KillGroup(pid);
      Reap(pid);
      throw TransportError(err, "poll");
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      char buf[65536];
      ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (n <= 0) { // EOF; poll ignores negative descriptors
        fds[i].fd = -1;
        open_streams--;
        continue;
      }
      bufs[i]->append(buf, n);
      if (bufs[i]->size() > max_bytes) {
        bufs[i]->resize(max_bytes);
        ret.outputkill = true;
      }
    }
  }

  int status = 0;
  bool reaped = false;
  // both streams are closed but the process may still be running
  while (!ret.timekill && !ret.outputkill) {
    pid_t res = waitpid(pid, &status, WNOHANG);
    if (res == pid) {
      reaped = true;
      break;
    }
    if (res < 0 && errno != EINTR) {
      int err = errno;
      KillGroup(pid);
      throw TransportError(err, "waitpid");
    }
    if (Clock::now() >= deadline) {
      ret.timekill = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  KillGroup(pid);
  if (!reaped) status = Reap(pid);
  ret.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();

  if (ret.timekill) {
    ret.exit_status = kTimeoutExitStatus;
    ret.output.clear();
    ret.error = kTimeoutMessage;
  } else if (WIFEXITED(status)) {
    ret.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.exit_status = -WTERMSIG(status);
  }
  spdlog::debug("Run finished: pid={} status={} timekill={} outputkill={} wall_time={} stdout={}B stderr={}B",
                pid, ret.exit_status, ret.timekill, ret.outputkill, ret.wall_time,
                ret.output.size(), ret.error.size());
  return ret;
}
