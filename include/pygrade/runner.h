#ifndef INCLUDE_PYGRADE_RUNNER_H_
#define INCLUDE_PYGRADE_RUNNER_H_

#include <string>
#include <vector>
#include <system_error>

// interpreter executable; resolved through PATH if it contains no slash
extern std::string kInterpreter;
extern std::vector<std::string> kInterpreterArgs;
// us
extern long kWallTime;
// KiB, per stream
extern long kMaxOutput;

// exit status reported for a run killed by the wall-clock limit
constexpr int kTimeoutExitStatus = 124;
extern const char kTimeoutMessage[];

struct ExecutionResult {
  // exit code, or -signal if the process was terminated by a signal
  int exit_status;
  std::string output, error;
  bool timekill;
  bool outputkill; // stdout or stderr exceeded kMaxOutput
  long wall_time; // us

  ExecutionResult() : exit_status(0), timekill(false), outputkill(false), wall_time(0) {}
};

// Temp file / pipe / fork / exec failures. These are never graded.
class TransportError : public std::system_error {
 public:
  TransportError(int err, const std::string& what) :
      std::system_error(err, std::generic_category(), what) {}
};

// Run preset followed by source in a fresh interpreter process.
// Blocks until the process exits or wall_time (us; <= 0 for kWallTime) elapses.
// A timeout is reported in the result (timekill); throws TransportError otherwise.
ExecutionResult Execute(const std::string& source, const std::string& preset = "", long wall_time = 0);

#endif  // INCLUDE_PYGRADE_RUNNER_H_
