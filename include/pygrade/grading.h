#ifndef INCLUDE_PYGRADE_GRADING_H_
#define INCLUDE_PYGRADE_GRADING_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>

#include <nlohmann/json.hpp>
#include <pygrade/catalog.h>
#include <pygrade/runner.h>

// the max of the failures found would be the final result
#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(RE, "RE", "Runtime Error (exited with nonzero status or raised)") \
  X(SIG, "SIG", "Runtime Error (exited with signal)") \
  X(IO, "IO", "Invalid Output") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(TLE, "TLE", "Execution Timed Out")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

#define ENUM_REQUEST_STATUS_ \
  X(OK) \
  X(NOT_FOUND) \
  X(INVALID_TEST_TYPE) \
  X(TRANSPORT_FAILURE)
enum class RequestStatus {
#define X(name) name,
  ENUM_REQUEST_STATUS_
#undef X
};

struct CheckError {
  std::string message;
};

struct CheckResult {
  std::string expression;
  std::variant<nlohmann::json, CheckError> outcome;
  nlohmann::json expected;
  // Python repr() of both sides; JSON text when the harness sent none
  std::string value_repr, expected_repr;
  bool pass;

  CheckResult() : pass(false) {}
  bool IsError() const { return std::holds_alternative<CheckError>(outcome); }
};

class EvalPayload {
 public:
  bool ok;
  std::vector<CheckResult> results;
  std::optional<std::string> top_level_error;
  // attached from the harness run for diagnosis
  int exit_status;
  std::string error_output;
  long wall_time; // us

  EvalPayload() : ok(false), exit_status(0), wall_time(0) {}
};

class GradeResult {
 public:
  bool passed;
  Verdict verdict;
  std::string feedback;
  std::variant<ExecutionResult, EvalPayload> details;

  GradeResult() : passed(false), verdict(Verdict::NUL) {}
};

struct EvaluateResponse {
  RequestStatus status;
  std::string message; // set unless status is OK
  GradeResult grade; // valid only if status is OK
};

extern const char kInvalidOutputError[];

// Grade candidate code against one exercise. Thread-safe; no state is kept across calls.
// Grading outcomes never raise: timeouts, crashes and bad payloads are failing grades.
EvaluateResponse Evaluate(const std::string& chapter_id, const std::string& exercise_id,
                          const std::string& code);
EvaluateResponse Evaluate(const Exercise&, const std::string& code);

nlohmann::json ToJson(const ExecutionResult&);
nlohmann::json ToJson(const CheckResult&);
nlohmann::json ToJson(const EvalPayload&);
nlohmann::json ToJson(const GradeResult&);

#endif  // INCLUDE_PYGRADE_GRADING_H_
