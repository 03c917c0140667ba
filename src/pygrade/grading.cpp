#include <pygrade/grading.h>

#include <spdlog/spdlog.h>
#include "harness.h"
#include "utils.h"

const char kInvalidOutputError[] = "invalid output";

namespace {

constexpr char kStdoutPassed[] = "Great job!";
constexpr char kPresetPassed[] = "Nice!";
constexpr char kEvalPassed[] = "All tests passed!";
constexpr char kEvalFailed[] = "Some tests failed.";

inline long ToMs(long us) {
  return us / 1000;
}

std::string TimeoutFeedback() {
  return std::string(kTimeoutMessage) + " after " + std::to_string(ToMs(kWallTime)) + " ms.";
}

std::string OutputLimitFeedback() {
  return "Output limit exceeded (" + std::to_string(kMaxOutput) + " KiB).";
}

// failures are checked from the most to the least severe
Verdict ClassifyRun(const ExecutionResult& res) {
  if (res.timekill) return Verdict::TLE;
  if (res.outputkill) return Verdict::OLE;
  if (res.exit_status < 0) return Verdict::SIG;
  if (res.exit_status != 0) return Verdict::RE;
  return Verdict::NUL;
}

inline long WallTime(const ExecutionResult& res) { return res.wall_time; }
inline long WallTime(const EvalPayload& payload) { return payload.wall_time; }

/// stdout & stdout_with_preset
GradeResult GradeStdout(const TestSpec& spec, const std::string& code) {
  GradeResult ret;
  const std::string& preset = spec.type == TestType::STDOUT_WITH_PRESET ? spec.preset : "";
  ExecutionResult res = Execute(code, preset);
  ret.verdict = ClassifyRun(res);
  if (ret.verdict == Verdict::NUL) {
    ret.verdict = res.output == spec.expected ? Verdict::AC : Verdict::WA;
  }
  ret.passed = ret.verdict == Verdict::AC;
  if (ret.passed) {
    ret.feedback = spec.type == TestType::STDOUT_WITH_PRESET ? kPresetPassed : kStdoutPassed;
  } else if (ret.verdict == Verdict::TLE) {
    ret.feedback = TimeoutFeedback();
  } else if (ret.verdict == Verdict::OLE) {
    ret.feedback = OutputLimitFeedback();
  } else {
    ret.feedback = "Expected output: " + QuoteText(spec.expected) + ", but got: " + QuoteText(res.output) + ".";
    if (!res.error.empty()) ret.feedback += " Error: " + res.error;
  }
  ret.details = std::move(res);
  return ret;
}

/// eval
// A payload must answer exactly the checks that were asked, in order
bool MatchesChecks(const EvalPayload& payload, const std::vector<Check>& checks) {
  if (payload.top_level_error) return payload.results.empty();
  if (payload.results.size() != checks.size()) return false;
  for (size_t i = 0; i < checks.size(); i++) {
    if (payload.results[i].expression != checks[i].expression ||
        payload.results[i].expected != checks[i].expected) {
      return false;
    }
  }
  return true;
}

std::string EvalFeedback(const EvalPayload& payload) {
  std::string ret;
  for (auto& res : payload.results) {
    if (res.pass) continue;
    if (!ret.empty()) ret += "; ";
    if (auto err = std::get_if<CheckError>(&res.outcome)) {
      ret += res.expression + ": error " + err->message;
    } else {
      ret += res.expression + ": expected " + res.expected_repr + ", got " + res.value_repr;
    }
  }
  if (!ret.empty()) return ret;
  if (payload.top_level_error) {
    ret = *payload.top_level_error;
    if (ret == kInvalidOutputError && !payload.error_output.empty()) ret += "\n" + payload.error_output;
    return ret;
  }
  if (!payload.error_output.empty()) return payload.error_output;
  return kEvalFailed;
}

GradeResult GradeEval(const TestSpec& spec, const std::string& code) {
  GradeResult ret;
  ExecutionResult res = Execute(BuildHarness(code, spec.checks));
  EvalPayload payload;
  payload.exit_status = res.exit_status;
  payload.error_output = res.error;
  payload.wall_time = res.wall_time;
  bool parsed = ParseEvalPayload(res.output, payload) && MatchesChecks(payload, spec.checks);
  if (!parsed) {
    if (!res.timekill) {
      spdlog::warn("Harness output unparsable: status={} stdout={}B", res.exit_status, res.output.size());
    }
    payload.ok = false;
    payload.results.clear();
    payload.top_level_error = kInvalidOutputError;
  }

  if (res.timekill || res.outputkill) {
    ret.verdict = ClassifyRun(res);
  } else if (!parsed) {
    ret.verdict = res.exit_status < 0 ? Verdict::SIG : Verdict::IO;
  } else if (payload.ok) {
    ret.verdict = Verdict::AC;
  } else if (payload.top_level_error) {
    ret.verdict = Verdict::RE;
  } else {
    ret.verdict = Verdict::WA;
    for (auto& i : payload.results) {
      if (i.IsError()) ret.verdict = Verdict::RE;
    }
  }
  ret.passed = ret.verdict == Verdict::AC;
  if (ret.passed) {
    ret.feedback = kEvalPassed;
  } else if (ret.verdict == Verdict::TLE) {
    ret.feedback = TimeoutFeedback();
  } else if (ret.verdict == Verdict::OLE) {
    ret.feedback = OutputLimitFeedback();
  } else {
    ret.feedback = EvalFeedback(payload);
  }
  ret.details = std::move(payload);
  return ret;
}

} // namespace

EvaluateResponse Evaluate(const std::string& chapter_id, const std::string& exercise_id,
                          const std::string& code) {
  if (!FindChapter(chapter_id)) {
    return {RequestStatus::NOT_FOUND, "Chapter not found", {}};
  }
  const Exercise* ex = FindExercise(chapter_id, exercise_id);
  if (!ex) return {RequestStatus::NOT_FOUND, "Exercise not found", {}};
  EvaluateResponse ret = Evaluate(*ex, code);
  if (ret.status == RequestStatus::OK) {
    const GradeResult& grade = ret.grade;
    long wall_time = std::visit([](const auto& details) { return WallTime(details); }, grade.details);
    spdlog::info("Graded: chapter={} exercise={} type={} verdict={} wall_time={}ms",
                 chapter_id, exercise_id, ex->tests.type_tag, VerdictToAbr(grade.verdict), ToMs(wall_time));
  }
  return ret;
}

EvaluateResponse Evaluate(const Exercise& ex, const std::string& code) {
  const TestSpec& spec = ex.tests;
  EvaluateResponse ret{RequestStatus::OK, "", {}};
  try {
    switch (spec.type) {
      case TestType::STDOUT: [[fallthrough]];
      case TestType::STDOUT_WITH_PRESET:
        ret.grade = GradeStdout(spec, code);
        break;
      case TestType::EVAL:
        if (spec.checks.empty()) {
          return {RequestStatus::INVALID_TEST_TYPE, "Eval test without checks", {}};
        }
        ret.grade = GradeEval(spec, code);
        break;
      case TestType::UNKNOWN:
        return {RequestStatus::INVALID_TEST_TYPE, "Unknown test type", {}};
    }
  } catch (TransportError& err) {
    spdlog::warn("Transport failure while grading {}: {}", ex.id, err.what());
    return {RequestStatus::TRANSPORT_FAILURE, err.what(), {}};
  }
  return ret;
}

nlohmann::json ToJson(const ExecutionResult& res) {
  return {
    {"returncode", res.exit_status},
    {"stdout", res.output},
    {"stderr", res.error},
    {"timekill", res.timekill},
    {"outputkill", res.outputkill},
    {"wall_time_us", res.wall_time},
  };
}

nlohmann::json ToJson(const CheckResult& res) {
  nlohmann::json ret{{"expr", res.expression}, {"expected", res.expected}, {"pass", res.pass}};
  if (auto err = std::get_if<CheckError>(&res.outcome)) {
    ret["error"] = err->message;
  } else {
    ret["value"] = std::get<nlohmann::json>(res.outcome);
    ret["valueRepr"] = res.value_repr;
  }
  ret["expectedRepr"] = res.expected_repr;
  return ret;
}

nlohmann::json ToJson(const EvalPayload& payload) {
  nlohmann::json results = nlohmann::json::array();
  for (auto& i : payload.results) results.push_back(ToJson(i));
  nlohmann::json ret{
    {"ok", payload.ok},
    {"results", results},
    {"returncode", payload.exit_status},
    {"stderr", payload.error_output},
    {"wall_time_us", payload.wall_time},
  };
  if (payload.top_level_error) ret["topLevelError"] = *payload.top_level_error;
  return ret;
}

nlohmann::json ToJson(const GradeResult& grade) {
  return {
    {"passed", grade.passed},
    {"verdict", VerdictToAbr(grade.verdict)},
    {"feedback", grade.feedback},
    {"details", std::visit([](const auto& details) { return ToJson(details); }, grade.details)},
  };
}
