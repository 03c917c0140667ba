#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <pygrade/utils.h>
#include <pygrade/grading.h>

#include "utils.h"

namespace {

constexpr char kAddSolution[] = "def add(a, b):\n    return a + b\n";

GradeResult Grade(const std::string& chapter_id, const std::string& exercise_id, const std::string& code) {
  auto res = Evaluate(chapter_id, exercise_id, code);
  EXPECT_EQ(res.status, RequestStatus::OK) << res.message;
  return res.grade;
}

const EvalPayload& Payload(const GradeResult& grade) {
  return std::get<EvalPayload>(grade.details);
}

} // namespace

class GradingTest : public RunnerSettings {};

TEST_F(GradingTest, ReferenceSolutions) {
  struct {
    const char *chapter, *exercise, *code, *feedback;
  } cases[] = {
    {"basics", "print-hello", "print('Hello, World!')\n", "Great job!"},
    {"basics", "variables-sum", "a = 5\nb = 7\nprint(a + b)\n", "Great job!"},
    {"functions", "def-add", kAddSolution, "All tests passed!"},
    {"functions", "def-greet", "def greet(name):\n    return f'Hello, {name}!'\n", "All tests passed!"},
    {"loops", "sum-1-to-n", "print(sum(range(1, n + 1)))\n", "Nice!"},
  };
  for (auto& i : cases) {
    auto grade = Grade(i.chapter, i.exercise, i.code);
    EXPECT_TRUE(grade.passed) << i.exercise << ": " << grade.feedback;
    EXPECT_EQ(grade.verdict, Verdict::AC) << i.exercise;
    EXPECT_EQ(grade.feedback, i.feedback);
  }
}

TEST_F(GradingTest, EmptyCodeCitesExpectedOutput) {
  auto grade = Grade("basics", "print-hello", "");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::WA);
  EXPECT_EQ(grade.feedback, R"(Expected output: 'Hello, World!\n', but got: ''.)");
  auto& res = std::get<ExecutionResult>(grade.details);
  EXPECT_EQ(res.exit_status, 0);
  EXPECT_EQ(res.output, "");
}

TEST_F(GradingTest, StdoutIsExact) {
  auto grade = Grade("basics", "print-hello", "import sys\nsys.stdout.write('Hello, World!')\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::WA);
  grade = Grade("basics", "print-hello", "print('Hello, World! ')\n");
  EXPECT_FALSE(grade.passed);
}

TEST_F(GradingTest, PresetDefinesVariable) {
  auto grade = Grade("loops", "sum-1-to-n", "total = 0\nfor i in range(1, n + 1):\n    total += i\nprint(total)\n");
  EXPECT_TRUE(grade.passed);
  EXPECT_EQ(std::get<ExecutionResult>(grade.details).output, "15\n");
}

TEST_F(GradingTest, RuntimeErrorReportsStderr) {
  auto grade = Grade("basics", "variables-sum", "print(1 / 0)\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::RE);
  EXPECT_EQ(grade.feedback.rfind(R"(Expected output: '12\n', but got: ''. Error: )", 0), 0u);
  EXPECT_NE(grade.feedback.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(GradingTest, MatchingOutputWithNonzeroExitFails) {
  auto grade = Grade("basics", "print-hello", "import sys\nprint('Hello, World!')\nsys.exit(1)\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::RE);
}

TEST_F(GradingTest, StdoutTimeout) {
  kWallTime = 500'000;
  auto grade = Grade("basics", "print-hello", "while True:\n    pass\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::TLE);
  EXPECT_EQ(grade.feedback, "Execution timed out after 500 ms.");
  auto& res = std::get<ExecutionResult>(grade.details);
  EXPECT_EQ(res.exit_status, kTimeoutExitStatus);
  EXPECT_EQ(res.error, kTimeoutMessage);
  EXPECT_TRUE(TempRootEntries().empty());
}

TEST_F(GradingTest, EvalTimeout) {
  kWallTime = 500'000;
  auto grade = Grade("functions", "def-add", "def add(a, b):\n    while True:\n        pass\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::TLE);
  EXPECT_EQ(grade.feedback, "Execution timed out after 500 ms.");
  EXPECT_FALSE(Payload(grade).ok);
}

TEST_F(GradingTest, OutputLimit) {
  kMaxOutput = 4;
  auto grade = Grade("basics", "print-hello", "while True:\n    print('Hello, World!')\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::OLE);
  EXPECT_EQ(grade.feedback, "Output limit exceeded (4 KiB).");
}

TEST_F(GradingTest, EvalWrongAnswer) {
  auto grade = Grade("functions", "def-add", "def add(a, b):\n    return a - b\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::WA);
  EXPECT_EQ(grade.feedback,
            "add(2, 3): expected 5, got -1; "
            "add(-1, 1): expected 0, got -2; "
            "add(10, 5): expected 15, got 5");
  EXPECT_EQ(Payload(grade).results.size(), 3u);
}

TEST_F(GradingTest, EvalStringMismatch) {
  auto grade = Grade("functions", "def-greet", "def greet(name):\n    return 'Hi, ' + name\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.feedback,
            "greet('Ada'): expected 'Hello, Ada!', got 'Hi, Ada'; "
            "greet('Bob'): expected 'Hello, Bob!', got 'Hi, Bob'");
}

TEST_F(GradingTest, EvalFeedbackShowsPythonValues) {
  auto ex = MakeExercise("repr", TestSpec::Eval({{"f()", nlohmann::json::array({1, 2})}, {"g()", true}}));
  auto res = Evaluate(ex, "def f():\n    return (1, 2)\ndef g():\n    return None\n");
  ASSERT_EQ(res.status, RequestStatus::OK);
  EXPECT_EQ(res.grade.verdict, Verdict::WA);
  EXPECT_EQ(res.grade.feedback, "f(): expected [1, 2], got (1, 2); g(): expected True, got None");

  // a str that looks like the tuple must read differently
  auto str_res = Evaluate(ex, "def f():\n    return '(1, 2)'\ndef g():\n    return 'True'\n");
  ASSERT_EQ(str_res.status, RequestStatus::OK);
  EXPECT_EQ(str_res.grade.feedback, "f(): expected [1, 2], got '(1, 2)'; g(): expected True, got 'True'");
  EXPECT_NE(str_res.grade.feedback, res.grade.feedback);
}

TEST_F(GradingTest, UndefinedNameInOneCheck) {
  auto ex = MakeExercise("mixed", TestSpec::Eval({{"add(1, 2)", 3}, {"missing(1)", 0}, {"add(2, 2)", 4}}));
  auto res = Evaluate(ex, kAddSolution);
  ASSERT_EQ(res.status, RequestStatus::OK);
  auto& grade = res.grade;
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::RE);
  EXPECT_EQ(grade.feedback, "missing(1): error NameError: name 'missing' is not defined");
  auto& payload = Payload(grade);
  EXPECT_FALSE(payload.ok);
  ASSERT_EQ(payload.results.size(), 3u);
  EXPECT_TRUE(payload.results[0].pass);
  EXPECT_TRUE(payload.results[1].IsError());
  EXPECT_TRUE(payload.results[2].pass);
}

TEST_F(GradingTest, LoadFailure) {
  auto grade = Grade("functions", "def-add", "def add(a, b)\n    return a + b\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::RE);
  EXPECT_EQ(grade.feedback.rfind("SyntaxError", 0), 0u);
  EXPECT_TRUE(Payload(grade).results.empty());
  ASSERT_TRUE(Payload(grade).top_level_error);
}

TEST_F(GradingTest, CorruptPayload) {
  auto grade = Grade("functions", "def-add",
                     "import os\nos.write(1, b'__PYGRADE_RESULT__ {not json}\\n')\nos._exit(0)\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::IO);
  auto& payload = Payload(grade);
  EXPECT_FALSE(payload.ok);
  ASSERT_TRUE(payload.top_level_error);
  EXPECT_EQ(*payload.top_level_error, kInvalidOutputError);
  EXPECT_TRUE(payload.results.empty());
  EXPECT_EQ(grade.feedback, kInvalidOutputError);
}

TEST_F(GradingTest, SpoofedPayloadRejected) {
  auto grade = Grade("functions", "def-add",
                     "import os\nos.write(1, b'__PYGRADE_RESULT__ {\"ok\": true, \"results\": []}\\n')\n"
                     "os._exit(0)\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::IO);
}

TEST_F(GradingTest, MissingPayloadAttachesStderr) {
  auto grade = Grade("functions", "def-add", "import os, sys\nsys.stderr.write('bye\\n')\nsys.stderr.flush()\nos._exit(5)\n");
  EXPECT_EQ(grade.verdict, Verdict::IO);
  auto& payload = Payload(grade);
  EXPECT_EQ(payload.exit_status, 5);
  EXPECT_EQ(payload.error_output, "bye\n");
  EXPECT_EQ(grade.feedback, std::string(kInvalidOutputError) + "\nbye\n");
}

TEST_F(GradingTest, EvalKilledBySignal) {
  auto grade = Grade("functions", "def-add", "import os, signal\nos.kill(os.getpid(), signal.SIGKILL)\n");
  EXPECT_FALSE(grade.passed);
  EXPECT_EQ(grade.verdict, Verdict::SIG);
  EXPECT_FALSE(grade.feedback.empty());
}

TEST_F(GradingTest, NotFound) {
  auto res = Evaluate("nope", "print-hello", "print(1)");
  EXPECT_EQ(res.status, RequestStatus::NOT_FOUND);
  EXPECT_EQ(res.message, "Chapter not found");
  res = Evaluate("basics", "nope", "print(1)");
  EXPECT_EQ(res.status, RequestStatus::NOT_FOUND);
  EXPECT_EQ(res.message, "Exercise not found");
  EXPECT_TRUE(TempRootEntries().empty());
}

TEST_F(GradingTest, InvalidTestType) {
  EXPECT_EQ(Evaluate(MakeExercise("unknown", TestSpec()), "print(1)").status, RequestStatus::INVALID_TEST_TYPE);
  EXPECT_EQ(Evaluate(MakeExercise("no-checks", TestSpec::Eval({})), "print(1)").status,
            RequestStatus::INVALID_TEST_TYPE);
}

TEST_F(GradingTest, TransportFailure) {
  kInterpreter = "/nonexistent/python3";
  auto res = Evaluate("functions", "def-add", kAddSolution);
  EXPECT_EQ(res.status, RequestStatus::TRANSPORT_FAILURE);
  EXPECT_FALSE(res.message.empty());
}

TEST_F(GradingTest, Idempotent) {
  for (auto code : {kAddSolution, "def add(a, b):\n    return a * b\n"}) {
    auto first = Grade("functions", "def-add", code);
    auto second = Grade("functions", "def-add", code);
    EXPECT_EQ(first.passed, second.passed);
    EXPECT_EQ(first.verdict, second.verdict);
    EXPECT_EQ(first.feedback, second.feedback);
  }
}

TEST_F(GradingTest, Json) {
  auto stdout_json = ToJson(Grade("basics", "print-hello", "print('Hello, World!')\n"));
  EXPECT_EQ(stdout_json["passed"], true);
  EXPECT_EQ(stdout_json["verdict"], "AC");
  EXPECT_EQ(stdout_json["feedback"], "Great job!");
  EXPECT_EQ(stdout_json["details"]["returncode"], 0);
  EXPECT_EQ(stdout_json["details"]["stdout"], "Hello, World!\n");

  auto eval_json = ToJson(Grade("functions", "def-add", "def add(a, b):\n    return a - b\n"));
  EXPECT_EQ(eval_json["passed"], false);
  EXPECT_EQ(eval_json["verdict"], "WA");
  auto& results = eval_json["details"]["results"];
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0]["expr"], "add(2, 3)");
  EXPECT_EQ(results[0]["value"], -1);
  EXPECT_EQ(results[0]["expected"], 5);
  EXPECT_EQ(results[0]["valueRepr"], "-1");
  EXPECT_EQ(results[0]["expectedRepr"], "5");
  EXPECT_EQ(results[0]["pass"], false);
  EXPECT_FALSE(eval_json["details"].contains("topLevelError"));
}

TEST_F(GradingTest, InvalidUtf8OutputSerializes) {
  auto grade = Grade("basics", "print-hello", "import sys\nsys.stdout.buffer.write(b'\\xff\\n')\n");
  EXPECT_FALSE(grade.passed);
  std::string dumped;
  EXPECT_NO_THROW(dumped = ToJson(grade).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  EXPECT_NE(dumped.find("\xef\xbf\xbd"), std::string::npos);
}
