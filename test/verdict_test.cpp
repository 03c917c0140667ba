#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <pygrade/utils.h>

#include "src/pygrade/utils.h"

TEST(Verdict, Abbreviations) {
  EXPECT_STREQ(VerdictToAbr(Verdict::AC), "AC");
  EXPECT_STREQ(VerdictToAbr(Verdict::IO), "IO");
  EXPECT_STREQ(VerdictToAbr(Verdict::NUL), "");
  EXPECT_STREQ(VerdictToDesc(Verdict::TLE), "Execution Timed Out");
  EXPECT_STREQ(VerdictToDesc(Verdict::SIG), "Runtime Error (exited with signal)");
  for (auto verdict : {Verdict::AC, Verdict::WA, Verdict::RE, Verdict::SIG,
                       Verdict::IO, Verdict::OLE, Verdict::TLE}) {
    EXPECT_EQ(AbrToVerdict(VerdictToAbr(verdict)), verdict);
  }
  EXPECT_EQ(AbrToVerdict("CE"), Verdict::NUL);
  EXPECT_EQ(AbrToVerdict(""), Verdict::NUL);
}

TEST(Verdict, TestTypes) {
  EXPECT_STREQ(TestTypeName(TestType::STDOUT), "stdout");
  EXPECT_STREQ(TestTypeName(TestType::STDOUT_WITH_PRESET), "stdout_with_preset");
  EXPECT_STREQ(TestTypeName(TestType::EVAL), "eval");
  EXPECT_EQ(GetTestType("stdout"), TestType::STDOUT);
  EXPECT_EQ(GetTestType("stdout_with_preset"), TestType::STDOUT_WITH_PRESET);
  EXPECT_EQ(GetTestType("eval"), TestType::EVAL);
  EXPECT_EQ(GetTestType(""), TestType::UNKNOWN);
  EXPECT_EQ(GetTestType("Eval"), TestType::UNKNOWN);
}

TEST(Verdict, RequestStatusNames) {
  EXPECT_STREQ(RequestStatusName(RequestStatus::OK), "OK");
  EXPECT_STREQ(RequestStatusName(RequestStatus::NOT_FOUND), "NOT_FOUND");
  EXPECT_STREQ(RequestStatusName(RequestStatus::INVALID_TEST_TYPE), "INVALID_TEST_TYPE");
  EXPECT_STREQ(RequestStatusName(RequestStatus::TRANSPORT_FAILURE), "TRANSPORT_FAILURE");
}

TEST(Utils, QuoteText) {
  EXPECT_EQ(QuoteText(""), "''");
  EXPECT_EQ(QuoteText("Hello, World!\n"), R"('Hello, World!\n')");
  EXPECT_EQ(QuoteText("tab\there \"q\""), R"('tab\there "q"')");
  EXPECT_EQ(QuoteText("back\\slash\r"), R"('back\\slash\r')");
}

TEST(Utils, QuoteTextPicksQuote) {
  EXPECT_EQ(QuoteText("it's"), R"("it's")");
  EXPECT_EQ(QuoteText("it's \"q\""), R"('it\'s "q"')");
}

TEST(Utils, QuoteTextEscapesControls) {
  EXPECT_EQ(QuoteText(std::string("a\0b", 3)), R"('a\x00b')");
  EXPECT_EQ(QuoteText("\x1b[0m\x7f"), R"('\x1b[0m\x7f')");
  EXPECT_EQ(QuoteText("\xc2\x85"), R"('\x85')");
  EXPECT_EQ(QuoteText("h\xc3\xa9llo \xe2\x9c\x93"), "'h\xc3\xa9llo \xe2\x9c\x93'");
  EXPECT_EQ(QuoteText("\xff"), "'\xef\xbf\xbd'");
  EXPECT_EQ(QuoteText("\xe2\x9c"), "'\xef\xbf\xbd\xef\xbf\xbd'");
}

TEST(Utils, DumpJson) {
  EXPECT_EQ(DumpJson(nlohmann::json{{"a", 1}}), R"({"a":1})");
  EXPECT_NO_THROW(DumpJson(nlohmann::json("bad \xc3")));
}

TEST(Utils, RemoveFile) {
  fs::path path = fs::temp_directory_path() / "pygrade-remove-test";
  EXPECT_TRUE(RemoveFile(path)); // missing files are fine
}
