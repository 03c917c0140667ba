#include <pygrade/catalog.h>

#include <fstream>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>
#include "utils.h"

TestSpec TestSpec::Stdout(std::string expected) {
  TestSpec ret;
  ret.type = TestType::STDOUT;
  ret.type_tag = TestTypeName(ret.type);
  ret.expected = std::move(expected);
  return ret;
}

TestSpec TestSpec::StdoutWithPreset(std::string preset, std::string expected) {
  TestSpec ret;
  ret.type = TestType::STDOUT_WITH_PRESET;
  ret.type_tag = TestTypeName(ret.type);
  ret.preset = std::move(preset);
  ret.expected = std::move(expected);
  return ret;
}

TestSpec TestSpec::Eval(std::vector<Check> checks) {
  TestSpec ret;
  ret.type = TestType::EVAL;
  ret.type_tag = TestTypeName(ret.type);
  ret.checks = std::move(checks);
  return ret;
}

namespace {

std::vector<Chapter> BuiltinCatalog() {
  return {
    {"basics", "Python Basics", "Print, variables, and simple expressions", {
      {"print-hello", "Print Hello World",
       "Write code that prints exactly: Hello, World!",
       "# Write a print statement below\n",
       TestSpec::Stdout("Hello, World!\n")},
      {"variables-sum", "Variables and Sum",
       "Create two variables a = 5 and b = 7 and print their sum.",
       "# Define a and b, then print their sum\n",
       TestSpec::Stdout("12\n")},
    }},
    {"functions", "Functions", "Define and call functions", {
      {"def-add", "Define add(a, b)",
       "Define a function add(a, b) that returns the sum of a and b.",
       "# Define add(a, b) below\n",
       TestSpec::Eval({{"add(2, 3)", 5}, {"add(-1, 1)", 0}, {"add(10, 5)", 15}})},
      {"def-greet", "Function greet(name)",
       "Write a function greet(name) that returns 'Hello, <name>!'.",
       "# Define greet(name) below\n",
       TestSpec::Eval({{"greet('Ada')", "Hello, Ada!"}, {"greet('Bob')", "Hello, Bob!"}})},
    }},
    {"loops", "Loops", "For and while loops", {
      {"sum-1-to-n", "Sum 1..n",
       "Read n from a variable and print the sum from 1 to n (inclusive). Assume n = 5.",
       "# Set n and print the sum from 1 to n\n# Example: if n = 5, output should be 15\n",
       TestSpec::StdoutWithPreset("n = 5\n", "15\n")},
    }},
  };
}

std::vector<Chapter> catalog = BuiltinCatalog();

TestSpec ParseTestSpec(const nlohmann::json& tests) {
  TestSpec ret;
  ret.type_tag = tests.at("type").get<std::string>();
  ret.type = GetTestType(ret.type_tag);
  switch (ret.type) {
    case TestType::STDOUT_WITH_PRESET:
      ret.preset = tests.value("preset", "");
      [[fallthrough]];
    case TestType::STDOUT:
      ret.expected = tests.at("expected").get<std::string>();
      break;
    case TestType::EVAL: {
      for (auto& check : tests.at("checks")) {
        auto equals = check.find("equals");
        ret.checks.push_back({check.at("expr").get<std::string>(),
                              equals != check.end() ? *equals : nlohmann::json()});
      }
      if (ret.checks.empty()) throw std::invalid_argument("eval test without checks");
      break;
    }
    case TestType::UNKNOWN:
      // kept so that grading requests on it are rejected
      spdlog::warn("Unknown test type \"{}\" in catalog", ret.type_tag);
      break;
  }
  return ret;
}

} // namespace

std::vector<Chapter> ParseCatalog(const nlohmann::json& data) {
  std::vector<Chapter> ret;
  std::unordered_set<std::string> chapter_ids;
  for (auto& ch : data.at("chapters")) {
    Chapter chapter;
    chapter.id = ch.at("id").get<std::string>();
    chapter.title = ch.value("title", "");
    chapter.description = ch.value("description", "");
    if (!chapter_ids.insert(chapter.id).second) {
      throw std::invalid_argument("duplicate chapter id " + chapter.id);
    }
    std::unordered_set<std::string> exercise_ids;
    for (auto& ex : ch.at("exercises")) {
      Exercise exercise;
      exercise.id = ex.at("id").get<std::string>();
      exercise.title = ex.value("title", "");
      exercise.prompt = ex.value("prompt", "");
      exercise.starter_code = ex.value("starter_code", "");
      exercise.tests = ParseTestSpec(ex.at("tests"));
      if (!exercise_ids.insert(exercise.id).second) {
        throw std::invalid_argument("duplicate exercise id " + chapter.id + "/" + exercise.id);
      }
      chapter.exercises.push_back(std::move(exercise));
    }
    ret.push_back(std::move(chapter));
  }
  return ret;
}

const std::vector<Chapter>& Chapters() {
  return catalog;
}

bool LoadCatalog(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Failed to open catalog {}", path.c_str());
    return false;
  }
  try {
    nlohmann::json data;
    fin >> data;
    auto chapters = ParseCatalog(data);
    catalog = std::move(chapters);
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Malformed catalog {}: {}", path.c_str(), err.what());
    return false;
  } catch (std::invalid_argument& err) {
    spdlog::error("Malformed catalog {}: {}", path.c_str(), err.what());
    return false;
  }
  size_t exercises = 0;
  for (auto& ch : catalog) exercises += ch.exercises.size();
  spdlog::info("Catalog loaded from {}: {} chapters, {} exercises", path.c_str(), catalog.size(), exercises);
  return true;
}

const Chapter* FindChapter(const std::string& chapter_id) {
  for (auto& ch : catalog) {
    if (ch.id == chapter_id) return &ch;
  }
  return nullptr;
}

const Exercise* FindExercise(const std::string& chapter_id, const std::string& exercise_id) {
  const Chapter* ch = FindChapter(chapter_id);
  if (!ch) return nullptr;
  for (auto& ex : ch->exercises) {
    if (ex.id == exercise_id) return &ex;
  }
  return nullptr;
}

nlohmann::json ChapterListJson() {
  nlohmann::json chapters = nlohmann::json::array();
  for (auto& ch : catalog) {
    nlohmann::json exercises = nlohmann::json::array();
    for (auto& ex : ch.exercises) exercises.push_back({{"id", ex.id}, {"title", ex.title}});
    chapters.push_back({
      {"id", ch.id},
      {"title", ch.title},
      {"description", ch.description},
      {"exercises", exercises},
    });
  }
  return {{"chapters", chapters}};
}

nlohmann::json ChapterJson(const Chapter& ch) {
  nlohmann::json exercises = nlohmann::json::array();
  for (auto& ex : ch.exercises) {
    exercises.push_back({
      {"id", ex.id},
      {"title", ex.title},
      {"prompt", ex.prompt},
      {"starter_code", ex.starter_code},
    });
  }
  return {
    {"id", ch.id},
    {"title", ch.title},
    {"description", ch.description},
    {"exercises", exercises},
  };
}
