#ifndef INCLUDE_PYGRADE_CATALOG_H_
#define INCLUDE_PYGRADE_CATALOG_H_

#include <string>
#include <vector>
#include <filesystem>

#include <nlohmann/json.hpp>

#define ENUM_TEST_TYPE_ \
  X(STDOUT, "stdout") \
  X(STDOUT_WITH_PRESET, "stdout_with_preset") \
  X(EVAL, "eval") \
  X(UNKNOWN, "") // should be the last one
enum class TestType {
#define X(name, tag) name,
  ENUM_TEST_TYPE_
#undef X
};

struct Check {
  std::string expression; // trusted; evaluated against the candidate namespace
  nlohmann::json expected;
};

class TestSpec {
 public:
  TestType type;
  std::string type_tag; // as written in the catalog; kept for UNKNOWN
  // STDOUT & STDOUT_WITH_PRESET
  std::string expected;
  // STDOUT_WITH_PRESET; runs before the candidate code in the same namespace
  std::string preset;
  // EVAL; must not be empty
  std::vector<Check> checks;

  TestSpec() : type(TestType::UNKNOWN) {}

  static TestSpec Stdout(std::string expected);
  static TestSpec StdoutWithPreset(std::string preset, std::string expected);
  static TestSpec Eval(std::vector<Check> checks);
};

struct Exercise {
  std::string id;
  std::string title;
  std::string prompt;
  std::string starter_code;
  TestSpec tests;
};

struct Chapter {
  std::string id;
  std::string title;
  std::string description;
  std::vector<Exercise> exercises;
};

// The catalog is loaded once at startup and is read-only afterwards;
//   lookups are safe from any thread as long as LoadCatalog is not running.
const std::vector<Chapter>& Chapters();

// Replace the built-in catalog with the one in a JSON file.
// Returns false (and keeps the current catalog) if the file is unreadable or malformed.
bool LoadCatalog(const std::filesystem::path&);
// Parse a catalog document; throws nlohmann::json::exception or std::invalid_argument
std::vector<Chapter> ParseCatalog(const nlohmann::json&);

// nullptr if not found
const Chapter* FindChapter(const std::string& chapter_id);
const Exercise* FindExercise(const std::string& chapter_id, const std::string& exercise_id);

// Public views; test specifications are never included
nlohmann::json ChapterListJson();
nlohmann::json ChapterJson(const Chapter&);

#endif  // INCLUDE_PYGRADE_CATALOG_H_
