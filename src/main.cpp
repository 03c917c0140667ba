#include <sstream>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <pygrade/logger.h>
#include <pygrade/paths.h>
#include <pygrade/runner.h>
#include <pygrade/catalog.h>
#include <pygrade/grading.h>
#include "pygrade/utils.h"
#include "server_io.h"

namespace {

// exit codes
constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitError = 2;

enum class Mode { GRADE, LIST, SERVE };

Mode mode = Mode::GRADE;
std::string chapter_id, exercise_id, source_file;

std::vector<std::string> SplitArgs(const std::string& str) {
  std::istringstream sin(str);
  return {std::istream_iterator<std::string>(sin), std::istream_iterator<std::string>()};
}

bool SetTempRoot(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    spdlog::error("Temporary directory {} does not exist", path.c_str());
    return false;
  }
  kTempRoot = path;
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string interpreter_args = ini[""]["interpreter_args"] | "";
  std::string temp_dir = ini[""]["temp_dir"] | "";
  std::string catalog = ini[""]["catalog"] | "";
  kInterpreter = ini[""]["interpreter"] | kInterpreter;
  if (interpreter_args.size()) kInterpreterArgs = SplitArgs(interpreter_args);
  kWallTime = (ini[""]["timeout_ms"] | (kWallTime / 1000)) * 1000;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  if (temp_dir.size() && !SetTempRoot(temp_dir)) return false;
  if (catalog.size() && !LoadCatalog(catalog)) return false;
  kServerHost = ini[""]["host"] | kServerHost;
  kServerPort = ini[""]["port"] | kServerPort;
  kServerThreads = ini[""]["threads"] | kServerThreads;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "pygrade-judge");
  parser.add_argument("source")
    .default_value(std::string(""))
    .nargs(argparse::nargs_pattern::optional)
    .help("Python file to grade, or - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--chapter")
    .help("Chapter id of the exercise to grade against");
  parser.add_argument("--exercise")
    .help("Exercise id to grade against");
  parser.add_argument("--list")
    .default_value(false)
    .implicit_value(true)
    .help("Print the chapter list and exit");
  parser.add_argument("--serve")
    .default_value(false)
    .implicit_value(true)
    .help("Start the HTTP front end");
  parser.add_argument("--interpreter")
    .help("Python interpreter to run submissions with");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall time limit of a run in milliseconds");
  parser.add_argument("--catalog")
    .help("JSON exercise catalog replacing the built-in one");
  parser.add_argument("--temp-dir")
    .help("Directory for temporary source files");
  parser.add_argument("--host")
    .help("Address the HTTP front end listens on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port the HTTP front end listens on");
  parser.add_argument("--threads")
    .scan<'d', int>()
    .help("Number of HTTP worker threads");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitError);
  }

  InitLogger(verbosity);
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(config_file.value())) {
      spdlog::error("Failed to parse configuration file {}", config_file.value());
      exit(kExitError);
    }
  }
  if (auto val = parser.present("--interpreter")) kInterpreter = val.value();
  if (auto val = parser.present<long>("--timeout")) kWallTime = val.value() * 1000;
  if (auto val = parser.present("--temp-dir"); val && !SetTempRoot(val.value())) exit(kExitError);
  if (auto val = parser.present("--catalog"); val && !LoadCatalog(val.value())) exit(kExitError);
  if (auto val = parser.present("--host")) kServerHost = val.value();
  if (auto val = parser.present<int>("--port")) kServerPort = val.value();
  if (auto val = parser.present<int>("--threads")) kServerThreads = val.value();
  if (kWallTime <= 0 || kMaxOutput <= 0 || kServerThreads <= 0) {
    spdlog::error("Time limit, output limit and thread count must be positive");
    exit(kExitError);
  }

  if (parser["--serve"] == true) {
    mode = Mode::SERVE;
  } else if (parser["--list"] == true) {
    mode = Mode::LIST;
  } else {
    auto chapter = parser.present("--chapter");
    auto exercise = parser.present("--exercise");
    source_file = parser.get<std::string>("source");
    if (!chapter || !exercise || source_file.empty()) {
      std::cerr << "--chapter, --exercise and a source file are required for grading" << std::endl;
      std::cerr << parser;
      exit(kExitError);
    }
    chapter_id = chapter.value();
    exercise_id = exercise.value();
  }
}

bool ReadSource(const std::string& name, std::string& code) {
  if (name == "-") {
    code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream fin(name, std::ios::binary);
  if (!fin) return false;
  code.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}

int Grade() {
  std::string code;
  if (!ReadSource(source_file, code)) {
    spdlog::error("Failed to read {}", source_file);
    return kExitError;
  }
  EvaluateResponse res = Evaluate(chapter_id, exercise_id, code);
  if (res.status != RequestStatus::OK) {
    std::cerr << RequestStatusName(res.status) << ": " << res.message << std::endl;
    return kExitError;
  }
  std::cout << DumpJson(ToJson(res.grade), 2) << std::endl;
  return res.grade.passed ? kExitPassed : kExitFailed;
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  switch (mode) {
    case Mode::LIST:
      std::cout << DumpJson(ChapterListJson(), 2) << std::endl;
      return kExitPassed;
    case Mode::SERVE:
      return ServerWorkLoop() ? kExitPassed : kExitError;
    case Mode::GRADE:
      return Grade();
  }
  return kExitError;
}
