#include "harness.h"

#include <spdlog/spdlog.h>
#include "utils.h"

const char kPayloadMarker[] = "__PYGRADE_RESULT__ ";

namespace {

// Candidate output is sent to stderr while it runs; only the line written by
//   _emit goes to the real stdout. The trusted payload is decoded from a
//   literal and never from anything the candidate produces.
constexpr char kHarnessHead[] = R"(import sys
import json

_out = sys.stdout
sys.stdout = sys.stderr
)";

constexpr char kHarnessBody[] = R"(

def _describe(err):
    try:
        msg = str(err)
    except Exception:
        msg = ""
    if msg:
        return type(err).__name__ + ": " + msg
    return type(err).__name__


def _repr(value):
    try:
        return repr(value)
    except Exception:
        return "<unrepresentable " + type(value).__name__ + ">"


def _encode(value):
    try:
        decoded = json.loads(json.dumps(value, allow_nan=False))
        if type(decoded) is type(value) and decoded == value:
            return value
    except Exception:
        pass
    return _repr(value)


def _emit(payload):
    _out.write(_MARKER + json.dumps(payload, allow_nan=False) + "\n")
    _out.flush()


def _main():
    ns = {}
    try:
        exec(compile(_SPEC["code"], "<user>", "exec"), ns, ns)
    except BaseException as err:
        import traceback
        traceback.print_exc()
        _emit({"ok": False, "topLevelError": _describe(err), "results": []})
        return
    ok = True
    results = []
    for check in _SPEC["checks"]:
        item = {"expr": check["expr"], "expected": check["expected"],
                "expectedRepr": _repr(check["expected"])}
        try:
            value = eval(check["expr"], ns, ns)
            passed = bool(value == check["expected"])
            item["value"] = _encode(value)
            item["valueRepr"] = _repr(value)
        except BaseException as err:
            passed = False
            item["error"] = _describe(err)
        item["pass"] = passed
        ok = ok and passed
        results.append(item)
    _emit({"ok": ok, "results": results})


_main()
)";

} // namespace

std::string PyStringLiteral(const std::string& str) {
  // a JSON string (without \u-escaping non-ASCII) is also a valid Python literal
  return DumpJson(nlohmann::json(str));
}

std::string BuildHarness(const std::string& code, const std::vector<Check>& checks) {
  nlohmann::json spec = {{"code", code}, {"checks", nlohmann::json::array()}};
  for (auto& check : checks) {
    spec["checks"].push_back({{"expr", check.expression}, {"expected", check.expected}});
  }
  std::string ret = kHarnessHead;
  ret += "_MARKER = " + PyStringLiteral(kPayloadMarker) + "\n";
  ret += "_SPEC = json.loads(" + PyStringLiteral(DumpJson(spec)) + ")\n";
  ret += kHarnessBody;
  return ret;
}

bool ParseEvalPayload(const std::string& output, EvalPayload& payload) {
  const std::string marker = kPayloadMarker;
  size_t start = std::string::npos;
  for (size_t pos = output.find(marker); pos != std::string::npos; pos = output.find(marker, pos + 1)) {
    if (pos == 0 || output[pos - 1] == '\n') start = pos;
  }
  if (start == std::string::npos) return false;
  start += marker.size();
  size_t end = output.find('\n', start);
  std::string line = output.substr(start, end == std::string::npos ? std::string::npos : end - start);

  EvalPayload ret;
  try {
    nlohmann::json data = nlohmann::json::parse(line);
    ret.ok = data.at("ok").get<bool>();
    const auto& results = data.at("results");
    if (!results.is_array()) return false;
    bool all_pass = true;
    for (auto& item : results) {
      CheckResult res;
      res.expression = item.at("expr").get<std::string>();
      res.pass = item.at("pass").get<bool>();
      if (auto it = item.find("expected"); it != item.end()) res.expected = *it;
      res.expected_repr = item.value("expectedRepr", DumpJson(res.expected));
      auto value = item.find("value"), error = item.find("error");
      if ((value == item.end()) == (error == item.end())) return false; // exactly one of them
      if (error != item.end()) {
        res.outcome = CheckError{error->get<std::string>()};
        if (res.pass) return false;
      } else {
        res.outcome = *value;
        res.value_repr = item.value("valueRepr", DumpJson(*value));
      }
      all_pass = all_pass && res.pass;
      ret.results.push_back(std::move(res));
    }
    if (auto it = data.find("topLevelError"); it != data.end() && !it->is_null()) {
      ret.top_level_error = it->get<std::string>();
      if (!ret.results.empty()) return false;
    }
    if (ret.ok != (all_pass && !ret.top_level_error)) return false;
  } catch (nlohmann::json::exception& err) {
    spdlog::debug("Malformed harness payload: {}", err.what());
    return false;
  }
  ret.exit_status = payload.exit_status;
  ret.error_output = std::move(payload.error_output);
  ret.wall_time = payload.wall_time;
  payload = std::move(ret);
  return true;
}
