#ifndef PYGRADE_HARNESS_H_
#define PYGRADE_HARNESS_H_

#include <string>
#include <vector>

#include <pygrade/catalog.h>
#include <pygrade/grading.h>

// Prefix of the one trusted line the harness prints
extern const char kPayloadMarker[];

// Python literal of a text; invalid UTF-8 is replaced
std::string PyStringLiteral(const std::string&);

// Build a program that runs the candidate code in a fresh namespace and prints
//   one marker-prefixed line:
//   {"ok": bool, "results": [{"expr", "value" | "error", "expected", "pass"}], "topLevelError"?}
// Pure; nothing is executed here.
std::string BuildHarness(const std::string& code, const std::vector<Check>& checks);

// Parse the last marker-prefixed line of the harness output.
// Returns false if there is none or it does not follow the format above.
bool ParseEvalPayload(const std::string& output, EvalPayload& payload);

#endif  // PYGRADE_HARNESS_H_
