#ifndef INCLUDE_PYGRADE_UTILS_H_
#define INCLUDE_PYGRADE_UTILS_H_

#include <string>

#include "catalog.h"
#include "grading.h"

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
Verdict AbrToVerdict(const std::string&);

const char* TestTypeName(TestType);
TestType GetTestType(const std::string&);

// logging
const char* RequestStatusName(RequestStatus);

#endif  // INCLUDE_PYGRADE_UTILS_H_
