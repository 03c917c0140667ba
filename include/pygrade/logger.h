#ifndef INCLUDE_PYGRADE_LOGGER_H_
#define INCLUDE_PYGRADE_LOGGER_H_

// 0 = warn, 1 = info, 2+ = debug
void InitLogger(int verbosity);

#endif  // INCLUDE_PYGRADE_LOGGER_H_
