#ifndef TOOLS_PYTEST_HPP
#define TOOLS_PYTEST_HPP

#include <string>

#include "executor/local_executor.hpp"

namespace tools {

struct PytestSummary {
  int64_t passed = 0;
  int64_t failed = 0;
  int64_t errors = 0;
  // False if no summary line was found.
  bool found = false;
};

// Reads the counts from the last summary line of a pytest run, such as
// "2 failed, 1 passed in 0.03s".
PytestSummary ParsePytestSummary(const std::string& output);

// A quiet pytest run in cwd, without cache files.
executor::Request PytestRequest(const std::string& python,
                                const std::string& cwd);

}  // namespace tools

#endif
