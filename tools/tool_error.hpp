#ifndef TOOLS_TOOL_ERROR_HPP
#define TOOLS_TOOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tools {

enum class ErrorKind {
  PATH_ERROR,
  NOT_FOUND,
  IS_A_DIRECTORY,
  FILE_TOO_LARGE,
  TOOL_TIMEOUT,
  QUERY_ERROR,
  EVALUATION_ERROR,
  TOOL_EXECUTION_ERROR
};

// Name of the kind as shown to the agent, e.g. "NotFoundError".
const char* ErrorKindName(ErrorKind kind);

// Raised by tool implementations. The registry turns it into an error result.
class tool_error : public std::runtime_error {
 public:
  tool_error(ErrorKind kind, const std::string& msg)
      : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace tools

#endif
