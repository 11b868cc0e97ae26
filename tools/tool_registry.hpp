#ifndef TOOLS_TOOL_REGISTRY_HPP
#define TOOLS_TOOL_REGISTRY_HPP

#include <chrono>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "nlohmann/json.hpp"
#include "tools/tool.hpp"

namespace tools {

struct ToolFailure {
  ErrorKind kind;
  std::string message;
};

// One serviced tool call. Exactly one of result and error is set.
struct ToolCall {
  std::string name;
  nlohmann::json arguments;
  nlohmann::json result;
  absl::optional<ToolFailure> error;
  int64_t elapsed_micros = 0;
  // Size of the serialized response.
  size_t output_bytes = 0;

  bool ok() const { return !error.has_value(); }

  // What the agent sees: {"result": ...} or {"error": {"kind", "message"}}.
  nlohmann::json Response() const;
};

// Services tool calls for one run, against the sandbox and limits in the
// given context. Never throws because of what a tool or its arguments do.
class ToolRegistry {
 public:
  ToolRegistry(const workspace::PathResolver* resolver,
               executor::LocalExecutor* executor, ToolLimits limits,
               std::vector<std::string> env);

  // Runs tool name. The call gets the per-call timeout, cut short by
  // run_deadline if that comes first.
  ToolCall Invoke(const std::string& name, const nlohmann::json& arguments,
                  std::chrono::steady_clock::time_point run_deadline =
                      std::chrono::steady_clock::time_point::max()) const;

 private:
  ToolContext base_context_;
};

}  // namespace tools

#endif
