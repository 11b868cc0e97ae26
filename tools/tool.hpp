#ifndef TOOLS_TOOL_HPP
#define TOOLS_TOOL_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "executor/local_executor.hpp"
#include "nlohmann/json.hpp"
#include "tools/tool_error.hpp"
#include "workspace/path_resolver.hpp"

namespace tools {

// Bounds applied to every tool call.
struct ToolLimits {
  int64_t timeout_millis = 10000;
  int64_t max_read_bytes = 64 * 1024;
  size_t max_output_bytes = 2000;
  int32_t max_sql_rows = 200;
  int64_t expression_cpu_millis = 2000;
  int64_t expression_memory_mb = 256;
  std::string python = "python3";
};

// What a tool may touch during one call. The resolver confines every path to
// the sandbox of the run; env holds the KEY=VALUE variables exported to
// subprocesses.
struct ToolContext {
  const workspace::PathResolver* resolver = nullptr;
  executor::LocalExecutor* executor = nullptr;
  ToolLimits limits;
  std::vector<std::string> env;
  std::chrono::steady_clock::time_point deadline;

  // Milliseconds left before the deadline, at least 1.
  int64_t RemainingMillis() const;

  // Throws a TOOL_TIMEOUT tool_error if the deadline has passed.
  void CheckDeadline() const;

  // Runs request under the remaining time budget. A run killed by the wall
  // or CPU limit becomes a TOOL_TIMEOUT error, a process that could not be
  // started a TOOL_EXECUTION_ERROR.
  executor::Response RunBounded(executor::Request request) const;
};

// Tool interface. Implementations register themselves by creating a global
// object of type Tool::Register<ToolImpl>; ToolImpl must be default
// constructible and stateless, since a single instance serves every run.
class Tool {
 public:
  // Name the agent uses to call the tool.
  virtual std::string Name() const = 0;

  // One line description, for prompts.
  virtual std::string Description() const = 0;

  // Runs the tool. Arguments are untrusted JSON from the agent. Failures are
  // reported by throwing tool_error or workspace::path_error.
  virtual nlohmann::json Call(const nlohmann::json& args,
                              const ToolContext& context) const = 0;

  virtual ~Tool() = default;
  Tool() = default;
  Tool(const Tool&) = delete;
  Tool(Tool&&) = delete;
  Tool& operator=(const Tool&) = delete;
  Tool& operator=(Tool&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Tool::Register_(std::unique_ptr<Tool>(new T)); }
  };

  // Returns the registered tool called name, or nullptr.
  static const Tool* Find(const std::string& name);

  // Names of all the registered tools, sorted.
  static std::vector<std::string> Names();

 private:
  using store_t = std::vector<std::unique_ptr<Tool>>;
  static store_t* Tools_();
  static void Register_(std::unique_ptr<Tool> tool);
  template <typename T>
  friend class Register;
};

// Argument accessors. They throw a TOOL_EXECUTION_ERROR naming the argument
// when it is missing or has the wrong type.
std::string StringArg(const nlohmann::json& args, const std::string& name);
std::string StringArg(const nlohmann::json& args, const std::string& name,
                      const std::string& fallback);
std::vector<std::string> StringListArg(const nlohmann::json& args,
                                       const std::string& name);

}  // namespace tools

#endif
