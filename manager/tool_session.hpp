#ifndef MANAGER_TOOL_SESSION_HPP
#define MANAGER_TOOL_SESSION_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "manager/event_queue.hpp"
#include "nlohmann/json.hpp"
#include "tools/tool_registry.hpp"

namespace manager {

// Raised when a run uses up its step or wall clock budget. It ends the run,
// which is then recorded as failed.
class budget_exceeded : public std::runtime_error {
 public:
  explicit budget_exceeded(const std::string& msg) : std::runtime_error(msg) {}
};

// The handle an agent calls tools through during one run. Calls are served
// one at a time, in order, and recorded in the transcript.
class ToolSession {
 public:
  // queue may be null.
  ToolSession(const tools::ToolRegistry* registry,
              std::vector<std::string> allowed_tools, int32_t index,
              int32_t max_steps,
              std::chrono::steady_clock::time_point deadline,
              EventQueue* queue);

  // Calls tool name and returns what the agent sees, {"result": ...} or
  // {"error": {"kind", "message"}}. Tools outside of the allowed set are
  // refused with a ToolExecutionError. Throws budget_exceeded if no step or
  // no time is left. A call never runs past the run deadline.
  nlohmann::json Call(const std::string& name, const nlohmann::json& arguments);

  const std::vector<tools::ToolCall>& Transcript() const { return transcript_; }
  int32_t Index() const { return index_; }
  int32_t StepsLeft() const {
    return max_steps_ - static_cast<int32_t>(transcript_.size());
  }

 private:
  const tools::ToolRegistry* registry_;
  std::vector<std::string> allowed_tools_;
  int32_t index_;
  int32_t max_steps_;
  std::chrono::steady_clock::time_point deadline_;
  EventQueue* queue_;
  std::vector<tools::ToolCall> transcript_;
};

}  // namespace manager

#endif
