#include "manager/tool_session.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace manager {

ToolSession::ToolSession(const tools::ToolRegistry* registry,
                         std::vector<std::string> allowed_tools,
                         int32_t index, int32_t max_steps,
                         std::chrono::steady_clock::time_point deadline,
                         EventQueue* queue)
    : registry_(registry),
      allowed_tools_(std::move(allowed_tools)),
      index_(index),
      max_steps_(max_steps),
      deadline_(deadline),
      queue_(queue) {}

nlohmann::json ToolSession::Call(const std::string& name,
                                 const nlohmann::json& arguments) {
  if (StepsLeft() <= 0) {
    throw budget_exceeded(
        absl::StrCat("Step budget of ", max_steps_, " tool calls exhausted"));
  }
  if (std::chrono::steady_clock::now() >= deadline_) {
    throw budget_exceeded("Run wall clock budget exhausted");
  }

  tools::ToolCall call;
  if (std::find(allowed_tools_.begin(), allowed_tools_.end(), name) ==
      allowed_tools_.end()) {
    call.name = name;
    call.arguments = arguments;
    call.error = tools::ToolFailure{
        tools::ErrorKind::TOOL_EXECUTION_ERROR,
        "Tool " + name + " is not available for this task"};
    call.output_bytes =
        call.Response()
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            .size();
  } else {
    call = registry_->Invoke(name, arguments, deadline_);
  }
  LOG(INFO) << "Run " << index_ << ": " << name
            << (call.ok() ? "" : std::string(" failed with ") +
                                     tools::ErrorKindName(call.error->kind));
  if (queue_) {
    queue_->ToolCalled(index_, name,
                       call.ok() ? "" : tools::ErrorKindName(call.error->kind),
                       call.elapsed_micros);
  }
  transcript_.push_back(std::move(call));
  return transcript_.back().Response();
}

}  // namespace manager
