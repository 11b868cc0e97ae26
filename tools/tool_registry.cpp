#include "tools/tool_registry.hpp"

#include <algorithm>
#include <system_error>

#include "glog/logging.h"

namespace tools {

nlohmann::json ToolCall::Response() const {
  nlohmann::json response;
  if (error) {
    response["error"]["kind"] = ErrorKindName(error->kind);
    response["error"]["message"] = error->message;
  } else {
    response["result"] = result;
  }
  return response;
}

ToolRegistry::ToolRegistry(const workspace::PathResolver* resolver,
                           executor::LocalExecutor* executor,
                           ToolLimits limits, std::vector<std::string> env) {
  base_context_.resolver = resolver;
  base_context_.executor = executor;
  base_context_.limits = std::move(limits);
  base_context_.env = std::move(env);
}

ToolCall ToolRegistry::Invoke(
    const std::string& name, const nlohmann::json& arguments,
    std::chrono::steady_clock::time_point run_deadline) const {
  ToolCall call;
  call.name = name;
  call.arguments = arguments;

  ToolContext context = base_context_;
  auto start = std::chrono::steady_clock::now();
  context.deadline = std::min(
      start + std::chrono::milliseconds(context.limits.timeout_millis),
      run_deadline);

  auto fail = [&call](ErrorKind kind, const std::string& message) {
    call.result = nullptr;
    call.error = ToolFailure{kind, message};
  };

  const Tool* tool = Tool::Find(name);
  if (tool == nullptr) {
    fail(ErrorKind::TOOL_EXECUTION_ERROR, "Unknown tool: " + name);
  } else {
    try {
      call.result = tool->Call(arguments, context);
    } catch (const workspace::path_error& exc) {
      fail(ErrorKind::PATH_ERROR, exc.what());
    } catch (const tool_error& exc) {
      fail(exc.kind(), exc.what());
    } catch (const nlohmann::json::exception& exc) {
      fail(ErrorKind::TOOL_EXECUTION_ERROR, exc.what());
    } catch (const std::system_error& exc) {
      fail(ErrorKind::TOOL_EXECUTION_ERROR, exc.what());
    } catch (const std::exception& exc) {
      LOG(WARNING) << "Tool " << name << " raised " << exc.what();
      fail(ErrorKind::TOOL_EXECUTION_ERROR,
           std::string("Internal tool error: ") + exc.what());
    }
  }

  auto elapsed = std::chrono::steady_clock::now() - start;
  call.elapsed_micros =
      std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
  // A result delivered after the deadline is not delivered at all.
  if (call.ok() && start + elapsed > context.deadline) {
    fail(ErrorKind::TOOL_TIMEOUT,
         context.deadline < run_deadline
             ? "Tool call exceeded " +
                   std::to_string(context.limits.timeout_millis) + "ms"
             : std::string("Tool call ran past the run deadline"));
  }
  call.output_bytes =
      call.Response()
          .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
          .size();

  if (call.ok()) {
    VLOG(1) << "Tool " << name << " ok in " << call.elapsed_micros << "us";
  } else {
    LOG_IF(WARNING, call.error->kind == ErrorKind::TOOL_TIMEOUT)
        << "Tool " << name << " timed out";
    VLOG(1) << "Tool " << name << " failed: "
            << ErrorKindName(call.error->kind) << ": " << call.error->message;
  }
  return call;
}

}  // namespace tools
