#include "tools/tool.hpp"

#include <algorithm>

#include "glog/logging.h"

namespace tools {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PATH_ERROR:
      return "PathError";
    case ErrorKind::NOT_FOUND:
      return "NotFoundError";
    case ErrorKind::IS_A_DIRECTORY:
      return "IsADirectoryError";
    case ErrorKind::FILE_TOO_LARGE:
      return "FileTooLargeError";
    case ErrorKind::TOOL_TIMEOUT:
      return "ToolTimeoutError";
    case ErrorKind::QUERY_ERROR:
      return "QueryError";
    case ErrorKind::EVALUATION_ERROR:
      return "EvaluationError";
    case ErrorKind::TOOL_EXECUTION_ERROR:
      return "ToolExecutionError";
  }
  return "ToolExecutionError";
}

int64_t ToolContext::RemainingMillis() const {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  return std::max<int64_t>(left, 1);
}

void ToolContext::CheckDeadline() const {
  if (std::chrono::steady_clock::now() >= deadline) {
    throw tool_error(ErrorKind::TOOL_TIMEOUT,
                     "Tool call exceeded " +
                         std::to_string(limits.timeout_millis) + "ms");
  }
}

executor::Response ToolContext::RunBounded(executor::Request request) const {
  if (executor == nullptr) {
    throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                     "Subprocesses are not available");
  }
  int64_t remaining = RemainingMillis();
  if (request.wall_limit_millis == 0 || request.wall_limit_millis > remaining) {
    request.wall_limit_millis = remaining;
  }
  request.env.insert(request.env.end(), env.begin(), env.end());

  executor::Response response;
  try {
    response = executor->Execute(request);
  } catch (const executor::execution_failed& exc) {
    throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR, exc.what());
  }
  if (response.status == executor::Status::TIME_LIMIT) {
    throw tool_error(ErrorKind::TOOL_TIMEOUT,
                     request.executable + ": " + response.error_message);
  }
  return response;
}

Tool::store_t* Tool::Tools_() {
  static store_t* tools = new store_t;
  return tools;
}

void Tool::Register_(std::unique_ptr<Tool> tool) {
  CHECK(Find(tool->Name()) == nullptr)
      << "Tool registered twice: " << tool->Name();
  Tools_()->push_back(std::move(tool));
}

const Tool* Tool::Find(const std::string& name) {
  for (const auto& tool : *Tools_()) {
    if (tool->Name() == name) return tool.get();
  }
  return nullptr;
}

std::vector<std::string> Tool::Names() {
  std::vector<std::string> names;
  for (const auto& tool : *Tools_()) names.push_back(tool->Name());
  std::sort(names.begin(), names.end());
  return names;
}

namespace {
[[noreturn]] void BadArgument(const std::string& name, const char* expected) {
  throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                   "Argument '" + name + "' must be " + expected);
}

const nlohmann::json* Lookup(const nlohmann::json& args,
                             const std::string& name) {
  if (!args.is_object()) {
    throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                     "Arguments must be a JSON object");
  }
  auto it = args.find(name);
  if (it == args.end() || it->is_null()) return nullptr;
  return &*it;
}
}  // namespace

std::string StringArg(const nlohmann::json& args, const std::string& name) {
  const nlohmann::json* value = Lookup(args, name);
  if (value == nullptr) {
    throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                     "Missing argument '" + name + "'");
  }
  if (!value->is_string()) BadArgument(name, "a string");
  return value->get<std::string>();
}

std::string StringArg(const nlohmann::json& args, const std::string& name,
                      const std::string& fallback) {
  const nlohmann::json* value = Lookup(args, name);
  if (value == nullptr) return fallback;
  if (!value->is_string()) BadArgument(name, "a string");
  return value->get<std::string>();
}

std::vector<std::string> StringListArg(const nlohmann::json& args,
                                       const std::string& name) {
  std::vector<std::string> list;
  const nlohmann::json* value = Lookup(args, name);
  if (value == nullptr) return list;
  if (!value->is_array()) BadArgument(name, "an array of strings");
  for (const nlohmann::json& item : *value) {
    if (!item.is_string()) BadArgument(name, "an array of strings");
    list.push_back(item.get<std::string>());
  }
  return list;
}

}  // namespace tools
