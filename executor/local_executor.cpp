#include "executor/local_executor.hpp"

#include <signal.h>
#include <unistd.h>

#include <memory>

#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/text.hpp"
#include "util/which.hpp"

extern char** environ;

namespace {
std::vector<std::string> MergeEnvironment(
    const std::vector<std::string>& extra) {
  std::vector<std::string> env;
  for (char** var = environ; var != nullptr && *var != nullptr; var++) {
    std::string entry = *var;
    std::string key = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (const std::string& e : extra) {
      if (e.compare(0, key.size() + 1, key + "=") == 0) overridden = true;
    }
    if (!overridden) env.push_back(std::move(entry));
  }
  env.insert(env.end(), extra.begin(), extra.end());
  return env;
}

std::string ReadOutput(const std::string& path, size_t limit) {
  if (!util::File::Exists(path)) return "";
  std::string data = util::File::Read(path);
  return limit ? util::TrimMiddle(data, limit) : data;
}
}  // namespace

namespace executor {

LocalExecutor::LocalExecutor(std::string temp_directory, size_t max_processes)
    : temp_directory_(std::move(temp_directory)),
      max_processes_(max_processes ? max_processes : 1) {
  util::File::MakeDirs(temp_directory_);
}

Response LocalExecutor::Execute(const Request& request) {
  std::string executable = util::which(request.executable);
  if (executable.empty()) {
    throw execution_failed("Command not found: " + request.executable);
  }

  util::TempDir tmp(temp_directory_);
  sandbox::ExecutionOptions exec_options(request.cwd, executable);
  exec_options.args = request.args;
  if (!request.env.empty()) exec_options.env = MergeEnvironment(request.env);

  // Limits.
  exec_options.limits.cpu_millis = request.cpu_limit_millis;
  exec_options.limits.wall_millis = request.wall_limit_millis;
  exec_options.limits.memory_kb = request.memory_limit_kb;
  exec_options.limits.file_size_kb = request.max_file_size_kb;

  // Stdin/out/err files live outside of the working directory.
  if (!request.stdin_data.empty()) {
    exec_options.stdin_path = util::File::JoinPath(tmp.Path(), "stdin");
    util::File::Write(exec_options.stdin_path, request.stdin_data);
  }
  exec_options.stdout_path = util::File::JoinPath(tmp.Path(), "stdout");
  exec_options.stderr_path = util::File::JoinPath(tmp.Path(), "stderr");

  std::string error_msg;
  sandbox::ExecutionInfo result;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw execution_failed("No sandbox available");
  {
    SlotGuard guard(this);
    VLOG(2) << "Executing " << executable << " in " << request.cwd;
    if (!sb->Execute(exec_options, &result, &error_msg)) {
      throw execution_failed(error_msg);
    }
  }

  Response response;
  response.cpu_time_millis = result.user_millis + result.system_millis;
  response.wall_time_millis = result.wall_millis;
  response.memory_kb = result.peak_memory_kb;
  response.status_code = result.exit_code;
  response.signal = result.signal;

  // Termination status.
  if (result.killed_on_wall_limit) {
    response.status = Status::TIME_LIMIT;
    response.error_message = "Wall limit exceeded";
  } else if (request.cpu_limit_millis &&
             (response.signal == SIGXCPU ||
              response.cpu_time_millis >= request.cpu_limit_millis)) {
    response.status = Status::TIME_LIMIT;
    response.error_message = "CPU limit exceeded";
  } else if (request.memory_limit_kb &&
             response.memory_kb >= request.memory_limit_kb) {
    response.status = Status::MEMORY_LIMIT;
    response.error_message = "Memory limit exceeded";
  } else if (response.signal) {
    response.status = Status::SIGNAL;
    response.error_message = "Killed by signal " + std::to_string(result.signal);
  } else if (response.status_code) {
    response.status = Status::NONZERO;
    response.error_message =
        "Exited with status " + std::to_string(result.exit_code);
  } else {
    response.status = Status::SUCCESS;
  }

  response.stdout_data =
      ReadOutput(exec_options.stdout_path, request.max_output_bytes);
  response.stderr_data =
      ReadOutput(exec_options.stderr_path, request.max_output_bytes);
  return response;
}

LocalExecutor::SlotGuard::SlotGuard(LocalExecutor* executor)
    : executor_(executor) {
  absl::MutexLock lck(&executor_->slots_mutex_);
  auto free_slot = [this]() {
    executor_->slots_mutex_.AssertHeld();
    return executor_->running_ < executor_->max_processes_;
  };
  executor_->slots_mutex_.Await(absl::Condition(&free_slot));
  executor_->running_++;
}

LocalExecutor::SlotGuard::~SlotGuard() {
  absl::MutexLock lck(&executor_->slots_mutex_);
  executor_->running_--;
}

}  // namespace executor
