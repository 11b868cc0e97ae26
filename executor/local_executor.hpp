#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace executor {

// Raised when the sandbox could not start the process at all.
class execution_failed : public std::runtime_error {
 public:
  explicit execution_failed(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A command to run. executable is looked up in PATH if it contains no slash.
struct Request {
  std::string executable;
  std::vector<std::string> args;
  // Working directory of the process.
  std::string cwd;
  // Extra KEY=VALUE variables, added to the environment of this process.
  std::vector<std::string> env;
  std::string stdin_data;

  int64_t wall_limit_millis = 0;
  int64_t cpu_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  // Captured stdout and stderr keep only head and tail past this size.
  size_t max_output_bytes = 0;
};

enum class Status { SUCCESS, NONZERO, SIGNAL, TIME_LIMIT, MEMORY_LIMIT };

struct Response {
  Status status = Status::SUCCESS;
  int32_t status_code = 0;
  int32_t signal = 0;
  std::string stdout_data;
  std::string stderr_data;
  int64_t cpu_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_kb = 0;
  std::string error_message;
};

// Runs bounded subprocesses through the best available sandbox, at most
// max_processes of them at the same time. Callers over the bound block until
// a slot is free. Thread safe.
class LocalExecutor {
 public:
  LocalExecutor(std::string temp_directory, size_t max_processes);

  // Throws execution_failed if the process could not be started.
  Response Execute(const Request& request);

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() = default;

 private:
  class SlotGuard {
   public:
    explicit SlotGuard(LocalExecutor* executor);
    ~SlotGuard();
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;
    SlotGuard(SlotGuard&&) = delete;
    SlotGuard& operator=(SlotGuard&&) = delete;

   private:
    LocalExecutor* executor_;
  };

  std::string temp_directory_;
  size_t max_processes_;
  absl::Mutex slots_mutex_;
  size_t running_ GUARDED_BY(slots_mutex_) = 0;
};

}  // namespace executor

#endif
