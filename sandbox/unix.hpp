#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// fork+exec backend. The command leads its own session, runs under
// setrlimit limits, and its whole process group is killed when it exits or
// the wall clock runs out.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  // Opens the pipe the child reports startup errors on.
  bool OpenErrorPipe(std::string* error_msg);

  bool Spawn(std::string* error_msg);

  // Runs in the child after fork; execs or exits.
  [[noreturn]] void Child();

  bool Reap(ExecutionInfo* info, std::string* error_msg);

  int error_pipe_[2] = {};
  int child_pid_ = 0;
  // Built by Spawn before forking, so that the child never allocates.
  char** child_args_ = nullptr;
  char** child_env_ = nullptr;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
