#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Resource limits of a single command. Zero means unlimited.
struct Limits {
  int64_t cpu_millis = 0;
  int64_t wall_millis = 0;
  int64_t memory_kb = 0;
  int64_t file_size_kb = 0;
  int32_t open_files = 0;
};

// What to run and where. Paths of the redirections are left untouched if
// empty; stdin then reads from /dev/null.
struct ExecutionOptions {
  std::string cwd;
  std::string executable;
  std::vector<std::string> args;
  // KEY=VALUE strings; an empty list inherits the caller's environment.
  std::vector<std::string> env;

  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;

  Limits limits;

  ExecutionOptions(std::string cwd, std::string executable)
      : cwd(std::move(cwd)), executable(std::move(executable)) {}
};

// Resource usage and termination of a finished command.
struct ExecutionInfo {
  int64_t user_millis = 0;
  int64_t system_millis = 0;
  int64_t wall_millis = 0;
  int64_t peak_memory_kb = 0;
  int32_t exit_code = 0;
  int32_t signal = 0;
  bool killed_on_wall_limit = false;
};

// A way of running commands in isolation. Backends register with
//   Sandbox::Register<MyBackend> r("name");
// in an anonymous namespace and provide two static functions: Create, which
// allocates a new instance, and Score, which is negative when the backend is
// unusable on this machine and otherwise ranks it against the others.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Instantiates the named backend, or the best scoring one if name is
  // empty. Returns nullptr if no usable backend matches.
  static std::unique_ptr<Sandbox> Create(const std::string& name = "");

  // Names of all the registered backends.
  static std::vector<std::string> Backends();

  // Runs a command to completion. Returns false with error_msg set if the
  // command could not be started. Instances are not thread-safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const std::string& name) {
      Sandbox::Add(name, &T::Create, &T::Score);
    }
  };

 private:
  struct Backend {
    std::string name;
    create_t create;
    score_t score;
  };
  static std::vector<Backend>* Registry();
  static void Add(const std::string& name, create_t create, score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
