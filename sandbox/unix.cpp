#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// NUL-terminated copies of a list of strings, laid out for exec*.
class ArgList {
 public:
  void Add(const std::string& arg) {
    storage_.emplace_back(arg.begin(), arg.end());
    storage_.back().push_back(0);
  }
  char** Get() {
    pointers_.clear();
    for (std::vector<char>& arg : storage_) pointers_.push_back(arg.data());
    pointers_.push_back(nullptr);
    return pointers_.data();
  }
  bool Empty() const { return storage_.empty(); }

 private:
  std::vector<std::vector<char>> storage_;
  std::vector<char*> pointers_;
};
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr auto kPollInterval = std::chrono::milliseconds(5);

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!OpenErrorPipe(error_msg)) return false;
  if (!Spawn(error_msg)) return false;
  if (!Reap(info, error_msg)) return false;
  return true;
}

bool Unix::OpenErrorPipe(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(error_pipe_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::Spawn(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // The child must not allocate memory, as other threads of this process may
  // hold the allocator lock when fork happens: prepare exec arguments here.
  ArgList args;
  args.Add(options_->executable);
  for (const std::string& arg : options_->args) args.Add(arg);
  ArgList env;
  for (const std::string& var : options_->env) env.Add(var);
  child_args_ = args.Get();
  child_env_ = env.Empty() ? nullptr : env.Get();

  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(error_pipe_[0]);
    close(error_pipe_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    child_args_ = nullptr;
    child_env_ = nullptr;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(error_pipe_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(error_pipe_[1], &len, sizeof(len)) == sizeof(len)) {
      ssize_t ignored = write(error_pipe_[1], buf, len);
      (void)ignored;
    }
    close(error_pipe_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (options_->stdin_path != "") {
    stdin_fd = open(options_->stdin_path.c_str(), O_RDONLY);
  } else {
    stdin_fd = open("/dev/null", O_RDONLY);
  }
  if (stdin_fd == -1) die("open", errno);
  if (options_->stdout_path != "") {
    stdout_fd = creat(options_->stdout_path.c_str(), S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (options_->stderr_path != "") {
    stderr_fd = creat(options_->stderr_path.c_str(), S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  if (chdir(options_->cwd.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->limits.memory_kb * 1024);
  SET_RLIM(CPU, (options_->limits.cpu_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->limits.file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->limits.open_files);
#undef SET_RLIM

  int count = 0;
  do {
    if (child_env_ != nullptr) {
      execve(options_->executable.c_str(), child_args_, child_env_);
    } else {
      execv(options_->executable.c_str(), child_args_);
    }
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Reap(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(error_pipe_[1]);
  int error_len = 0;
  if (read(error_pipe_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(error_pipe_[0], error, error_len) < 0) error[0] = 0;
    *error_msg = error;
    close(error_pipe_[0]);
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(error_pipe_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // wait4 is used instead of waitpid because it also reports the resource
  // usage of the child.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (elapsed_millis() < options_->limits.wall_millis) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!has_exited && options_->limits.wall_millis) {
    info->killed_on_wall_limit = true;
    kill(-child_pid_, SIGKILL);
  }
  while (!has_exited) {
    int ret = wait4(child_pid_, &child_status, 0, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret != child_pid_) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    has_exited = true;
  }
  // Leftover processes of the group (e.g. test workers) die with the leader.
  kill(-child_pid_, SIGKILL);

  info->peak_memory_kb = rusage.ru_maxrss;
  info->exit_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_millis = elapsed_millis();
  info->user_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->system_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

namespace {
Sandbox::Register<Unix> r("unix");
}  // namespace

}  // namespace sandbox
