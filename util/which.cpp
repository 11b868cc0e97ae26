#include "util/which.hpp"

#include <unistd.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "util/file.hpp"

namespace {
absl::Mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache GUARDED_BY(cache_mutex);

bool is_executable(const std::string& path) {
  return !util::File::IsDirectory(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  absl::MutexLock lck(&cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) return cmd_cache[cmd] = fullpath;
  }

  return cmd_cache[cmd] = "";
}

}  // namespace util
