#include "workspace/path_resolver.hpp"

#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace workspace {

PathResolver::PathResolver(const std::string& root) {
  char buf[PATH_MAX] = {};
  if (realpath(root.c_str(), buf) == nullptr || !util::File::IsDirectory(buf)) {
    throw path_error("Sandbox root does not exist: " + root);
  }
  root_ = buf;
}

std::vector<std::string> PathResolver::Normalize(const std::string& path,
                                                 bool* escapes) {
  *escapes = false;
  std::vector<std::string> segments;
  for (absl::string_view part : absl::StrSplit(path, '/')) {
    if (part.empty() || part == ".") continue;
    if (part == "..") {
      if (segments.empty()) {
        *escapes = true;
      } else {
        segments.pop_back();
      }
      continue;
    }
    segments.emplace_back(part);
  }
  return segments;
}

bool PathResolver::Contains(const std::string& absolute) const {
  if (root_ == "/") return !absolute.empty() && absolute[0] == '/';
  return absolute == root_ ||
         (absolute.size() > root_.size() &&
          absolute.compare(0, root_.size(), root_) == 0 &&
          absolute[root_.size()] == '/');
}

std::string PathResolver::StripRootReference(const std::string& path) {
  for (const char* marker : {"${HPY_SANDBOX}", "$HPY_SANDBOX"}) {
    std::string prefix = marker;
    if (path.compare(0, prefix.size(), prefix) == 0) {
      return path.substr(prefix.size());
    }
  }
  return path;
}

std::string PathResolver::Resolve(const std::string& path) const {
  std::string candidate = StripRootReference(path);
  std::string relative = candidate;
  if (!candidate.empty() && candidate[0] == '/' && candidate != path) {
    relative = candidate.substr(1);
  } else if (!candidate.empty() && candidate[0] == '/') {
    bool escapes = false;
    std::string normalized =
        "/" + absl::StrJoin(Normalize(candidate, &escapes), "/");
    if (!Contains(normalized)) {
      throw path_error("Absolute path outside of the sandbox: " + path);
    }
    relative = normalized.substr(root_ == "/" ? 1 : root_.size());
  }

  bool escapes = false;
  std::vector<std::string> segments = Normalize(relative, &escapes);
  if (escapes) throw path_error("Path escapes the sandbox: " + path);
  CheckSymlinks(segments);
  if (segments.empty()) return root_;
  return util::File::JoinPath(root_, absl::StrJoin(segments, "/"));
}

std::string PathResolver::ResolveRelative(const std::string& path) const {
  return Relative(Resolve(path));
}

std::string PathResolver::Relative(const std::string& absolute) const {
  if (!Contains(absolute)) {
    throw path_error("Path outside of the sandbox: " + absolute);
  }
  if (absolute == root_) return "";
  return absolute.substr(root_ == "/" ? 1 : root_.size() + 1);
}

void PathResolver::CheckSymlinks(
    const std::vector<std::string>& segments) const {
  std::string current = root_;
  for (const std::string& segment : segments) {
    current = util::File::JoinPath(current, segment);
    struct stat st {};
    // Nothing below a missing component can exist.
    if (lstat(current.c_str(), &st) == -1) return;
    if (!S_ISLNK(st.st_mode)) continue;

    char buf[PATH_MAX] = {};
    if (realpath(current.c_str(), buf) != nullptr) {
      if (!Contains(buf)) {
        throw path_error("Symbolic link leads outside of the sandbox: " +
                         Relative(current));
      }
      current = buf;
      continue;
    }
    // Dangling link: judge its target lexically.
    ssize_t len = readlink(current.c_str(), buf, sizeof(buf) - 1);
    if (len < 0) return;
    std::string target(buf, len);
    if (target.empty() || target[0] != '/') {
      target = util::File::JoinPath(util::File::BaseDir(current), target);
    }
    bool escapes = false;
    std::string normalized =
        "/" + absl::StrJoin(Normalize(target, &escapes), "/");
    if (escapes || !Contains(normalized)) {
      throw path_error("Symbolic link leads outside of the sandbox: " +
                       Relative(current));
    }
    return;
  }
}

}  // namespace workspace
