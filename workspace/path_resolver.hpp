#ifndef WORKSPACE_PATH_RESOLVER_HPP
#define WORKSPACE_PATH_RESOLVER_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace workspace {

// Raised when a path would leave the sandbox root.
class path_error : public std::runtime_error {
 public:
  explicit path_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Environment variable holding the sandbox root of the current run.
static const constexpr char* kSandboxEnvVar = "HPY_SANDBOX";

// Confines paths to a sandbox root. Resolution is lexical: "." and ".."
// segments are folded without touching the filesystem, and the target does
// not need to exist. The only filesystem accesses are lstat/realpath on the
// existing prefix of the path, to reject symbolic links leading outside of
// the root.
class PathResolver {
 public:
  // root must be an existing directory; it is canonicalized.
  explicit PathResolver(const std::string& root);

  // Returns the absolute path of path inside the root. Accepts paths relative
  // to the root, absolute paths under the root and paths prefixed by a
  // reference to the sandbox variable ($HPY_SANDBOX/...). Throws path_error
  // otherwise.
  std::string Resolve(const std::string& path) const;

  // Like Resolve, but returns the path relative to the root ("" for the root
  // itself).
  std::string ResolveRelative(const std::string& path) const;

  // Returns absolute relative to the root. absolute must be inside the root.
  std::string Relative(const std::string& absolute) const;

  // True if absolute is the root or lies below it.
  bool Contains(const std::string& absolute) const;

  const std::string& Root() const { return root_; }

  // Removes a leading $HPY_SANDBOX or ${HPY_SANDBOX} from path, if any.
  static std::string StripRootReference(const std::string& path);

  // Splits path in segments, dropping empty and "." ones and folding "..".
  // Sets escapes if a ".." would climb above the first segment.
  static std::vector<std::string> Normalize(const std::string& path,
                                            bool* escapes);

 private:
  void CheckSymlinks(const std::vector<std::string>& segments) const;

  std::string root_;
};

}  // namespace workspace

#endif
