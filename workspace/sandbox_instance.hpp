#ifndef WORKSPACE_SANDBOX_INSTANCE_HPP
#define WORKSPACE_SANDBOX_INSTANCE_HPP

#include <string>
#include <vector>

#include "util/file.hpp"
#include "workspace/path_resolver.hpp"

namespace workspace {

// The isolated directory tree of one run. The tree is created empty in a
// fresh temporary folder under base and recursively removed on destruction,
// unless keep is set.
class SandboxInstance {
 public:
  SandboxInstance(const std::string& base, bool keep = false);

  const std::string& Root() const { return resolver_.Root(); }
  const PathResolver& Resolver() const { return resolver_; }

  // Writes a file at a sandbox-relative path, creating parent folders.
  void WriteFile(const std::string& path, const std::string& content);

  // Reads a file at a sandbox-relative path.
  std::string ReadFile(const std::string& path) const;

  // Sandbox-relative paths of all the regular files, sorted.
  std::vector<std::string> ListFiles() const;

  // Renders the file list as a bulleted layout, one "- path" per line.
  std::string Layout() const;

  // KEY=VALUE variables that expose the root to tool subprocesses.
  std::vector<std::string> Environment() const;

  SandboxInstance(const SandboxInstance&) = delete;
  SandboxInstance& operator=(const SandboxInstance&) = delete;
  SandboxInstance(SandboxInstance&&) = delete;
  SandboxInstance& operator=(SandboxInstance&&) = delete;
  ~SandboxInstance();

 private:
  util::TempDir dir_;
  PathResolver resolver_;
};

}  // namespace workspace

#endif
