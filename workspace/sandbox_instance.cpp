#include "workspace/sandbox_instance.hpp"

#include "glog/logging.h"

namespace workspace {

SandboxInstance::SandboxInstance(const std::string& base, bool keep)
    : dir_(base), resolver_(dir_.Path()) {
  if (keep) dir_.Keep();
  VLOG(1) << "Created sandbox " << Root();
}

SandboxInstance::~SandboxInstance() { VLOG(1) << "Tearing down " << Root(); }

void SandboxInstance::WriteFile(const std::string& path,
                                const std::string& content) {
  util::File::Write(resolver_.Resolve(path), content);
}

std::string SandboxInstance::ReadFile(const std::string& path) const {
  return util::File::Read(resolver_.Resolve(path));
}

std::vector<std::string> SandboxInstance::ListFiles() const {
  std::vector<std::string> files;
  for (const util::File::Entry& entry : util::File::ListTree(Root())) {
    if (!entry.is_directory) files.push_back(entry.path);
  }
  return files;
}

std::string SandboxInstance::Layout() const {
  std::vector<std::string> files = ListFiles();
  if (files.empty()) return "(empty sandbox)";
  std::string layout;
  for (const std::string& file : files) {
    if (!layout.empty()) layout += '\n';
    layout += "- " + file;
  }
  return layout;
}

std::vector<std::string> SandboxInstance::Environment() const {
  return {std::string(kSandboxEnvVar) + "=" + Root(),
          "PYTHONDONTWRITEBYTECODE=1"};
}

}  // namespace workspace
