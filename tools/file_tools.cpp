#include "tools/file_tools.hpp"

#include "glog/logging.h"
#include "util/file.hpp"

namespace tools {

std::string ReadSandboxFile(const ToolContext& context,
                            const std::string& path, std::string* relative) {
  std::string absolute = context.resolver->Resolve(path);
  *relative = context.resolver->Relative(absolute);
  if (!util::File::Exists(absolute)) {
    throw tool_error(ErrorKind::NOT_FOUND, "No such file: " + path);
  }
  if (util::File::IsDirectory(absolute)) {
    throw tool_error(ErrorKind::IS_A_DIRECTORY,
                     path + " is a directory, list it with glob_find first");
  }
  int64_t size = util::File::Size(absolute);
  if (size > context.limits.max_read_bytes) {
    throw tool_error(ErrorKind::FILE_TOO_LARGE,
                     path + " has " + std::to_string(size) +
                         " bytes, the limit is " +
                         std::to_string(context.limits.max_read_bytes));
  }
  try {
    return util::File::Read(absolute);
  } catch (const util::file_not_found&) {
    throw tool_error(ErrorKind::NOT_FOUND, "No such file: " + path);
  }
}

namespace {

class FileRead : public Tool {
 public:
  std::string Name() const override { return "file_read"; }
  std::string Description() const override {
    return "file_read(path): full text of a sandbox file";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string relative;
    std::string content =
        ReadSandboxFile(context, StringArg(args, "path"), &relative);
    nlohmann::json result;
    result["content"] = content;
    result["bytes"] = content.size();
    return result;
  }
};

class FileWrite : public Tool {
 public:
  std::string Name() const override { return "file_write"; }
  std::string Description() const override {
    return "file_write(path, content): create or replace a sandbox file, "
           "creating parent folders";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string path = StringArg(args, "path");
    std::string content = StringArg(args, "content");
    std::string absolute = context.resolver->Resolve(path);
    if (absolute == context.resolver->Root() ||
        util::File::IsDirectory(absolute)) {
      throw tool_error(ErrorKind::IS_A_DIRECTORY, path + " is a directory");
    }
    util::File::Write(absolute, content);
    VLOG(2) << "file_write " << absolute << " (" << content.size() << " bytes)";
    nlohmann::json result;
    result["ok"] = true;
    result["bytes"] = content.size();
    return result;
  }
};

Tool::Register<FileRead> r_read;
Tool::Register<FileWrite> r_write;

}  // namespace

}  // namespace tools
