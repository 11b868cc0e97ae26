#ifndef TOOLS_FILE_TOOLS_HPP
#define TOOLS_FILE_TOOLS_HPP

#include <string>

#include "tools/tool.hpp"

namespace tools {

// Reads a regular file at a user supplied path, within the read budget of
// context. Sets relative to the sandbox-relative path of the file.
// Throws path_error, or tool_error with NOT_FOUND, IS_A_DIRECTORY or
// FILE_TOO_LARGE.
std::string ReadSandboxFile(const ToolContext& context,
                            const std::string& path, std::string* relative);

}  // namespace tools

#endif
