#include "tools/glob.hpp"

#include <algorithm>

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "tools/tool.hpp"
#include "util/file.hpp"

namespace tools {

std::string GlobToRegex(const std::string& pattern) {
  std::string out = "^";
  if (pattern.find('/') == std::string::npos) out += "(?:.*/)?";
  for (size_t i = 0; i < pattern.size(); i++) {
    char c = pattern[i];
    if (c == '*') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        i++;
        if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
          i++;
          out += "(?:.*/)?";
        } else {
          out += ".*";
        }
      } else {
        out += "[^/]*";
      }
      continue;
    }
    if (c == '?') {
      out += "[^/]";
      continue;
    }
    if (c == '[') {
      size_t j = i + 1;
      if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) j++;
      if (j < pattern.size() && pattern[j] == ']') j++;
      while (j < pattern.size() && pattern[j] != ']') j++;
      if (j < pattern.size()) {
        out += '[';
        size_t k = i + 1;
        if (pattern[k] == '!' || pattern[k] == '^') {
          out += '^';
          k++;
        }
        for (; k < j; k++) {
          if (pattern[k] == '\\' || pattern[k] == '[' || pattern[k] == ']') {
            out += '\\';
          }
          out += pattern[k];
        }
        out += ']';
        i = j;
        continue;
      }
    }
    if (std::string(".^$|()[]{}+\\").find(c) != std::string::npos) {
      out += '\\';
    }
    out += c;
  }
  out += '$';
  return out;
}

GlobMatcher::GlobMatcher(const std::vector<std::string>& patterns) {
  RE2::Options options;
  options.set_log_errors(false);
  for (const std::string& pattern : patterns) {
    auto re = absl::make_unique<RE2>(GlobToRegex(pattern), options);
    if (!re->ok()) {
      throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                       "Invalid glob pattern '" + pattern + "': " + re->error());
    }
    regexes_.push_back(std::move(re));
  }
}

bool GlobMatcher::Matches(const std::string& path) const {
  for (const std::unique_ptr<RE2>& re : regexes_) {
    if (RE2::FullMatch(path, *re)) return true;
  }
  return false;
}

std::string RelativePattern(const std::string& pattern,
                            const workspace::PathResolver& resolver) {
  std::string relative = workspace::PathResolver::StripRootReference(pattern);
  if (relative != pattern) {
    relative.erase(0, relative.find_first_not_of('/'));
  } else if (absl::StartsWith(relative, "/")) {
    const std::string& root = resolver.Root();
    if (relative == root) {
      relative = "";
    } else if (absl::StartsWith(relative, root + "/")) {
      relative = relative.substr(root.size() + 1);
    } else {
      throw workspace::path_error("Absolute pattern outside of the sandbox: " +
                                  pattern);
    }
  }
  while (absl::StartsWith(relative, "./")) relative.erase(0, 2);
  for (absl::string_view segment : absl::StrSplit(relative, '/')) {
    if (segment == "..") {
      throw workspace::path_error("Pattern escapes the sandbox: " + pattern);
    }
  }
  return relative;
}

namespace {

class GlobFind : public Tool {
 public:
  std::string Name() const override { return "glob_find"; }
  std::string Description() const override {
    return "glob_find(pattern, exclude=[]): sandbox-relative files matching a "
           "glob (** descends into folders), sorted";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string pattern =
        RelativePattern(StringArg(args, "pattern", ""), *context.resolver);
    std::vector<std::string> exclude;
    for (const std::string& rule : StringListArg(args, "exclude")) {
      exclude.push_back(RelativePattern(rule, *context.resolver));
    }

    // A trailing separator selects folders instead of files.
    bool directories = absl::EndsWith(pattern, "/");
    while (absl::EndsWith(pattern, "/")) pattern.pop_back();
    if (pattern.empty()) pattern = "**";

    GlobMatcher include({pattern});
    GlobMatcher excluded(exclude);

    std::vector<std::string> paths;
    for (const util::File::Entry& entry :
         util::File::ListTree(context.resolver->Root())) {
      context.CheckDeadline();
      if (entry.is_directory != directories) continue;
      if (!include.Matches(entry.path) || excluded.Matches(entry.path)) {
        continue;
      }
      paths.push_back(directories ? entry.path + "/" : entry.path);
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    VLOG(2) << "glob_find " << pattern << ": " << paths.size() << " matches";

    nlohmann::json result;
    result["paths"] = paths;
    return result;
  }
};

Tool::Register<GlobFind> r;

}  // namespace

}  // namespace tools
