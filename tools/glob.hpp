#ifndef TOOLS_GLOB_HPP
#define TOOLS_GLOB_HPP

#include <memory>
#include <string>
#include <vector>

#include "re2/re2.h"
#include "workspace/path_resolver.hpp"

namespace tools {

// Translates a shell glob over sandbox-relative paths into an RE2 regex.
// "*" and "?" never match "/", "**" matches any number of whole path
// segments and [...] / [!...] are character classes. A pattern without any
// "/" is matched against the file name at any depth. Dotfiles are not
// special.
std::string GlobToRegex(const std::string& pattern);

// A compiled set of globs. Throws tool_error on invalid patterns.
class GlobMatcher {
 public:
  explicit GlobMatcher(const std::vector<std::string>& patterns);

  // True if path matches at least one of the patterns.
  bool Matches(const std::string& path) const;

 private:
  std::vector<std::unique_ptr<RE2>> regexes_;
};

// Turns a user supplied pattern into one relative to the sandbox root.
// Accepts a leading $HPY_SANDBOX or an absolute prefix equal to the root.
// Throws workspace::path_error on any ".." segment or on an absolute pattern
// outside of the root.
std::string RelativePattern(const std::string& pattern,
                            const workspace::PathResolver& resolver);

}  // namespace tools

#endif
