#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "re2/re2.h"
#include "tools/file_tools.hpp"
#include "util/text.hpp"

namespace tools {

namespace {

const size_t kMaxLineText = 256;
// Lines scanned between two deadline checks.
const size_t kDeadlineStride = 1024;

class GrepSearch : public Tool {
 public:
  std::string Name() const override { return "grep_search"; }
  std::string Description() const override {
    return "grep_search(pattern, path, flags={ignore_case}): lines of a "
           "sandbox file matching a regex, ^ and $ anchor to each line";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string pattern = StringArg(args, "pattern");
    std::string path = StringArg(args, "path");
    bool ignore_case = false;
    auto flags = args.find("flags");
    if (flags != args.end() && !flags->is_null()) {
      if (!flags->is_object()) {
        throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                         "Argument 'flags' must be an object");
      }
      ignore_case = flags->value("ignore_case", false);
    }

    // RE2 syntax; matching is linear in the line length.
    RE2::Options options;
    options.set_case_sensitive(!ignore_case);
    options.set_log_errors(false);
    RE2 re(pattern, options);
    if (!re.ok()) {
      throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                       "Invalid regex '" + pattern + "': " + re.error());
    }

    std::string relative;
    std::string content = ReadSandboxFile(context, path, &relative);

    // A trailing newline ends the last line, it does not start a new one.
    absl::string_view text(content);
    if (!text.empty() && text.back() == '\n') text.remove_suffix(1);

    nlohmann::json matches = nlohmann::json::array();
    size_t line_number = 0;
    for (absl::string_view piece : absl::StrSplit(text, '\n')) {
      if (content.empty()) break;
      line_number++;
      if (line_number % kDeadlineStride == 0) context.CheckDeadline();
      if (!piece.empty() && piece.back() == '\r') piece.remove_suffix(1);
      if (!RE2::PartialMatch(re2::StringPiece(piece.data(), piece.size()),
                             re)) {
        continue;
      }
      std::string line(piece);
      nlohmann::json match;
      match["file"] = relative;
      match["line_number"] = line_number;
      match["line_text"] = util::Truncate(line, kMaxLineText);
      matches.push_back(match);
    }
    VLOG(2) << "grep_search " << pattern << " in " << relative << ": "
            << matches.size() << " matches";

    nlohmann::json result;
    result["matches"] = matches;
    return result;
  }
};

Tool::Register<GrepSearch> r;

}  // namespace

}  // namespace tools
