#include "tools/pytest.hpp"

#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "re2/re2.h"
#include "tools/tool.hpp"
#include "util/text.hpp"

namespace tools {

namespace {
// Enough for the summary at the end to survive trimming.
const size_t kCaptureBytes = 1 << 20;
}  // namespace

PytestSummary ParsePytestSummary(const std::string& output) {
  static const RE2 count_re("(\\d+) (passed|failed|errors?)\\b");
  PytestSummary summary;
  for (absl::string_view line : absl::StrSplit(output, '\n')) {
    re2::StringPiece input(line.data(), line.size());
    std::string digits;
    std::string label;
    bool seen = false;
    while (RE2::FindAndConsume(&input, count_re, &digits, &label)) {
      if (!seen) {
        summary = PytestSummary();
        summary.found = true;
        seen = true;
      }
      // Counts that do not fit are echoed test output, not a summary.
      int64_t count = 0;
      if (!absl::SimpleAtoi(digits, &count)) continue;
      if (label == "passed") {
        summary.passed = count;
      } else if (label == "failed") {
        summary.failed = count;
      } else {
        summary.errors = count;
      }
    }
  }
  return summary;
}

executor::Request PytestRequest(const std::string& python,
                                const std::string& cwd) {
  executor::Request request;
  request.executable = python;
  request.args = {"-m", "pytest", "-q", "-p", "no:cacheprovider"};
  request.cwd = cwd;
  request.env = {"PYTHONDONTWRITEBYTECODE=1"};
  request.max_output_bytes = kCaptureBytes;
  return request;
}

namespace {

class RunPytests : public Tool {
 public:
  std::string Name() const override { return "run_pytests"; }
  std::string Description() const override {
    return "run_pytests(): run the pytest suite at the sandbox root";
  }

  nlohmann::json Call(const nlohmann::json& /*args*/,
                      const ToolContext& context) const override {
    executor::Request request =
        PytestRequest(context.limits.python, context.resolver->Root());
    executor::Response response = context.RunBounded(request);

    PytestSummary summary = ParsePytestSummary(response.stdout_data);
    std::string output = response.stdout_data;
    if (!response.stderr_data.empty()) {
      if (!output.empty() && output.back() != '\n') output += '\n';
      output += response.stderr_data;
    }
    int32_t exit_code = response.status == executor::Status::SIGNAL
                            ? 128 + response.signal
                            : response.status_code;
    VLOG(1) << "run_pytests: exit " << exit_code << ", " << summary.passed
            << " passed, " << summary.failed << " failed";

    nlohmann::json result;
    result["exit_code"] = exit_code;
    result["tests_passed"] = summary.passed;
    result["tests_failed"] = summary.failed + summary.errors;
    result["captured_output"] =
        util::TrimMiddle(output, context.limits.max_output_bytes);
    return result;
  }
};

Tool::Register<RunPytests> r;

}  // namespace

}  // namespace tools
