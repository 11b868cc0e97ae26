#include "grading/patch_grader.hpp"

#include <algorithm>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "re2/re2.h"
#include "tools/pytest.hpp"
#include "util/file.hpp"
#include "util/text.hpp"

namespace grading {

namespace {
const size_t kDetailBytes = 2000;

std::string NormalizeHeaderPath(std::string path, const std::string& root,
                                const std::string& project_dir) {
  if (path == "/dev/null") return path;
  if (absl::StartsWith(path, "a/") || absl::StartsWith(path, "b/")) {
    path = path.substr(2);
  }
  while (absl::StartsWith(path, "./")) path = path.substr(2);
  if (!project_dir.empty() &&
      !absl::StartsWith(path, project_dir + "/") &&
      !util::File::Exists(util::File::JoinPath(root, path)) &&
      util::File::Exists(
          util::File::JoinPath(util::File::JoinPath(root, project_dir), path))) {
    path = project_dir + "/" + path;
  }
  return path;
}

// Patch runs at -p0 from root, fuzzy on context but never leaving rejects or
// backups behind.
executor::Request PatchRequest(const std::string& root,
                               const std::string& patch, bool dry_run) {
  executor::Request request;
  request.executable = "patch";
  request.args = {"-p0", "--batch", "--forward", "--no-backup-if-mismatch",
                  "--reject-file=-"};
  if (dry_run) request.args.push_back("--dry-run");
  request.cwd = root;
  request.stdin_data = patch;
  request.wall_limit_millis = 30000;
  request.max_output_bytes = kDetailBytes;
  return request;
}

// Timings would make two gradings of the same run differ.
std::string StripTimings(const std::string& output) {
  static const RE2 timing_re(" in [0-9]+(\\.[0-9]+)?s\\b");
  std::string stripped = output;
  RE2::GlobalReplace(&stripped, timing_re, "");
  return stripped;
}

// Every file name a patch may write to: ---/+++ headers, plus the Index: and
// "diff --git" lines GNU patch also reads names from.
std::vector<std::string> PatchedPaths(const std::string& patch) {
  std::vector<std::string> paths;
  for (absl::string_view line : absl::StrSplit(patch, '\n')) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    std::vector<std::string> names;
    if (absl::ConsumePrefix(&line, "--- ") ||
        absl::ConsumePrefix(&line, "+++ ") ||
        absl::ConsumePrefix(&line, "Index: ")) {
      names.emplace_back(line.substr(0, line.find('\t')));
    } else if (absl::ConsumePrefix(&line, "diff --git ")) {
      for (absl::string_view name :
           absl::StrSplit(line, ' ', absl::SkipEmpty())) {
        names.emplace_back(name);
      }
    }
    for (std::string& name : names) {
      if (name == "/dev/null") continue;
      if (absl::StartsWith(name, "a/") || absl::StartsWith(name, "b/")) {
        name = name.substr(2);
      }
      paths.push_back(name);
    }
  }
  return paths;
}

// Puts the test suite of pristine back into patched, dropping test files the
// patch added.
void RestoreTestSuite(const workspace::SandboxInstance& pristine,
                      workspace::SandboxInstance* patched) {
  std::vector<std::string> original = pristine.ListFiles();
  for (const std::string& path : patched->ListFiles()) {
    if (IsTestPath(path) &&
        std::find(original.begin(), original.end(), path) == original.end()) {
      util::File::Remove(util::File::JoinPath(patched->Root(), path));
    }
  }
  for (const std::string& path : original) {
    if (IsTestPath(path)) patched->WriteFile(path, pristine.ReadFile(path));
  }
}

GradeResult NotApplied(const std::string& detail) {
  GradeResult result;
  result.signals["patch_applied"] = 0;
  result.detail = util::TrimMiddle(detail, kDetailBytes);
  return result;
}
}  // namespace

bool IsTestPath(const std::string& path) {
  std::vector<std::string> segments =
      absl::StrSplit(path, '/', absl::SkipEmpty());
  if (segments.empty()) return false;
  for (size_t i = 0; i + 1 < segments.size(); i++) {
    if (segments[i] == "tests" || segments[i] == "test") return true;
  }
  const std::string& name = segments.back();
  static const char* kConfigFiles[] = {"conftest.py", "pytest.ini", "tox.ini",
                                       "setup.cfg", "pyproject.toml"};
  for (const char* config : kConfigFiles) {
    if (name == config) return true;
  }
  return absl::EndsWith(name, ".py") && (absl::StartsWith(name, "test_") ||
                                         absl::EndsWith(name, "_test.py"));
}

std::string NormalizePatch(const std::string& patch, const std::string& root,
                           const std::string& project_dir) {
  std::vector<std::string> lines = absl::StrSplit(patch, '\n');
  for (std::string& line : lines) {
    if (!absl::StartsWith(line, "--- ") && !absl::StartsWith(line, "+++ ")) {
      continue;
    }
    std::string header = line.substr(4);
    std::string suffix;
    size_t tab = header.find('\t');
    if (tab != std::string::npos) {
      suffix = header.substr(tab);
      header = header.substr(0, tab);
    }
    line = line.substr(0, 4) + NormalizeHeaderPath(header, root, project_dir) +
           suffix;
  }
  std::string normalized = absl::StrJoin(lines, "\n");
  if (!normalized.empty() && normalized.back() != '\n') normalized += '\n';
  return normalized;
}

GradeResult PatchGrader::Grade(const envelope::Envelope& envelope,
                               const SandboxState& state) const {
  const std::string& patch =
      absl::get<envelope::PatchAnswer>(envelope.answer).patch;
  if (patch.find_first_not_of(" \t\r\n") == std::string::npos) {
    return NotApplied("Empty patch");
  }
  CHECK(state.executor) << "Patch grading needs an executor";
  CHECK(state.seed_fresh) << "Patch grading needs a fixture to rebuild";

  workspace::SandboxInstance fresh(state.sandbox_base);
  state.seed_fresh(&fresh);
  std::string normalized = NormalizePatch(patch, fresh.Root(), project_dir_);
  for (const std::string& path : PatchedPaths(normalized)) {
    if (IsTestPath(path)) {
      return NotApplied("Patch modifies the test suite: " + path);
    }
  }

  try {
    for (bool dry_run : {true, false}) {
      executor::Response response = state.executor->Execute(
          PatchRequest(fresh.Root(), normalized, dry_run));
      if (response.status != executor::Status::SUCCESS) {
        VLOG(1) << "Patch does not apply: " << response.stdout_data;
        return NotApplied("Patch does not apply:\n" + response.stdout_data +
                          response.stderr_data);
      }
    }
  } catch (const executor::execution_failed& e) {
    LOG(WARNING) << "Cannot run patch: " << e.what();
    return NotApplied(std::string("Cannot run patch: ") + e.what());
  }

  workspace::SandboxInstance pristine(state.sandbox_base);
  state.seed_fresh(&pristine);
  RestoreTestSuite(pristine, &fresh);

  GradeResult result;
  result.signals["patch_applied"] = 1;
  executor::Request request = tools::PytestRequest(
      state.python, util::File::JoinPath(fresh.Root(), project_dir_));
  request.wall_limit_millis = state.timeout_millis;
  executor::Response response;
  try {
    response = state.executor->Execute(request);
  } catch (const executor::execution_failed& e) {
    LOG(WARNING) << "Cannot run the tests: " << e.what();
    result.detail = std::string("Cannot run the tests: ") + e.what();
    return result;
  }
  if (response.status == executor::Status::TIME_LIMIT) {
    result.detail = "The test suite timed out";
    return result;
  }

  tools::PytestSummary summary = tools::ParsePytestSummary(response.stdout_data);
  int64_t total = summary.passed + summary.failed + summary.errors;
  result.signals["tests_passed"] = summary.passed;
  result.signals["tests_failed"] = summary.failed + summary.errors;
  result.signals["tests_total"] = total;
  result.reward = ClampReward(total == 0 ? 0.0 : 1.0 * summary.passed / total);
  result.passed = total > 0 && summary.passed == total &&
                  response.status == executor::Status::SUCCESS;
  result.detail = util::TrimMiddle(StripTimings(response.stdout_data),
                                   kDetailBytes);
  return result;
}

}  // namespace grading
