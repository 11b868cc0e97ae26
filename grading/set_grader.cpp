#include "grading/set_grader.hpp"

#include <algorithm>
#include <set>

namespace grading {

GradeResult SetGrader::Grade(const envelope::Envelope& envelope,
                             const SandboxState& state) const {
  const std::vector<std::string>& submitted =
      absl::get<envelope::PathsAnswer>(envelope.answer).paths;
  std::vector<std::string> expected =
      absl::get<envelope::PathsAnswer>(state.expected).paths;
  std::sort(expected.begin(), expected.end());
  expected.erase(std::unique(expected.begin(), expected.end()),
                 expected.end());

  std::set<std::string> submitted_set(submitted.begin(), submitted.end());
  std::set<std::string> expected_set(expected.begin(), expected.end());
  size_t true_positives = 0;
  for (const std::string& path : submitted_set) {
    true_positives += expected_set.count(path);
  }

  double precision = submitted_set.empty()
                         ? 0
                         : 1.0 * true_positives / submitted_set.size();
  double recall =
      expected_set.empty() ? 0 : 1.0 * true_positives / expected_set.size();
  double f1 = 0;
  if (submitted_set.empty() && expected_set.empty()) {
    f1 = 1;
  } else if (precision + recall > 0) {
    f1 = 2 * precision * recall / (precision + recall);
  }

  GradeResult result;
  result.passed = require_sorted_ ? submitted == expected
                                  : submitted_set == expected_set;
  result.reward = ClampReward(f1);
  result.signals["precision"] = precision;
  result.signals["recall"] = recall;
  result.signals["f1"] = f1;
  result.signals["true_positives"] = true_positives;
  result.signals["expected_count"] = expected_set.size();
  result.signals["submitted_count"] = submitted.size();
  if (!result.passed && submitted_set == expected_set) {
    result.detail = "Right paths, but not sorted or with duplicates";
  }
  return result;
}

}  // namespace grading
