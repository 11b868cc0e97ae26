#include "grading/ranking_grader.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace grading {

GradeResult RankingGrader::Grade(const envelope::Envelope& envelope,
                                 const SandboxState& state) const {
  const auto& submitted =
      absl::get<envelope::RankingAnswer>(envelope.answer).results;
  const auto& expected =
      absl::get<envelope::RankingAnswer>(state.expected).results;

  size_t matches = 0;
  size_t common = std::min(submitted.size(), expected.size());
  for (size_t i = 0; i < common; i++) {
    if (submitted[i].key == expected[i].key &&
        std::fabs(submitted[i].value - expected[i].value) <= tolerance_) {
      matches++;
    }
  }
  std::set<std::string> expected_keys;
  for (const envelope::RankingRow& row : expected) expected_keys.insert(row.key);
  size_t keys_found = 0;
  for (const envelope::RankingRow& row : submitted) {
    keys_found += expected_keys.count(row.key);
  }

  size_t longest = std::max(submitted.size(), expected.size());
  GradeResult result;
  result.reward = ClampReward(longest == 0 ? 1.0 : 1.0 * matches / longest);
  result.passed = submitted.size() == expected.size() && matches == longest;
  result.signals["matched_positions"] = matches;
  result.signals["expected_rows"] = expected.size();
  result.signals["submitted_rows"] = submitted.size();
  result.signals["keys_found"] = keys_found;
  if (!result.passed && keys_found == expected.size() &&
      submitted.size() == expected.size()) {
    result.detail = "Right keys, but wrong order or values";
  }
  return result;
}

}  // namespace grading
