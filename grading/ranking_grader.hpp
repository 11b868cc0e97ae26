#ifndef GRADING_RANKING_GRADER_HPP
#define GRADING_RANKING_GRADER_HPP

#include "grading/grader.hpp"

namespace grading {

// Grades an ordered list of {key, value} rows position by position. A
// position matches when the keys are equal and the values differ by at most
// tolerance. The reward is the fraction of matching positions over the
// longer of the two lists; passing needs every position of equally long lists
// to match.
class RankingGrader : public Grader {
 public:
  explicit RankingGrader(double tolerance) : tolerance_(tolerance) {}

  GradeResult Grade(const envelope::Envelope& envelope,
                    const SandboxState& state) const override;

 private:
  double tolerance_;
};

}  // namespace grading

#endif
