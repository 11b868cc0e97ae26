#ifndef GRADING_SET_GRADER_HPP
#define GRADING_SET_GRADER_HPP

#include "grading/grader.hpp"

namespace grading {

// Grades a list of paths against the expected set. The reward is the F1
// score of the two sets (1 if both are empty). If require_sorted, passing
// also needs the list in sorted order without duplicates.
class SetGrader : public Grader {
 public:
  explicit SetGrader(bool require_sorted) : require_sorted_(require_sorted) {}

  GradeResult Grade(const envelope::Envelope& envelope,
                    const SandboxState& state) const override;

 private:
  bool require_sorted_;
};

}  // namespace grading

#endif
