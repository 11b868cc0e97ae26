#include "grading/grader.hpp"

#include <cmath>

namespace grading {

bool operator==(const GradeResult& a, const GradeResult& b) {
  return a.passed == b.passed && a.reward == b.reward &&
         a.signals == b.signals && a.detail == b.detail;
}

double ClampReward(double value) {
  if (std::isnan(value) || value < 0) return 0;
  return value > 1 ? 1 : value;
}

}  // namespace grading
