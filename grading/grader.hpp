#ifndef GRADING_GRADER_HPP
#define GRADING_GRADER_HPP

#include <functional>
#include <map>
#include <string>

#include "envelope/envelope.hpp"
#include "executor/local_executor.hpp"
#include "workspace/sandbox_instance.hpp"

namespace grading {

// The harness' own judgment of a run. reward is always in [0, 1].
struct GradeResult {
  bool passed = false;
  double reward = 0;
  // Intermediate diagnostics, e.g. precision or tests_passed.
  std::map<std::string, double> signals;
  std::string detail;
};

bool operator==(const GradeResult& a, const GradeResult& b);

// Everything a grader may look at besides the envelope.
struct SandboxState {
  // The sandbox as the agent left it.
  const workspace::SandboxInstance* sandbox = nullptr;
  // Ground truth, computed from the fixture the run was seeded with.
  envelope::Answer expected;
  // Seeds a fresh sandbox exactly like the one of the run.
  std::function<void(workspace::SandboxInstance*)> seed_fresh;

  executor::LocalExecutor* executor = nullptr;
  std::string sandbox_base;
  std::string python = "python3";
  int64_t timeout_millis = 120000;
};

// Compares an envelope with the ground truth of its task. The passed field of
// the envelope is never trusted. Implementations must be deterministic: the
// same envelope and state always give the same result.
class Grader {
 public:
  virtual GradeResult Grade(const envelope::Envelope& envelope,
                            const SandboxState& state) const = 0;

  virtual ~Grader() = default;
  Grader() = default;
  Grader(const Grader&) = delete;
  Grader(Grader&&) = delete;
  Grader& operator=(const Grader&) = delete;
  Grader& operator=(Grader&&) = delete;
};

// Clamps value to [0, 1], mapping NaN to 0.
double ClampReward(double value);

}  // namespace grading

#endif
