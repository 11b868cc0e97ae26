#ifndef GRADING_PATCH_GRADER_HPP
#define GRADING_PATCH_GRADER_HPP

#include <string>

#include "grading/grader.hpp"

namespace grading {

// Rewrites the ---/+++ headers of a unified diff so that it applies with
// -p0 from the sandbox root: a/ and b/ prefixes are dropped, and paths that
// only exist under project_dir are moved there.
std::string NormalizePatch(const std::string& patch, const std::string& root,
                           const std::string& project_dir);

// True for the files of a pytest suite: anything under a tests/ or test/
// directory, test_*.py and *_test.py modules, conftest.py and the pytest
// configuration files.
bool IsTestPath(const std::string& path);

// Applies the submitted patch to a fresh copy of the fixture and reruns its
// test suite in project_dir. Patches touching the test suite are rejected,
// and the suite is restored from the fixture before it runs. The reward is
// the fraction of tests passed; passing needs the patch to apply and every
// test to pass.
class PatchGrader : public Grader {
 public:
  explicit PatchGrader(std::string project_dir)
      : project_dir_(std::move(project_dir)) {}

  GradeResult Grade(const envelope::Envelope& envelope,
                    const SandboxState& state) const override;

 private:
  std::string project_dir_;
};

}  // namespace grading

#endif
