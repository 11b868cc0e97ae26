#include <utility>
#include <vector>

#include "grading/set_grader.hpp"
#include "tasks/ground_truth.hpp"
#include "tasks/task.hpp"

namespace tasks {

namespace {

using FileList = std::vector<std::pair<const char*, const char*>>;

const FileList kNoise = {
    {"README.txt", "Sample project snapshot"},
    {"tests/.env.fixture", "SECRET=should_be_skipped\n"},
    {"tests/unit/.env.dev", "SECRET=not_counted\n"},
    {"notes/.env.template", "# SECRET=placeholder\n"},
    {"notes/.env.backup", "# SECRET=archived\n"},
};

const std::vector<FileList> kVariants = {
    {
        {".env", "# baseline env\nSECRET=root_key\n"},
        {"config/.env.production", "SECRET=prod_key\n"},
        {"config/.env.sample", "# SECRET=placeholder\n"},
    },
    {
        {"services/payment/.env", "SECRET=pay_key\n"},
        {"services/payment/.env.backup", "SECRET=old_key\n"},
        {"services/payment/.env.example", "# SECRET=placeholder\n"},
    },
    {
        {"deploy/.env.staging", "# comment\nSECRET=stage_value\n"},
        {"deploy/.env.local", "SECRET=local_value\n"},
        {"deploy/.env.sample", "# SECRET=dummy\n"},
        {"deploy/readme.txt", "Documenting staging secrets stay commented\n"},
    },
};

const char* kPrompt =
    "Find every environment file (a file whose name starts with \".env\") "
    "that defines a live secret, that is a line starting exactly with "
    "\"SECRET=\". Commented lines do not count, and anything under the "
    "top-level tests/ folder must be ignored. Answer with the "
    "sandbox-relative paths in lexicographic order.";

Fixture Build(workspace::SandboxInstance* sandbox, uint64_t seed) {
  Fixture fixture;
  fixture.variant = PickVariant(seed, kVariants.size());
  for (const auto& file : kNoise) sandbox->WriteFile(file.first, file.second);
  for (const auto& file : kVariants[fixture.variant - 1]) {
    sandbox->WriteFile(file.first, file.second);
  }
  fixture.expected = envelope::PathsAnswer{LiveEnvFiles(*sandbox)};
  return fixture;
}

TaskSpec Make() {
  return TaskSpec{"fs_find_env",
                  kPrompt,
                  {"glob_find", "grep_search", "file_read"},
                  envelope::AnswerSchema::Paths(),
                  Build,
                  std::make_shared<grading::SetGrader>(/*require_sorted=*/true),
                  8};
}

Catalog::Register r(Make);

}  // namespace

}  // namespace tasks
