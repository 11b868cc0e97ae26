#ifndef TASKS_TASK_HPP
#define TASKS_TASK_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "envelope/envelope.hpp"
#include "grading/grader.hpp"
#include "workspace/sandbox_instance.hpp"

namespace tasks {

class unknown_task : public std::invalid_argument {
 public:
  explicit unknown_task(const std::string& name)
      : std::invalid_argument("Unknown task: " + name) {}
};

// What a fixture builder leaves behind besides the files.
struct Fixture {
  int32_t variant = 0;
  envelope::Answer expected;
};

// Seeds an empty sandbox with the fixture variant picked by seed, and
// returns the ground truth for it. Must be a pure function of seed.
using FixtureBuilder =
    std::function<Fixture(workspace::SandboxInstance* sandbox, uint64_t seed)>;

struct TaskSpec {
  std::string name;
  // Task instructions, without layout, tools and answer format.
  std::string prompt;
  // Names of the tools the agent may call.
  std::vector<std::string> tools;
  envelope::AnswerSchema schema;
  FixtureBuilder fixture;
  std::shared_ptr<const grading::Grader> grader;
  int32_t max_steps;
};

// The fixed set of tasks. Tasks add themselves by creating a global
// Catalog::Register object.
class Catalog {
 public:
  class Register {
   public:
    explicit Register(TaskSpec (*make)());
  };

  // Throws unknown_task.
  static const TaskSpec& Get(const std::string& name);

  // Sorted names of every task.
  static std::vector<std::string> Names();
};

// Seed of run index of task: the same pair always gives the same fixture.
uint64_t RunSeed(const std::string& task, int32_t index);

// A variant in [1, count], picked deterministically from seed.
int32_t PickVariant(uint64_t seed, int32_t count);

// The full prompt of a run: task instructions, sandbox layout, allowed tools
// and the envelope format.
std::string BuildPrompt(const TaskSpec& task,
                        const workspace::SandboxInstance& sandbox);

}  // namespace tasks

#endif
