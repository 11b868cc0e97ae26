#include "tasks/task.hpp"

#include <algorithm>
#include <map>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "tools/tool.hpp"

namespace tasks {

namespace {
std::map<std::string, TaskSpec>* TaskMap() {
  static std::map<std::string, TaskSpec> tasks;
  return &tasks;
}

const uint64_t kFnvOffset = 14695981039346656037ULL;
const uint64_t kFnvPrime = 1099511628211ULL;
}  // namespace

Catalog::Register::Register(TaskSpec (*make)()) {
  TaskSpec spec = make();
  std::string name = spec.name;
  bool inserted = TaskMap()->emplace(name, std::move(spec)).second;
  CHECK(inserted) << "Task " << name << " registered twice";
}

const TaskSpec& Catalog::Get(const std::string& name) {
  auto it = TaskMap()->find(name);
  if (it == TaskMap()->end()) throw unknown_task(name);
  return it->second;
}

std::vector<std::string> Catalog::Names() {
  std::vector<std::string> names;
  for (const auto& kv : *TaskMap()) names.push_back(kv.first);
  return names;
}

uint64_t RunSeed(const std::string& task, int32_t index) {
  uint64_t hash = kFnvOffset;
  for (char c : absl::StrCat(task, ":", index)) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

int32_t PickVariant(uint64_t seed, int32_t count) {
  CHECK_GT(count, 0);
  // splitmix64 finalizer, so that close seeds spread over the variants.
  uint64_t z = seed + 0x9e3779b97f4a7c15ULL;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  z ^= z >> 31;
  return 1 + static_cast<int32_t>(z % count);
}

std::string BuildPrompt(const TaskSpec& task,
                        const workspace::SandboxInstance& sandbox) {
  std::string prompt = task.prompt;
  if (!prompt.empty() && prompt.back() != '\n') prompt += '\n';
  absl::StrAppend(&prompt,
                  "\nThe sandbox root is $HPY_SANDBOX; every path is relative "
                  "to it. Files in the sandbox:\n",
                  sandbox.Layout(), "\n\nTools (at most ", task.max_steps,
                  " calls):\n");
  for (const std::string& name : task.tools) {
    const tools::Tool* tool = tools::Tool::Find(name);
    absl::StrAppend(&prompt, "- ", tool ? tool->Description() : name, "\n");
  }
  absl::StrAppend(
      &prompt,
      "\nFinish with exactly one JSON object, and nothing else in braces "
      "before it:\n{\"passed\": bool, \"checks\": {string: bool}, "
      "\"answer\": ",
      task.schema.Describe(), ", \"notes\": string}\n");
  return prompt;
}

}  // namespace tasks
