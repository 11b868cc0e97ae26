#include "sandbox/sandbox.hpp"

#include <mutex>

#include "glog/logging.h"

namespace sandbox {

std::vector<Sandbox::Backend>* Sandbox::Registry() {
  static auto* backends = new std::vector<Backend>;
  return backends;
}

void Sandbox::Add(const std::string& name, create_t create, score_t score) {
  for (const Backend& backend : *Registry()) {
    CHECK_NE(backend.name, name) << "Sandbox " << name << " registered twice";
  }
  Registry()->push_back(Backend{name, std::move(create), std::move(score)});
}

std::vector<std::string> Sandbox::Backends() {
  std::vector<std::string> names;
  for (const Backend& backend : *Registry()) names.push_back(backend.name);
  return names;
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  const std::vector<Backend>& backends = *Registry();
  if (!name.empty()) {
    for (const Backend& backend : backends) {
      if (backend.name != name) continue;
      if (backend.score() < 0) {
        LOG(ERROR) << "Sandbox " << name << " is not usable here";
        return nullptr;
      }
      return std::unique_ptr<Sandbox>(backend.create());
    }
    LOG(ERROR) << "Unknown sandbox " << name;
    return nullptr;
  }

  // Scores do not change while running: rank the backends once.
  static const Backend* best = nullptr;
  static std::once_flag ranked;
  std::call_once(ranked, [&backends]() {
    int best_score = -1;
    for (const Backend& backend : backends) {
      int score = backend.score();
      if (score > best_score) {
        best_score = score;
        best = &backend;
      }
    }
    if (best) VLOG(1) << "Using the " << best->name << " sandbox";
  });
  if (!best) {
    LOG(ERROR) << "No usable sandbox";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(best->create());
}

}  // namespace sandbox
