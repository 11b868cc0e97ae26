#ifndef MANAGER_CONFIG_HPP
#define MANAGER_CONFIG_HPP

#include <string>
#include <vector>

#include "manager/run_record.hpp"
#include "tools/tool.hpp"

namespace manager {

// Settings of one aggregation. Read from the command line flags once, then
// passed down explicitly.
struct HarnessConfig {
  // Empty or "all" for every task of the catalog.
  std::string task;
  int32_t runs = 1;
  // Concurrent runs; 0 means one per hardware thread.
  int32_t jobs = 0;
  std::string script;
  std::string sandbox_base = "/tmp/agent_eval";
  bool keep_sandboxes = false;
  int32_t max_processes = 4;
  tools::ToolLimits limits;
  int64_t run_timeout_millis = 120000;
  // 0 means the task's own budget.
  int32_t max_steps = 0;
  Pricing pricing;
  std::string report_path;

  // Throws std::invalid_argument on out of range values.
  static HarnessConfig FromFlags();

  // The tasks to evaluate, in catalog order.
  std::vector<std::string> Tasks() const;
};

}  // namespace manager

#endif
