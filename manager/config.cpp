#include "manager/config.hpp"

#include <stdexcept>

#include "tasks/task.hpp"
#include "util/flags.hpp"

namespace manager {

HarnessConfig HarnessConfig::FromFlags() {
  if (FLAGS_runs < 0) throw std::invalid_argument("--runs must be >= 0");
  if (FLAGS_jobs < 0) throw std::invalid_argument("--jobs must be >= 0");
  if (FLAGS_max_processes <= 0) {
    throw std::invalid_argument("--max_processes must be positive");
  }
  if (FLAGS_tool_timeout_ms <= 0 || FLAGS_run_timeout_ms <= 0) {
    throw std::invalid_argument("Timeouts must be positive");
  }
  if (FLAGS_max_read_bytes <= 0 || FLAGS_max_output_bytes <= 0 ||
      FLAGS_max_sql_rows <= 0) {
    throw std::invalid_argument("Output limits must be positive");
  }
  if (FLAGS_price_input_per_mtok < 0 || FLAGS_price_output_per_mtok < 0) {
    throw std::invalid_argument("Prices must not be negative");
  }

  HarnessConfig config;
  config.task = FLAGS_task;
  config.runs = FLAGS_runs;
  config.jobs = FLAGS_jobs;
  config.script = FLAGS_script;
  config.sandbox_base = FLAGS_sandbox_base;
  config.keep_sandboxes = FLAGS_keep_sandboxes;
  config.max_processes = FLAGS_max_processes;
  config.limits.timeout_millis = FLAGS_tool_timeout_ms;
  config.limits.max_read_bytes = FLAGS_max_read_bytes;
  config.limits.max_output_bytes = FLAGS_max_output_bytes;
  config.limits.max_sql_rows = FLAGS_max_sql_rows;
  config.limits.expression_cpu_millis = FLAGS_expression_cpu_ms;
  config.limits.expression_memory_mb = FLAGS_expression_memory_mb;
  config.limits.python = FLAGS_python;
  config.run_timeout_millis = FLAGS_run_timeout_ms;
  config.max_steps = FLAGS_max_steps;
  config.pricing.input_per_mtok = FLAGS_price_input_per_mtok;
  config.pricing.output_per_mtok = FLAGS_price_output_per_mtok;
  config.report_path = FLAGS_report_path;
  return config;
}

std::vector<std::string> HarnessConfig::Tasks() const {
  if (task.empty() || task == "all") return tasks::Catalog::Names();
  return {task};
}

}  // namespace manager
