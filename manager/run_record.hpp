#ifndef MANAGER_RUN_RECORD_HPP
#define MANAGER_RUN_RECORD_HPP

#include <string>
#include <vector>

#include "grading/grader.hpp"
#include "nlohmann/json.hpp"
#include "tools/tool_registry.hpp"

namespace manager {

// USD per million tokens.
struct Pricing {
  double input_per_mtok = 0.8;
  double output_per_mtok = 4.0;

  double InputCost(int64_t tokens) const {
    return tokens * input_per_mtok / 1e6;
  }
  double OutputCost(int64_t tokens) const {
    return tokens * output_per_mtok / 1e6;
  }
};

// Everything that happened in one run. Failed runs keep the default grade,
// not passed with reward 0.
struct RunRecord {
  int32_t index = 0;
  int32_t variant = 0;
  std::vector<tools::ToolCall> transcript;
  std::string raw_output;
  // The validated envelope; null if none could be extracted.
  nlohmann::json envelope;
  std::string parse_error;
  grading::GradeResult grade;
  // Why the run ended before grading, e.g. an exhausted budget.
  std::string error;
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  double cost = 0;
  int64_t wall_time_millis = 0;
};

// Statistics over the runs of one task. Only built by FromRecords, so that
// every field is a function of the records.
struct AggregateReport {
  std::string task;
  // Sorted by index.
  std::vector<RunRecord> runs;
  int32_t pass_count = 0;
  int32_t run_count = 0;
  double pass_rate = 0;
  double avg_reward = 0;
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  double cost_input = 0;
  double cost_output = 0;
  double cost_total = 0;
  // True if the aggregation was cancelled before every run was done.
  bool interrupted = false;

  static AggregateReport FromRecords(std::string task,
                                     std::vector<RunRecord> runs,
                                     const Pricing& pricing, bool interrupted);
};

}  // namespace manager

#endif
