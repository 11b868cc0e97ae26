#include "manager/run_record.hpp"

#include <algorithm>

namespace manager {

AggregateReport AggregateReport::FromRecords(std::string task,
                                             std::vector<RunRecord> runs,
                                             const Pricing& pricing,
                                             bool interrupted) {
  std::sort(runs.begin(), runs.end(),
            [](const RunRecord& a, const RunRecord& b) {
              return a.index < b.index;
            });
  AggregateReport report;
  report.task = std::move(task);
  report.interrupted = interrupted;
  // Summed in index order, so that the totals do not depend on the order in
  // which the runs completed.
  double reward_sum = 0;
  for (const RunRecord& run : runs) {
    if (run.grade.passed) report.pass_count++;
    reward_sum += run.grade.reward;
    report.input_tokens += run.input_tokens;
    report.output_tokens += run.output_tokens;
  }
  report.run_count = static_cast<int32_t>(runs.size());
  if (report.run_count > 0) {
    report.pass_rate = 1.0 * report.pass_count / report.run_count;
    report.avg_reward = reward_sum / report.run_count;
  }
  report.cost_input = pricing.InputCost(report.input_tokens);
  report.cost_output = pricing.OutputCost(report.output_tokens);
  report.cost_total = report.cost_input + report.cost_output;
  report.runs = std::move(runs);
  return report;
}

}  // namespace manager
