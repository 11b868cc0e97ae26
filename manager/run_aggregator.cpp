#include "manager/run_aggregator.hpp"

#include <algorithm>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "envelope/envelope.hpp"
#include "glog/logging.h"
#include "workspace/sandbox_instance.hpp"

namespace manager {

RunAggregator::RunAggregator(const tasks::TaskSpec* task, const Agent* agent,
                             HarnessConfig config,
                             executor::LocalExecutor* executor,
                             EventQueue* queue)
    : task_(task),
      agent_(agent),
      config_(std::move(config)),
      executor_(executor),
      queue_(queue) {}

void RunAggregator::Finish(RunRecord* record,
                           std::chrono::steady_clock::time_point start) const {
  record->cost = config_.pricing.InputCost(record->input_tokens) +
                 config_.pricing.OutputCost(record->output_tokens);
  record->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  LOG(INFO) << "Run " << record->index << " of " << task_->name << ": "
            << (record->grade.passed ? "passed" : "failed") << ", reward "
            << record->grade.reward;
  if (queue_) {
    queue_->RunFinished(record->index, record->grade.passed,
                        record->grade.reward, record->error);
  }
}

RunRecord RunAggregator::RunOne(int32_t index) const {
  auto start = std::chrono::steady_clock::now();
  auto deadline = start + std::chrono::milliseconds(config_.run_timeout_millis);
  uint64_t seed = tasks::RunSeed(task_->name, index);
  RunRecord record;
  record.index = index;

  try {
    // Removed when this scope is left, whatever the outcome of the run.
    workspace::SandboxInstance sandbox(config_.sandbox_base,
                                       config_.keep_sandboxes);
    tasks::Fixture fixture = task_->fixture(&sandbox, seed);
    record.variant = fixture.variant;
    LOG(INFO) << "Run " << index << " of " << task_->name << ": variant "
              << fixture.variant << " in " << sandbox.Root();
    if (queue_) queue_->RunStarted(task_->name, index, fixture.variant);

    tools::ToolRegistry registry(&sandbox.Resolver(), executor_,
                                 config_.limits, sandbox.Environment());
    int32_t max_steps =
        config_.max_steps > 0 ? config_.max_steps : task_->max_steps;
    ToolSession session(&registry, task_->tools, index, max_steps, deadline,
                        queue_);

    AgentOutput output;
    try {
      output = agent_->Run(tasks::BuildPrompt(*task_, sandbox), &session);
    } catch (const std::exception& e) {
      record.transcript = session.Transcript();
      record.error = e.what();
      LOG(WARNING) << "Run " << index << " terminated: " << e.what();
      Finish(&record, start);
      return record;
    }
    record.transcript = session.Transcript();
    record.raw_output = output.raw_text;
    record.input_tokens = output.input_tokens;
    record.output_tokens = output.output_tokens;
    if (std::chrono::steady_clock::now() > deadline) {
      record.error = "Run wall clock budget exhausted";
      LOG(WARNING) << "Run " << index << " answered after its deadline";
      Finish(&record, start);
      return record;
    }

    envelope::Envelope answer;
    try {
      answer = envelope::Extract(output.raw_text, task_->schema);
    } catch (const envelope::malformed_envelope& e) {
      record.parse_error =
          e.field().empty() ? e.what() : e.field() + ": " + e.what();
      LOG(WARNING) << "Run " << index
                   << " has a malformed envelope: " << record.parse_error;
      Finish(&record, start);
      return record;
    }
    record.envelope = envelope::ToJson(answer, task_->schema);

    grading::SandboxState state;
    state.sandbox = &sandbox;
    state.expected = fixture.expected;
    const tasks::TaskSpec* task = task_;
    state.seed_fresh = [task, seed](workspace::SandboxInstance* fresh) {
      task->fixture(fresh, seed);
    };
    state.executor = executor_;
    state.sandbox_base = config_.sandbox_base;
    state.python = config_.limits.python;
    state.timeout_millis = config_.run_timeout_millis;
    record.grade = task_->grader->Grade(answer, state);
  } catch (const std::exception& e) {
    record.grade = grading::GradeResult();
    record.error = e.what();
    LOG(WARNING) << "Run " << index << " failed: " << e.what();
  }
  Finish(&record, start);
  return record;
}

AggregateReport RunAggregator::RunN(int32_t n) {
  int32_t jobs = config_.jobs > 0
                     ? config_.jobs
                     : static_cast<int32_t>(std::thread::hardware_concurrency());
  jobs = std::max(1, std::min(jobs, n));

  std::atomic<int32_t> next_index{0};
  absl::Mutex records_mutex;
  std::vector<RunRecord> records;
  auto worker = [&]() {
    while (!cancelled_.load()) {
      int32_t index = next_index++;
      if (index >= n) break;
      RunRecord record = RunOne(index);
      absl::MutexLock lck(&records_mutex);
      records.push_back(std::move(record));
    }
  };
  std::vector<std::thread> threads;
  for (int32_t i = 0; i < jobs; i++) threads.emplace_back(worker);
  for (std::thread& thread : threads) thread.join();

  bool interrupted = static_cast<int32_t>(records.size()) < n;
  if (interrupted) {
    LOG(WARNING) << "Aggregation of " << task_->name << " interrupted after "
                 << records.size() << " of " << n << " runs";
  }
  AggregateReport report = AggregateReport::FromRecords(
      task_->name, std::move(records), config_.pricing, interrupted);
  if (queue_) {
    queue_->AggregationEnded(report.task, report.pass_count, report.run_count,
                             report.interrupted);
  }
  return report;
}

}  // namespace manager
