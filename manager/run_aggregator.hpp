#ifndef MANAGER_RUN_AGGREGATOR_HPP
#define MANAGER_RUN_AGGREGATOR_HPP

#include <atomic>

#include "executor/local_executor.hpp"
#include "manager/agent.hpp"
#include "manager/config.hpp"
#include "manager/event_queue.hpp"
#include "manager/run_record.hpp"
#include "tasks/task.hpp"

namespace manager {

// Drives independent runs of one task and aggregates them. Each run gets its
// own sandbox, seeded from the run index, and no run can make another fail.
class RunAggregator {
 public:
  // queue may be null.
  RunAggregator(const tasks::TaskSpec* task, const Agent* agent,
                HarnessConfig config, executor::LocalExecutor* executor,
                EventQueue* queue);

  // Runs indices [0, n) on up to config.jobs threads. The report always
  // holds n records, unless Cancel was called: then it holds the runs that
  // completed and is marked interrupted.
  AggregateReport RunN(int32_t n);

  // Runs index and records the outcome. Never throws.
  RunRecord RunOne(int32_t index) const;

  // Makes RunN stop starting new runs; the ones in flight still complete and
  // are recorded. Safe to call from any thread or signal handler.
  void Cancel() { cancelled_.store(true); }
  bool Cancelled() const { return cancelled_.load(); }

 private:
  void Finish(RunRecord* record,
              std::chrono::steady_clock::time_point start) const;

  const tasks::TaskSpec* task_;
  const Agent* agent_;
  HarnessConfig config_;
  executor::LocalExecutor* executor_;
  EventQueue* queue_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace manager

#endif
