#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <deque>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/report.pb.h"

namespace manager {

// Progress events of an aggregation, produced by the runs and consumed by the
// CLI. Thread safe. Producers never block: once capacity events are pending,
// further ToolCalled events are counted and dropped, while the events that
// mark the start and end of runs are always kept.
class EventQueue {
 public:
  explicit EventQueue(size_t capacity = 4096) : capacity_(capacity) {}

  void RunStarted(const std::string& task, int32_t index, int32_t variant);
  void ToolCalled(int32_t index, const std::string& tool,
                  const std::string& error_kind, int64_t elapsed_micros);
  void RunFinished(int32_t index, bool passed, double reward,
                   const std::string& error);
  void AggregationEnded(const std::string& task, int32_t pass_count,
                        int32_t run_count, bool interrupted);

  // Blocks until some event is pending or the queue is stopped, then takes
  // every pending event in order. Empty once the queue is stopped and drained.
  std::vector<proto::Event> DequeueAll();

  void Stop();
  bool IsStopped();

  // ToolCalled events dropped so far.
  int64_t Dropped();

 private:
  void Enqueue(proto::Event&& event, bool droppable);

  const size_t capacity_;
  absl::Mutex queue_mutex_;
  std::deque<proto::Event> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
  int64_t dropped_ GUARDED_BY(queue_mutex_) = 0;
};

}  // namespace manager

#endif
