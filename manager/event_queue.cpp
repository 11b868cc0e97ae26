#include "manager/event_queue.hpp"

#include <iterator>

namespace manager {

void EventQueue::RunStarted(const std::string& task, int32_t index,
                            int32_t variant) {
  proto::Event event;
  proto::RunStarted* started = event.mutable_run_started();
  started->set_task(task);
  started->set_index(index);
  started->set_variant(variant);
  Enqueue(std::move(event), false);
}

void EventQueue::ToolCalled(int32_t index, const std::string& tool,
                            const std::string& error_kind,
                            int64_t elapsed_micros) {
  proto::Event event;
  proto::ToolCalled* called = event.mutable_tool_called();
  called->set_index(index);
  called->set_tool(tool);
  called->set_error_kind(error_kind);
  called->set_elapsed_micros(elapsed_micros);
  Enqueue(std::move(event), true);
}

void EventQueue::RunFinished(int32_t index, bool passed, double reward,
                             const std::string& error) {
  proto::Event event;
  proto::RunFinished* finished = event.mutable_run_finished();
  finished->set_index(index);
  finished->set_passed(passed);
  finished->set_reward(reward);
  finished->set_error(error);
  Enqueue(std::move(event), false);
}

void EventQueue::AggregationEnded(const std::string& task, int32_t pass_count,
                                  int32_t run_count, bool interrupted) {
  proto::Event event;
  proto::AggregationEnded* ended = event.mutable_aggregation_ended();
  ended->set_task(task);
  ended->set_pass_count(pass_count);
  ended->set_run_count(run_count);
  ended->set_interrupted(interrupted);
  Enqueue(std::move(event), false);
}

void EventQueue::Enqueue(proto::Event&& event, bool droppable) {
  absl::MutexLock lck(&queue_mutex_);
  if (droppable && queue_.size() >= capacity_) {
    dropped_++;
    return;
  }
  queue_.push_back(std::move(event));
}

std::vector<proto::Event> EventQueue::DequeueAll() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  std::vector<proto::Event> events(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
  queue_.clear();
  return events;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

bool EventQueue::IsStopped() {
  absl::MutexLock lck(&queue_mutex_);
  return stopped_;
}

int64_t EventQueue::Dropped() {
  absl::MutexLock lck(&queue_mutex_);
  return dropped_;
}

}  // namespace manager
