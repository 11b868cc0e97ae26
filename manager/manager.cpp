#include <signal.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/strings/str_join.h"
#include "executor/local_executor.hpp"
#include "glog/logging.h"
#include "manager/agent.hpp"
#include "manager/config.hpp"
#include "manager/event_queue.hpp"
#include "manager/report.hpp"
#include "manager/run_aggregator.hpp"
#include "tasks/task.hpp"
#include "util/flags.hpp"

namespace {
std::atomic<manager::RunAggregator*> running_aggregator{nullptr};
std::atomic<bool> interrupted{false};

void Interrupt(int /*signum*/) {
  interrupted.store(true);
  manager::RunAggregator* aggregator = running_aggregator.load();
  if (aggregator != nullptr) aggregator->Cancel();
}

void InstallInterruptHandler() {
  struct sigaction action {};
  action.sa_handler = Interrupt;
  sigemptyset(&action.sa_mask);
  for (int signum : {SIGINT, SIGTERM}) {
    PCHECK(sigaction(signum, &action, nullptr) == 0)
        << "Cannot install the handler of signal " << signum;
  }
}

void LogEvent(const proto::Event& event) {
  switch (event.event_case()) {
    case proto::Event::kRunStarted:
      VLOG(1) << "Started run " << event.run_started().index()
              << " (variant " << event.run_started().variant() << ")";
      break;
    case proto::Event::kToolCalled: {
      const auto& call = event.tool_called();
      VLOG(1) << "Run " << call.index() << " called " << call.tool()
              << (call.error_kind().empty() ? "" : " -> " + call.error_kind())
              << " in " << call.elapsed_micros() / 1000 << "ms";
      break;
    }
    case proto::Event::kRunFinished: {
      const auto& run = event.run_finished();
      LOG(INFO) << "Finished run " << run.index() << ": "
                << (run.passed() ? "PASS" : "FAIL") << " " << run.reward()
                << (run.error().empty() ? "" : " (" + run.error() + ")");
      break;
    }
    case proto::Event::kAggregationEnded: {
      const auto& end = event.aggregation_ended();
      LOG(INFO) << end.task() << ": " << end.pass_count() << "/"
                << end.run_count() << " passed"
                << (end.interrupted() ? ", interrupted" : "");
      break;
    }
    case proto::Event::EVENT_NOT_SET:
      break;
  }
}

void LogEvents(manager::EventQueue* queue) {
  std::vector<proto::Event> events;
  while (!(events = queue->DequeueAll()).empty()) {
    for (const proto::Event& event : events) LogEvent(event);
  }
  if (queue->Dropped() > 0) {
    VLOG(1) << queue->Dropped() << " tool call events were not logged";
  }
}
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Evaluates an agent on a sandboxed task. Tasks: " +
                          absl::StrJoin(tasks::Catalog::Names(), ", "));
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  manager::HarnessConfig config;
  std::vector<const tasks::TaskSpec*> task_list;
  std::vector<std::unique_ptr<manager::ScriptedAgent>> agents;
  try {
    config = manager::HarnessConfig::FromFlags();
    if (config.script.empty()) {
      throw std::invalid_argument("An agent script is needed, see --script");
    }
    for (const std::string& name : config.Tasks()) {
      task_list.push_back(&tasks::Catalog::Get(name));
      agents.push_back(manager::ScriptedAgent::FromFile(config.script, name));
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  executor::LocalExecutor executor(config.sandbox_base, config.max_processes);
  manager::EventQueue queue;
  std::thread event_logger(LogEvents, &queue);
  InstallInterruptHandler();

  std::vector<manager::AggregateReport> reports;
  for (size_t i = 0; i < task_list.size() && !interrupted.load(); i++) {
    const tasks::TaskSpec* task = task_list[i];
    manager::RunAggregator aggregator(task, agents[i].get(), config,
                                      &executor, &queue);
    running_aggregator.store(&aggregator);
    // A signal may have arrived before the aggregator was visible.
    if (interrupted.load()) aggregator.Cancel();
    LOG(INFO) << "Evaluating " << config.runs << " runs of " << task->name;
    reports.push_back(aggregator.RunN(config.runs));
    running_aggregator.store(nullptr);
  }
  queue.Stop();
  event_logger.join();

  bool single = task_list.size() == 1 && reports.size() == 1;
  try {
    if (single) {
      LOG(INFO) << "Summary:\n" << manager::Summary(reports.front());
      manager::WriteReport(reports.front(), config.report_path);
    } else {
      for (const manager::AggregateReport& report : reports) {
        VLOG(1) << "Summary:\n" << manager::Summary(report);
      }
      LOG(INFO) << "Summary:\n" << manager::Summary(reports);
      manager::WriteReports(reports, config.report_path);
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Cannot write the report: " << e.what();
    return 1;
  }
  return interrupted.load() ? 130 : 0;
}
