#include "manager/run_aggregator.hpp"

#include <memory>
#include <string>
#include <vector>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "grading/set_grader.hpp"
#include "gtest/gtest.h"
#include "manager/report.hpp"
#include "tasks/task.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";

class ManagerTestSleep : public tools::Tool {
 public:
  std::string Name() const override { return "manager_test_sleep"; }
  std::string Description() const override { return "manager_test_sleep()"; }
  nlohmann::json Call(const nlohmann::json& /*args*/,
                      const tools::ToolContext& context) const override {
    executor::Request request;
    request.executable = "sleep";
    request.args = {"5"};
    request.cwd = context.resolver->Root();
    context.RunBounded(request);
    return nlohmann::json::object();
  }
};

tools::Tool::Register<ManagerTestSleep> r;

tasks::Fixture BuildSecrets(workspace::SandboxInstance* sandbox,
                            uint64_t seed) {
  if (seed == tasks::RunSeed("test_secrets", 2)) {
    throw std::runtime_error("fixture crashed");
  }
  sandbox->WriteFile(".env", "SECRET=abc\n");
  sandbox->WriteFile("tests/.env.fixture", "SECRET=xyz\n");
  return tasks::Fixture{1, envelope::PathsAnswer{{".env"}}};
}

const char* kGoodFinal =
    "All done. {\"passed\": true, \"checks\": {\"found\": true}, "
    "\"answer\": {\"paths\": [\".env\"]}, \"notes\": \"\"} and {\"x\": 1}";

nlohmann::json Step(const std::string& tool, nlohmann::json arguments) {
  return {{"tool", tool}, {"arguments", std::move(arguments)}};
}

nlohmann::json GoodScript() {
  return {{"steps",
           {Step("glob_find", {{"pattern", ".env*"}, {"exclude", {"tests/**"}}}),
            Step("grep_search", {{"pattern", "^SECRET="}, {"path", ".env"}})}},
          {"final", kGoodFinal}};
}

class RunAggregatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base_dir_ = absl::make_unique<util::TempDir>(test_tmpdir);
    sandbox_base_ = base_dir_->Path();
    executor_ = absl::make_unique<executor::LocalExecutor>(test_tmpdir, 4);
    config_.sandbox_base = sandbox_base_;
    config_.jobs = 1;
    config_.limits.timeout_millis = 300;
    config_.run_timeout_millis = 30000;
  }

  manager::RunRecord RunOne(const nlohmann::json& script, int32_t index = 0) {
    manager::ScriptedAgent agent(script);
    manager::RunAggregator aggregator(&task_, &agent, config_, executor_.get(),
                                      nullptr);
    return aggregator.RunOne(index);
  }

  std::unique_ptr<util::TempDir> base_dir_;
  std::string sandbox_base_;
  std::unique_ptr<executor::LocalExecutor> executor_;
  manager::HarnessConfig config_;
  tasks::TaskSpec task_{
      "test_secrets",
      "Find the env files with a live secret.",
      {"glob_find", "grep_search", "file_read", "manager_test_sleep"},
      envelope::AnswerSchema::Paths(),
      BuildSecrets,
      std::make_shared<grading::SetGrader>(/*require_sorted=*/true),
      4};
};

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, PassingRun) {
  manager::RunRecord record = RunOne(GoodScript());
  EXPECT_TRUE(record.grade.passed);
  EXPECT_DOUBLE_EQ(record.grade.reward, 1.0);
  EXPECT_THAT(record.error, IsEmpty());
  ASSERT_EQ(record.transcript.size(), 2);
  EXPECT_TRUE(record.transcript[0].ok());
  EXPECT_EQ(record.transcript[0].result["paths"],
            nlohmann::json::array({".env"}));
  EXPECT_EQ(record.envelope["answer"]["paths"],
            nlohmann::json::array({".env"}));
  EXPECT_GT(record.input_tokens, 0);
  EXPECT_GT(record.cost, 0);
  EXPECT_EQ(record.variant, 1);
  // The sandbox is gone.
  EXPECT_THAT(util::File::ListTree(sandbox_base_), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, MalformedEnvelope) {
  nlohmann::json script = {{"final", "I found .env, no JSON today"}};
  manager::RunRecord record = RunOne(script);
  EXPECT_FALSE(record.grade.passed);
  EXPECT_EQ(record.grade.reward, 0);
  EXPECT_THAT(record.parse_error, HasSubstr("No balanced JSON object"));
  EXPECT_TRUE(record.envelope.is_null());
  EXPECT_EQ(record.raw_output, "I found .env, no JSON today");
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, SelfReportedPassIsNotTrusted) {
  nlohmann::json script = {
      {"final",
       "{\"passed\": true, \"checks\": {}, \"answer\": {\"paths\": "
       "[\"tests/.env.fixture\", \".env\"]}, \"notes\": \"all good\"}"}};
  manager::RunRecord record = RunOne(script);
  EXPECT_FALSE(record.grade.passed);
  EXPECT_DOUBLE_EQ(record.grade.reward, 2.0 / 3);
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, StepBudget) {
  nlohmann::json steps = nlohmann::json::array();
  for (int i = 0; i < 6; i++) steps.push_back(Step("file_read", {{"path", ".env"}}));
  manager::RunRecord record = RunOne({{"steps", steps}, {"final", kGoodFinal}});
  EXPECT_FALSE(record.grade.passed);
  EXPECT_EQ(record.grade.reward, 0);
  EXPECT_THAT(record.error, HasSubstr("Step budget of 4"));
  EXPECT_EQ(record.transcript.size(), 4);
  EXPECT_THAT(util::File::ListTree(sandbox_base_), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, DisallowedToolIsAnError) {
  nlohmann::json script = GoodScript();
  script["steps"].push_back(Step("python_expression", {{"expr", "1+1"}}));
  script["steps"].push_back(Step("no_such_tool", nlohmann::json::object()));
  manager::RunRecord record = RunOne(script);
  ASSERT_EQ(record.transcript.size(), 4);
  ASSERT_FALSE(record.transcript[2].ok());
  EXPECT_EQ(record.transcript[2].error->kind,
            tools::ErrorKind::TOOL_EXECUTION_ERROR);
  EXPECT_THAT(record.transcript[2].error->message,
              HasSubstr("not available"));
  EXPECT_FALSE(record.transcript[3].ok());
  EXPECT_TRUE(record.grade.passed);
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, ToolTimeoutDoesNotEndTheRun) {
  nlohmann::json script = GoodScript();
  script["steps"].insert(script["steps"].begin(),
                         Step("manager_test_sleep", nlohmann::json::object()));
  manager::RunRecord record = RunOne(script);
  ASSERT_EQ(record.transcript.size(), 3);
  ASSERT_FALSE(record.transcript[0].ok());
  EXPECT_EQ(record.transcript[0].error->kind, tools::ErrorKind::TOOL_TIMEOUT);
  EXPECT_TRUE(record.transcript[1].ok());
  EXPECT_THAT(record.error, IsEmpty());
  EXPECT_TRUE(record.grade.passed);
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, RunDeadlineCutsASlowCall) {
  config_.limits.timeout_millis = 5000;
  config_.run_timeout_millis = 300;
  nlohmann::json script = GoodScript();
  script["steps"] = nlohmann::json::array(
      {Step("manager_test_sleep", nlohmann::json::object())});
  manager::RunRecord record = RunOne(script);
  ASSERT_EQ(record.transcript.size(), 1);
  ASSERT_FALSE(record.transcript[0].ok());
  EXPECT_EQ(record.transcript[0].error->kind, tools::ErrorKind::TOOL_TIMEOUT);
  EXPECT_EQ(record.error, "Run wall clock budget exhausted");
  EXPECT_FALSE(record.grade.passed);
  EXPECT_EQ(record.grade.reward, 0);
  EXPECT_LT(record.wall_time_millis, 4000);
  EXPECT_THAT(util::File::ListTree(sandbox_base_), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, FailingRunsAreStillCounted) {
  manager::ScriptedAgent agent(GoodScript());
  manager::EventQueue queue;
  manager::RunAggregator aggregator(&task_, &agent, config_, executor_.get(),
                                    &queue);
  manager::AggregateReport report = aggregator.RunN(5);
  EXPECT_EQ(report.run_count, 5);
  EXPECT_EQ(report.pass_count, 4);
  EXPECT_DOUBLE_EQ(report.pass_rate, 0.8);
  EXPECT_DOUBLE_EQ(report.avg_reward, 0.8);
  EXPECT_FALSE(report.interrupted);
  ASSERT_EQ(report.runs.size(), 5);
  for (int32_t i = 0; i < 5; i++) EXPECT_EQ(report.runs[i].index, i);
  EXPECT_EQ(report.runs[2].error, "fixture crashed");
  EXPECT_FALSE(report.runs[2].grade.passed);
  EXPECT_THAT(util::File::ListTree(sandbox_base_), IsEmpty());

  queue.Stop();
  int32_t started = 0;
  int32_t finished = 0;
  int32_t ended = 0;
  for (const proto::Event& event : queue.DequeueAll()) {
    started += event.has_run_started();
    finished += event.has_run_finished();
    ended += event.has_aggregation_ended();
  }
  EXPECT_THAT(queue.DequeueAll(), IsEmpty());
  EXPECT_EQ(started, 4);
  EXPECT_EQ(finished, 5);
  EXPECT_EQ(ended, 1);
}

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, ConcurrentMatchesSequential) {
  nlohmann::json wrong = {
      {"final",
       "{\"passed\": true, \"checks\": {}, \"answer\": {\"paths\": "
       "[\"a\", \".env\"]}, \"notes\": \"\"}"}};
  manager::ScriptedAgent agent(nlohmann::json::array({GoodScript(), wrong}));

  manager::RunAggregator sequential(&task_, &agent, config_, executor_.get(),
                                    nullptr);
  manager::AggregateReport first = sequential.RunN(8);

  config_.jobs = 4;
  manager::RunAggregator concurrent(&task_, &agent, config_, executor_.get(),
                                    nullptr);
  manager::AggregateReport second = concurrent.RunN(8);

  EXPECT_EQ(first.pass_count, second.pass_count);
  EXPECT_EQ(first.avg_reward, second.avg_reward);
  EXPECT_EQ(first.input_tokens, second.input_tokens);
  EXPECT_EQ(first.cost_total, second.cost_total);
  ASSERT_EQ(first.runs.size(), second.runs.size());
  for (size_t i = 0; i < first.runs.size(); i++) {
    EXPECT_EQ(first.runs[i].grade, second.runs[i].grade) << i;
  }
  EXPECT_EQ(first.pass_count, 3);
}

class CancellingAgent : public manager::Agent {
 public:
  explicit CancellingAgent(const nlohmann::json& script) : inner_(script) {}
  void SetAggregator(manager::RunAggregator* aggregator) {
    aggregator_ = aggregator;
  }
  manager::AgentOutput Run(const std::string& prompt,
                           manager::ToolSession* session) const override {
    aggregator_->Cancel();
    return inner_.Run(prompt, session);
  }

 private:
  manager::ScriptedAgent inner_;
  manager::RunAggregator* aggregator_ = nullptr;
};

// NOLINTNEXTLINE
TEST_F(RunAggregatorTest, CancelKeepsCompletedRuns) {
  CancellingAgent agent(GoodScript());
  manager::RunAggregator aggregator(&task_, &agent, config_, executor_.get(),
                                    nullptr);
  agent.SetAggregator(&aggregator);
  manager::AggregateReport report = aggregator.RunN(5);
  EXPECT_TRUE(report.interrupted);
  EXPECT_EQ(report.run_count, 1);
  EXPECT_EQ(report.pass_count, 1);
  EXPECT_TRUE(report.runs[0].grade.passed);
}

// NOLINTNEXTLINE
TEST(AggregateReport, FromRecords) {
  std::vector<manager::RunRecord> runs(3);
  runs[0].index = 2;
  runs[0].grade.passed = true;
  runs[0].grade.reward = 1;
  runs[0].input_tokens = 1000000;
  runs[1].index = 0;
  runs[1].grade.reward = 0.5;
  runs[1].output_tokens = 500000;
  runs[2].index = 1;
  manager::AggregateReport report = manager::AggregateReport::FromRecords(
      "fs_find_env", runs, manager::Pricing(), false);
  EXPECT_EQ(report.run_count, 3);
  EXPECT_EQ(report.pass_count, 1);
  EXPECT_DOUBLE_EQ(report.avg_reward, 0.5);
  EXPECT_DOUBLE_EQ(report.cost_input, 0.8);
  EXPECT_DOUBLE_EQ(report.cost_output, 2.0);
  EXPECT_DOUBLE_EQ(report.cost_total, 2.8);
  EXPECT_EQ(report.runs[0].index, 0);
  EXPECT_EQ(report.runs[2].index, 2);

  std::string json = manager::ReportToJson(report);
  EXPECT_THAT(json, HasSubstr("\"task\": \"fs_find_env\""));
  EXPECT_THAT(json, HasSubstr("\"pass_count\": 1"));
  EXPECT_THAT(json, HasSubstr("\"interrupted\": false"));
  EXPECT_THAT(manager::Summary(report), HasSubstr("1/3 passed"));

  manager::AggregateReport empty = manager::AggregateReport::FromRecords(
      "fs_find_env", {}, manager::Pricing(), false);
  EXPECT_EQ(empty.run_count, 0);
  EXPECT_EQ(empty.avg_reward, 0);
}

// NOLINTNEXTLINE
TEST(AggregateReport, SeveralTasks) {
  std::vector<manager::RunRecord> runs(2);
  runs[0].grade.passed = true;
  runs[0].input_tokens = 1000000;
  std::vector<manager::AggregateReport> reports;
  reports.push_back(manager::AggregateReport::FromRecords(
      "fs_find_env", runs, manager::Pricing(), false));
  reports.push_back(manager::AggregateReport::FromRecords(
      "logs_top5xx", {runs[1]}, manager::Pricing(), true));

  proto::EvaluationReport message = manager::ToProto(reports);
  ASSERT_EQ(message.tasks_size(), 2);
  EXPECT_EQ(message.tasks(1).task(), "logs_top5xx");
  EXPECT_EQ(message.pass_count(), 1);
  EXPECT_EQ(message.run_count(), 3);
  EXPECT_DOUBLE_EQ(message.cost_total(), 0.8);
  EXPECT_TRUE(message.interrupted());

  std::string json = manager::ReportsToJson(reports);
  EXPECT_THAT(json, HasSubstr("\"tasks\": ["));
  EXPECT_THAT(json, HasSubstr("\"task\": \"logs_top5xx\""));
  EXPECT_THAT(manager::Summary(reports),
              HasSubstr("2 tasks: 1/3 passed, $0.800000 [interrupted]"));
}

// NOLINTNEXTLINE
TEST(ScriptedAgent, ScriptPerTask) {
  using manager::ScriptedAgent;
  nlohmann::json plain{{"final", "x"}};
  EXPECT_EQ(ScriptedAgent::ForTask(plain, "fs_find_env"), plain);
  nlohmann::json keyed{{"tasks", {{"fs_find_env", {{"final", "a"}}},
                                  {"logs_top5xx", {{"final", "b"}}}}}};
  EXPECT_EQ(ScriptedAgent::ForTask(keyed, "logs_top5xx")["final"], "b");
  EXPECT_THROW(ScriptedAgent::ForTask(keyed, "sql_q2_revenue"),  // NOLINT
               std::invalid_argument);
  EXPECT_THROW(  // NOLINT
      ScriptedAgent::ForTask(nlohmann::json{{"tasks", 1}}, "fs_find_env"),
      std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(ScriptedAgent, InvalidScripts) {
  using manager::ScriptedAgent;
  EXPECT_THROW(ScriptedAgent(nlohmann::json::array()),  // NOLINT
               std::invalid_argument);
  EXPECT_THROW(ScriptedAgent(nlohmann::json{{"steps", {}}}),  // NOLINT
               std::invalid_argument);
  EXPECT_THROW(ScriptedAgent(nlohmann::json{{"final", "x"},  // NOLINT
                                            {"steps", {{{"arguments", 1}}}}}),
               std::invalid_argument);
  EXPECT_THROW(ScriptedAgent(nlohmann::json{{"final", "x"},  // NOLINT
                                            {"input_tokens", -1}}),
               std::invalid_argument);
  EXPECT_THROW(ScriptedAgent::FromFile("/nonexistent/script.json"),  // NOLINT
               std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(HarnessConfig, FromFlags) {
  gflags::FlagSaver saver;
  FLAGS_runs = 3;
  FLAGS_tool_timeout_ms = 1500;
  manager::HarnessConfig config = manager::HarnessConfig::FromFlags();
  EXPECT_EQ(config.runs, 3);
  EXPECT_EQ(config.limits.timeout_millis, 1500);
  EXPECT_DOUBLE_EQ(config.pricing.input_per_mtok, 0.8);
  FLAGS_runs = -1;
  EXPECT_THROW(manager::HarnessConfig::FromFlags(),  // NOLINT
               std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(HarnessConfig, AllTasksByDefault) {
  manager::HarnessConfig config;
  EXPECT_EQ(config.Tasks(), tasks::Catalog::Names());
  config.task = "all";
  EXPECT_EQ(config.Tasks(), tasks::Catalog::Names());
  config.task = "fs_find_env";
  EXPECT_EQ(config.Tasks(), std::vector<std::string>{"fs_find_env"});
}

}  // namespace
