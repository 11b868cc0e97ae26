#include "executor/local_executor.hpp"

#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";

executor::Request Shell(const std::string& script) {
  executor::Request request;
  request.executable = "sh";
  request.args = {"-c", script};
  request.cwd = "/";
  request.wall_limit_millis = 5000;
  return request;
}

// NOLINTNEXTLINE
TEST(LocalExecutor, CapturesOutput) {
  executor::LocalExecutor executor(test_tmpdir + "/executor", 2);
  executor::Request request = Shell("cat; echo err >&2; exit 3");
  request.stdin_data = "input";
  executor::Response response = executor.Execute(request);
  EXPECT_EQ(response.status, executor::Status::NONZERO);
  EXPECT_EQ(response.status_code, 3);
  EXPECT_EQ(response.stdout_data, "input");
  EXPECT_EQ(response.stderr_data, "err\n");
}

// NOLINTNEXTLINE
TEST(LocalExecutor, WorkingDirectoryAndEnvironment) {
  util::TempDir tmp(test_tmpdir);
  executor::LocalExecutor executor(test_tmpdir + "/executor", 2);
  executor::Request request = Shell("pwd; echo $HPY_SANDBOX; test -n \"$PATH\"");
  request.cwd = tmp.Path();
  request.env = {"HPY_SANDBOX=" + tmp.Path()};
  executor::Response response = executor.Execute(request);
  EXPECT_EQ(response.status, executor::Status::SUCCESS);
  EXPECT_EQ(response.stdout_data, tmp.Path() + "\n" + tmp.Path() + "\n");
}

// NOLINTNEXTLINE
TEST(LocalExecutor, WallLimit) {
  executor::LocalExecutor executor(test_tmpdir + "/executor", 2);
  executor::Request request = Shell("sleep 10");
  request.wall_limit_millis = 200;
  executor::Response response = executor.Execute(request);
  EXPECT_EQ(response.status, executor::Status::TIME_LIMIT);
  EXPECT_LT(response.wall_time_millis, 5000);
}

// NOLINTNEXTLINE
TEST(LocalExecutor, OutputIsTrimmed) {
  executor::LocalExecutor executor(test_tmpdir + "/executor", 2);
  executor::Request request =
      Shell("i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done");
  request.max_output_bytes = 100;
  executor::Response response = executor.Execute(request);
  EXPECT_EQ(response.status, executor::Status::SUCCESS);
  EXPECT_EQ(response.stdout_data.size(), 100 + std::string("\n...\n").size());
  EXPECT_THAT(response.stdout_data, HasSubstr("line0\n"));
  EXPECT_THAT(response.stdout_data, HasSubstr("line499\n"));
}

// NOLINTNEXTLINE
TEST(LocalExecutor, CommandNotFound) {
  executor::LocalExecutor executor(test_tmpdir + "/executor", 2);
  executor::Request request;
  request.executable = "definitely-not-a-command-4242";
  request.cwd = "/";
  EXPECT_THROW(executor.Execute(request),  // NOLINT
               executor::execution_failed);
}

// NOLINTNEXTLINE
TEST(LocalExecutor, ConcurrentCallersShareSlots) {
  executor::LocalExecutor executor(test_tmpdir + "/executor", 1);
  std::vector<std::thread> threads;
  std::vector<executor::Status> statuses(4);
  for (size_t i = 0; i < statuses.size(); i++) {
    threads.emplace_back([&executor, &statuses, i]() {
      statuses[i] = executor.Execute(Shell("sleep 0.05")).status;
    });
  }
  for (std::thread& t : threads) t.join();
  for (executor::Status status : statuses) {
    EXPECT_EQ(status, executor::Status::SUCCESS);
  }
}

}  // namespace
