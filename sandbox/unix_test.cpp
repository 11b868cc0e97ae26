#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

namespace {

using ::testing::Contains;
using ::testing::StartsWith;

using namespace sandbox;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";
const char* kShell = "/bin/sh";

ExecutionOptions ShellOptions(const std::string& root,
                              const std::string& script) {
  ExecutionOptions options(root, kShell);
  options.args.push_back("-c");
  options.args.push_back(script);
  return options;
}

// NOLINTNEXTLINE
TEST(SandboxRegistryTest, UnixIsRegistered) {
  EXPECT_THAT(Sandbox::Backends(), Contains("unix"));
  EXPECT_TRUE(Sandbox::Create("unix"));
}

// NOLINTNEXTLINE
TEST(SandboxRegistryTest, UnknownBackend) {
  EXPECT_FALSE(Sandbox::Create("no-such-sandbox"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("/nonexistent/foo", kShell);
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("/", "/nonexistent/foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnCode) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "exit 15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.exit_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed_on_wall_limit);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignal) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "kill -6 $$");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.exit_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestRedirection) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/stdin", "hello");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options =
      ShellOptions(tmp.Path(), "cat; echo; pwd; echo oops >&2");
  options.stdin_path = tmp.Path() + "/stdin";
  options.stdout_path = tmp.Path() + "/stdout";
  options.stderr_path = tmp.Path() + "/stderr";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(util::File::Read(tmp.Path() + "/stdout"),
            "hello\n" + tmp.Path() + "\n");
  EXPECT_EQ(util::File::Read(tmp.Path() + "/stderr"), "oops\n");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestEnvironment) {
  util::TempDir tmp(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "echo $HPY_SANDBOX");
  options.env.push_back("HPY_SANDBOX=/some/root");
  options.stdout_path = tmp.Path() + "/stdout";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(util::File::Read(tmp.Path() + "/stdout"), "/some/root\n");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "sleep 0.1");
  options.limits.wall_millis = 2000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_FALSE(info.killed_on_wall_limit);
  EXPECT_GE(info.wall_millis, 90);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "sleep 5");
  options.limits.wall_millis = 100;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 9);
  EXPECT_EQ(info.exit_code, 0);
  EXPECT_TRUE(info.killed_on_wall_limit);
  EXPECT_GE(info.wall_millis, 100);
  EXPECT_LE(info.wall_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitKillsGroup) {
  util::TempDir tmp(test_tmpdir);
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  // The background child would write the file after the limit expired.
  ExecutionOptions options = ShellOptions(
      tmp.Path(), "(sleep 0.5; echo late > late.txt) & sleep 5");
  options.limits.wall_millis = 100;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.killed_on_wall_limit);
  usleep(800 * 1000);
  EXPECT_FALSE(util::File::Exists(tmp.Path() + "/late.txt"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = ShellOptions("/", "while :; do :; done");
  options.limits.cpu_millis = 1000;
  options.limits.wall_millis = 10000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_NE(info.signal, 0);
  EXPECT_FALSE(info.killed_on_wall_limit);
  EXPECT_GE(info.user_millis + info.system_millis, 900);
}

}  // namespace
