#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tools/tool_registry.hpp"
#include "util/which.hpp"
#include "workspace/sandbox_instance.hpp"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";

class PythonExpressionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::which("python3").empty()) {
      GTEST_SKIP() << "python3 is required";
    }
    sandbox_.reset(new workspace::SandboxInstance(test_tmpdir));
    executor_.reset(
        new executor::LocalExecutor(test_tmpdir + "/executor", 2));
    tools::ToolLimits limits;
    limits.timeout_millis = 20000;
    limits.expression_cpu_millis = 1000;
    registry_.reset(new tools::ToolRegistry(&sandbox_->Resolver(),
                                            executor_.get(), limits, {}));
  }

  tools::ToolCall Eval(const std::string& expr) {
    return registry_->Invoke("python_expression", {{"expr", expr}});
  }

  std::string ErrorOf(const std::string& expr) {
    tools::ToolCall call = Eval(expr);
    EXPECT_FALSE(call.ok()) << call.Response().dump();
    if (call.ok()) return "";
    EXPECT_EQ(call.error->kind, tools::ErrorKind::EVALUATION_ERROR) << expr;
    return call.error->message;
  }

  std::unique_ptr<workspace::SandboxInstance> sandbox_;
  std::unique_ptr<executor::LocalExecutor> executor_;
  std::unique_ptr<tools::ToolRegistry> registry_;
};

// NOLINTNEXTLINE
TEST_F(PythonExpressionTest, Values) {
  tools::ToolCall call = Eval("round(sum([40.0, 20.0]) / 3, 2)");
  ASSERT_TRUE(call.ok()) << call.Response().dump();
  EXPECT_DOUBLE_EQ(call.result["value"].get<double>(), 20.0);

  call = Eval("sorted({'b': 2, 'a': 1}.items(), key=lambda kv: -kv[1])");
  ASSERT_TRUE(call.ok());
  EXPECT_EQ(call.result["value"], nlohmann::json::parse("[[\"b\", 2], [\"a\", 1]]"));

  call = Eval("{'pi': round(math.pi, 3), 'ok': True, 'none': None}");
  ASSERT_TRUE(call.ok());
  EXPECT_EQ(call.result["value"]["pi"], 3.142);
  EXPECT_EQ(call.result["value"]["ok"], true);
  EXPECT_TRUE(call.result["value"]["none"].is_null());

  call = Eval("'10.0.0.1 - - x'.split()[0]");
  ASSERT_TRUE(call.ok());
  EXPECT_EQ(call.result["value"], "10.0.0.1");
}

// NOLINTNEXTLINE
TEST_F(PythonExpressionTest, Restricted) {
  EXPECT_THAT(ErrorOf("__import__('os').system('true')"),
              HasSubstr("not allowed"));
  EXPECT_THAT(ErrorOf("().__class__.__bases__"), HasSubstr("not allowed"));
  EXPECT_THAT(ErrorOf("open('/etc/passwd')"), HasSubstr("NameError"));
  EXPECT_THAT(ErrorOf("import os"), HasSubstr("SyntaxError"));
  EXPECT_THAT(ErrorOf("'{0.__class__}'.format(1)"), HasSubstr("not allowed"));
}

// NOLINTNEXTLINE
TEST_F(PythonExpressionTest, NoFrameIntrospection) {
  // A generator frame leads back to the evaluating frames and their globals.
  EXPECT_THAT(
      ErrorOf("[L := [], g := (y.gi_frame.f_back.f_back.f_globals['sys']"
              ".modules['os'].listdir('/') for y in L), L.append(g), "
              "list(g)][3]"),
      HasSubstr("not allowed"));
  EXPECT_THAT(ErrorOf("[(x for x in [1]).gi_frame]"),
              HasSubstr("attribute 'gi_frame' is not allowed"));
  EXPECT_THAT(ErrorOf("(lambda math: math.f_globals)(1)"),
              HasSubstr("attribute 'f_globals' is not allowed"));
  EXPECT_THAT(ErrorOf("[n := 1]"), HasSubstr("not allowed"));

  tools::ToolCall call = Eval("math.sqrt(16) + 'a-b'.split('-').count('a')");
  ASSERT_TRUE(call.ok()) << call.Response().dump();
  EXPECT_DOUBLE_EQ(call.result["value"].get<double>(), 5.0);
}

// NOLINTNEXTLINE
TEST_F(PythonExpressionTest, Errors) {
  EXPECT_THAT(ErrorOf("1 / 0"), HasSubstr("ZeroDivisionError"));
  EXPECT_THAT(ErrorOf("float('inf')"), HasSubstr("finite"));
  EXPECT_THAT(ErrorOf("len"), HasSubstr("cannot return"));
  EXPECT_THAT(ErrorOf(""), HasSubstr("Empty"));
}

// NOLINTNEXTLINE
TEST_F(PythonExpressionTest, CpuBound) {
  tools::ToolCall call = Eval("sum(i * i for i in range(10 ** 12))");
  ASSERT_FALSE(call.ok());
  EXPECT_EQ(call.error->kind, tools::ErrorKind::TOOL_TIMEOUT);
}

}  // namespace
