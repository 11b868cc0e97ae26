#include "tools/sql_engine.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tools/tool_registry.hpp"
#include "workspace/sandbox_instance.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using tools::CsvRow;
using tools::ErrorKind;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";

std::chrono::steady_clock::time_point Later() {
  return std::chrono::steady_clock::now() + std::chrono::seconds(10);
}

ErrorKind QueryKind(tools::SqlEngine* engine, const std::string& sql) {
  try {
    engine->Query(sql, 10, Later());
  } catch (const tools::tool_error& exc) {
    return exc.kind();
  }
  ADD_FAILURE() << "query succeeded: " << sql;
  return ErrorKind::TOOL_EXECUTION_ERROR;
}

// NOLINTNEXTLINE
TEST(ParseCsv, QuotesAndLineEndings) {
  EXPECT_THAT(tools::ParseCsv("a,b\r\n1,\"x, \"\"y\"\"\"\n\n2,\"multi\nline\"\n"),
              ElementsAre(CsvRow{"a", "b"}, CsvRow{"1", "x, \"y\""},
                          CsvRow{"2", "multi\nline"}));
  EXPECT_THAT(tools::ParseCsv("a,,\n"), ElementsAre(CsvRow{"a", "", ""}));
  EXPECT_THAT(tools::ParseCsv("last"), ElementsAre(CsvRow{"last"}));
  EXPECT_TRUE(tools::ParseCsv("").empty());
}

// NOLINTNEXTLINE
TEST(TableName, Sanitized) {
  EXPECT_EQ(tools::TableName("orders"), "orders");
  EXPECT_EQ(tools::TableName("sales-2023 q2"), "sales_2023_q2");
  EXPECT_EQ(tools::TableName("2023"), "t_2023");
}

class SqlEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_.LoadCsv("orders",
                    "order_id,order_date,product_id,quantity,unit_price\n"
                    "1001,2023-04-03,W1,2,20.0\n"
                    "1002,2023-04-20,G1,1,45.0\n"
                    "1003,2023-05-05,A1,5,12.0\n");
    engine_.LoadCsv("products", "product_id,category\nW1,widgets\n"
                                "G1,gadgets\nA1,accessories\n");
    engine_.Seal();
  }

  tools::SqlEngine engine_;
};

// NOLINTNEXTLINE
TEST_F(SqlEngineTest, TypedColumns) {
  nlohmann::json result = engine_.Query(
      "SELECT p.category, SUM(o.quantity * o.unit_price) AS revenue "
      "FROM orders o JOIN products p USING (product_id) "
      "GROUP BY p.category ORDER BY revenue DESC, p.category",
      10, Later());
  EXPECT_THAT(result["columns"].get<std::vector<std::string>>(),
              ElementsAre("category", "revenue"));
  ASSERT_EQ(result["rows"].size(), 3);
  EXPECT_EQ(result["rows"][0]["category"], "accessories");
  EXPECT_DOUBLE_EQ(result["rows"][0]["revenue"].get<double>(), 60.0);
  EXPECT_EQ(result["truncated"], false);

  result = engine_.Query("SELECT typeof(order_id), typeof(order_date) "
                         "FROM orders LIMIT 1",
                         10, Later());
  EXPECT_EQ(result["rows"][0]["typeof(order_id)"], "integer");
  EXPECT_EQ(result["rows"][0]["typeof(order_date)"], "text");
}

// NOLINTNEXTLINE
TEST_F(SqlEngineTest, RowCap) {
  nlohmann::json result = engine_.Query("SELECT * FROM orders", 2, Later());
  EXPECT_EQ(result["rows"].size(), 2);
  EXPECT_EQ(result["truncated"], true);
}

// NOLINTNEXTLINE
TEST_F(SqlEngineTest, MalformedQueries) {
  EXPECT_EQ(QueryKind(&engine_, "SELEC 1"), ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "SELECT * FROM missing"),
            ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "   "), ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "SELECT 1; SELECT 2"), ErrorKind::QUERY_ERROR);
  EXPECT_NO_THROW(engine_.Query("SELECT 1;", 10, Later()));  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(SqlEngineTest, ReadOnly) {
  EXPECT_EQ(QueryKind(&engine_, "DELETE FROM orders"), ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "DROP TABLE orders"), ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "PRAGMA query_only = 0"),
            ErrorKind::QUERY_ERROR);
  EXPECT_EQ(QueryKind(&engine_, "ATTACH DATABASE '/tmp/x.db' AS x"),
            ErrorKind::QUERY_ERROR);
  nlohmann::json result =
      engine_.Query("SELECT COUNT(*) AS n FROM orders", 10, Later());
  EXPECT_EQ(result["rows"][0]["n"], 3);
}

// NOLINTNEXTLINE
TEST_F(SqlEngineTest, Deadline) {
  try {
    engine_.Query(
        "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
        "SELECT MAX(x) FROM c",
        10, std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
    FAIL() << "the query should have been interrupted";
  } catch (const tools::tool_error& exc) {
    EXPECT_EQ(exc.kind(), ErrorKind::TOOL_TIMEOUT);
  }
}

// NOLINTNEXTLINE
TEST(SqlQueryTool, LoadsSandboxCsvFiles) {
  workspace::SandboxInstance sandbox(test_tmpdir);
  sandbox.WriteFile("data/orders.csv", "id,total\n1,2.5\n2,4\n");
  sandbox.WriteFile("data/README.txt", "not a table");
  tools::ToolRegistry registry(&sandbox.Resolver(), nullptr,
                               tools::ToolLimits(), {});
  tools::ToolCall call =
      registry.Invoke("sql_query", {{"query", "SELECT SUM(total) AS s FROM orders"}});
  ASSERT_TRUE(call.ok()) << call.Response().dump();
  EXPECT_DOUBLE_EQ(call.result["rows"][0]["s"].get<double>(), 6.5);
  EXPECT_THAT(call.result["tables"].get<std::vector<std::string>>(),
              ElementsAre("orders"));

  call = registry.Invoke("sql_query", {{"query", "SELECT nope FROM orders"}});
  ASSERT_FALSE(call.ok());
  EXPECT_EQ(call.Response()["error"]["kind"], "QueryError");
  EXPECT_THAT(call.error->message, HasSubstr("nope"));
}

}  // namespace
