#include <vector>

#include "absl/strings/str_cat.h"
#include "grading/ranking_grader.hpp"
#include "tasks/ground_truth.hpp"
#include "tasks/task.hpp"

namespace tasks {

namespace {

struct Order {
  const char* order_id;
  const char* order_date;
  const char* product_id;
  int quantity;
  const char* unit_price;
};

struct Dataset {
  std::vector<std::pair<const char*, const char*>> products;
  std::vector<Order> orders;
  std::vector<const char*> returns;
};

const std::vector<Dataset> kVariants = {
    {
        {{"W1", "widgets"}, {"G1", "gadgets"}, {"A1", "accessories"}},
        {
            {"1001", "2023-04-03", "W1", 2, "20.0"},
            {"1002", "2023-04-20", "G1", 1, "45.0"},
            {"1003", "2023-05-05", "A1", 5, "12.0"},
            {"1004", "2023-06-15", "W1", 1, "20.0"},
        },
        {"1002"},
    },
    {
        {{"P1", "hardware"}, {"P2", "hardware"}, {"P3", "software"}},
        {
            {"2001", "2023-04-11", "P1", 1, "120.0"},
            {"2002", "2023-05-19", "P2", 2, "90.0"},
            {"2003", "2023-06-02", "P3", 3, "40.0"},
        },
        {},
    },
    {
        {{"C1", "cloud"}, {"S1", "support"}},
        {
            {"3001", "2023-05-01", "C1", 10, "15.0"},
            {"3002", "2023-05-15", "S1", 1, "200.0"},
        },
        {},
    },
};

const char* kReadme =
    "products.csv: product_id, category\n"
    "orders.csv: order_id, order_date (YYYY-MM-DD), product_id, quantity, "
    "unit_price\n"
    "returns.csv: order_id of every returned order\n";

const char* kPrompt =
    "The CSV files under data/ describe the orders of a shop. Compute the "
    "revenue (quantity * unit_price) of each product category for the orders "
    "placed between 2023-04-01 and 2023-06-30 included, leaving out returned "
    "orders. Report the top 3 categories by descending revenue, then by "
    "category name, each as {\"category\", \"revenue\"} with revenue rounded "
    "to 2 decimals.";

Fixture Build(workspace::SandboxInstance* sandbox, uint64_t seed) {
  Fixture fixture;
  fixture.variant = PickVariant(seed, kVariants.size());
  const Dataset& data = kVariants[fixture.variant - 1];

  // Headers are always written, so that empty tables keep their columns.
  std::string products = "product_id,category\n";
  for (const auto& product : data.products) {
    absl::StrAppend(&products, product.first, ",", product.second, "\n");
  }
  std::string orders = "order_id,order_date,product_id,quantity,unit_price\n";
  for (const Order& order : data.orders) {
    absl::StrAppend(&orders, order.order_id, ",", order.order_date, ",",
                    order.product_id, ",", order.quantity, ",",
                    order.unit_price, "\n");
  }
  std::string returns = "order_id\n";
  for (const char* order_id : data.returns) {
    absl::StrAppend(&returns, order_id, "\n");
  }

  sandbox->WriteFile("data/products.csv", products);
  sandbox->WriteFile("data/orders.csv", orders);
  sandbox->WriteFile("data/returns.csv", returns);
  sandbox->WriteFile("data/README.txt", kReadme);
  fixture.expected = Q2Revenue(products, orders, returns);
  return fixture;
}

TaskSpec Make() {
  return TaskSpec{
      "sql_q2_revenue",
      kPrompt,
      {"sql_query", "file_read", "python_expression"},
      envelope::AnswerSchema::Ranking("category", "revenue",
                                      /*integral=*/false),
      Build,
      std::make_shared<grading::RankingGrader>(0.01),
      6};
}

Catalog::Register r(Make);

}  // namespace

}  // namespace tasks
