#ifndef TASKS_GROUND_TRUTH_HPP
#define TASKS_GROUND_TRUTH_HPP

#include <string>
#include <vector>

#include "envelope/envelope.hpp"
#include "workspace/sandbox_instance.hpp"

namespace tasks {

// Sorted paths of the env files (names starting with ".env") that hold a
// line beginning with "SECRET=", outside the top-level tests/ folder.
std::vector<std::string> LiveEnvFiles(const workspace::SandboxInstance& sandbox);

// Top 5 client IPs by 5xx responses in a combined-format access log,
// ignoring user agents that contain "bot" in any case. Ordered by descending
// count, then IP.
envelope::RankingAnswer Top5xx(const std::string& log);

// Top 3 categories by revenue (quantity * unit_price) of the orders placed in
// Q2 2023 and never returned, ordered by descending revenue, then category.
// Revenues are rounded to cents.
envelope::RankingAnswer Q2Revenue(const std::string& products_csv,
                                  const std::string& orders_csv,
                                  const std::string& returns_csv);

}  // namespace tasks

#endif
