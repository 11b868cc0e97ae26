#ifndef TOOLS_SQL_ENGINE_HPP
#define TOOLS_SQL_ENGINE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

struct sqlite3;

namespace tools {

using CsvRow = std::vector<std::string>;

// Splits CSV text in rows of fields. Fields may be double-quoted, with ""
// standing for a quote inside them; quoted fields may span lines. Empty lines
// are skipped.
std::vector<CsvRow> ParseCsv(const std::string& text);

// Turns a file name stem into a valid SQL identifier.
std::string TableName(const std::string& stem);

// An in-memory SQLite database over CSV tables. Tables are loaded first;
// Seal then makes the connection read-only for every later query.
class SqlEngine {
 public:
  // Throws tool_error if the database cannot be opened.
  SqlEngine();

  // Creates table from CSV content: the first row holds the column names.
  // Columns whose values are all integers (or all numbers) are typed INTEGER
  // (or REAL), the others TEXT; empty fields are NULL.
  void LoadCsv(const std::string& table, const std::string& content);

  // Forbids any further change to the database.
  void Seal();

  // Runs a single statement and returns {columns, rows, truncated}, rows
  // being objects keyed by column name, at most max_rows of them. Throws
  // tool_error with QUERY_ERROR on invalid or mutating SQL and TOOL_TIMEOUT
  // once deadline passes.
  nlohmann::json Query(const std::string& sql, size_t max_rows,
                       std::chrono::steady_clock::time_point deadline);

  // Names of the loaded tables, in load order.
  const std::vector<std::string>& Tables() const { return tables_; }

  SqlEngine(const SqlEngine&) = delete;
  SqlEngine& operator=(const SqlEngine&) = delete;
  SqlEngine(SqlEngine&&) = delete;
  SqlEngine& operator=(SqlEngine&&) = delete;
  ~SqlEngine();

 private:
  void Exec(const std::string& sql);

  sqlite3* db_ = nullptr;
  std::vector<std::string> tables_;
};

}  // namespace tools

#endif
