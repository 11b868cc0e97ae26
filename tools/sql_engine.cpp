#include "tools/sql_engine.hpp"

#include <sqlite3.h>

#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "tools/tool.hpp"
#include "util/file.hpp"

namespace tools {

namespace {

// Virtual machine instructions between two deadline checks.
const int kProgressOps = 1000;
const int64_t kMaxCsvBytes = 16 << 20;

enum ColumnType { INTEGER, REAL, TEXT };

std::string Quote(const std::string& identifier) {
  std::string quoted = "\"";
  for (char c : identifier) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  return quoted + "\"";
}

ColumnType InferType(const std::vector<CsvRow>& rows, size_t column) {
  ColumnType type = INTEGER;
  for (size_t i = 1; i < rows.size(); i++) {
    if (column >= rows[i].size() || rows[i][column].empty()) continue;
    const std::string& value = rows[i][column];
    int64_t as_int;
    double as_double;
    if (type == INTEGER && absl::SimpleAtoi(value, &as_int)) continue;
    if (absl::SimpleAtod(value, &as_double)) {
      type = REAL;
      continue;
    }
    return TEXT;
  }
  return type;
}

int DeadlineHandler(void* data) {
  auto* deadline = static_cast<std::chrono::steady_clock::time_point*>(data);
  return std::chrono::steady_clock::now() >= *deadline ? 1 : 0;
}

// Once sealed, the connection may not attach files or change pragmas.
int SealedAuthorizer(void* /*data*/, int action, const char* /*arg1*/,
                     const char* /*arg2*/, const char* /*db*/,
                     const char* /*trigger*/) {
  switch (action) {
    case SQLITE_ATTACH:
    case SQLITE_DETACH:
    case SQLITE_PRAGMA:
      return SQLITE_DENY;
    default:
      return SQLITE_OK;
  }
}

class Statement {
 public:
  Statement() = default;
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  sqlite3_stmt** Out() { return &stmt_; }
  sqlite3_stmt* Get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

nlohmann::json ColumnValue(sqlite3_stmt* stmt, int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_INTEGER:
      return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, column);
    case SQLITE_NULL:
      return nullptr;
    default: {
      const unsigned char* text = sqlite3_column_text(stmt, column);
      int size = sqlite3_column_bytes(stmt, column);
      return std::string(reinterpret_cast<const char*>(text), size);
    }
  }
}

}  // namespace

std::vector<CsvRow> ParseCsv(const std::string& text) {
  std::vector<CsvRow> rows;
  CsvRow row;
  std::string field;
  bool in_quotes = false;
  bool row_started = false;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < text.size() && text[i + 1] == '"') {
        field += '"';
        i++;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        field += c;
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
      row_started = true;
    } else if (c == ',') {
      row.push_back(std::move(field));
      field.clear();
      row_started = true;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') i++;
      if (row_started || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
      }
      field.clear();
      row.clear();
      row_started = false;
    } else {
      field += c;
      row_started = true;
    }
  }
  if (row_started || !field.empty()) {
    row.push_back(std::move(field));
    rows.push_back(std::move(row));
  }
  return rows;
}

std::string TableName(const std::string& stem) {
  std::string name;
  for (char c : stem) name += absl::ascii_isalnum(c) || c == '_' ? c : '_';
  if (name.empty() || absl::ascii_isdigit(name[0])) name = "t_" + name;
  return name;
}

SqlEngine::SqlEngine() {
  if (sqlite3_open_v2(":memory:", &db_,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_MEMORY,
                      nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw tool_error(ErrorKind::TOOL_EXECUTION_ERROR,
                     "Cannot open the SQL engine: " + msg);
  }
}

SqlEngine::~SqlEngine() { sqlite3_close(db_); }

void SqlEngine::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
    std::string msg = error ? error : sqlite3_errmsg(db_);
    sqlite3_free(error);
    throw tool_error(ErrorKind::QUERY_ERROR, msg);
  }
}

void SqlEngine::LoadCsv(const std::string& table, const std::string& content) {
  std::vector<CsvRow> rows = ParseCsv(content);
  if (rows.empty()) {
    LOG(WARNING) << "Skipping table " << table << ": no header";
    return;
  }

  std::vector<std::string> columns;
  std::set<std::string> seen;
  for (size_t i = 0; i < rows[0].size(); i++) {
    std::string name(absl::StripAsciiWhitespace(rows[0][i]));
    if (name.empty()) name = "column" + std::to_string(i + 1);
    std::string unique = name;
    for (int n = 2; seen.count(absl::AsciiStrToLower(unique)); n++) {
      unique = name + "_" + std::to_string(n);
    }
    seen.insert(absl::AsciiStrToLower(unique));
    columns.push_back(unique);
  }

  std::vector<ColumnType> types;
  std::vector<std::string> definitions;
  for (size_t i = 0; i < columns.size(); i++) {
    types.push_back(InferType(rows, i));
    const char* type_name =
        types[i] == INTEGER ? "INTEGER" : types[i] == REAL ? "REAL" : "TEXT";
    definitions.push_back(Quote(columns[i]) + " " + type_name);
  }
  Exec("CREATE TABLE " + Quote(table) + " (" +
       absl::StrJoin(definitions, ", ") + ")");

  std::vector<std::string> placeholders(columns.size(), "?");
  Statement insert;
  std::string sql = "INSERT INTO " + Quote(table) + " VALUES (" +
                    absl::StrJoin(placeholders, ", ") + ")";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, insert.Out(), nullptr) !=
      SQLITE_OK) {
    throw tool_error(ErrorKind::QUERY_ERROR, sqlite3_errmsg(db_));
  }
  Exec("BEGIN");
  for (size_t r = 1; r < rows.size(); r++) {
    sqlite3_reset(insert.Get());
    for (size_t i = 0; i < columns.size(); i++) {
      int index = static_cast<int>(i) + 1;
      if (i >= rows[r].size() || rows[r][i].empty()) {
        sqlite3_bind_null(insert.Get(), index);
        continue;
      }
      const std::string& value = rows[r][i];
      int64_t as_int = 0;
      double as_double = 0;
      if (types[i] == INTEGER && absl::SimpleAtoi(value, &as_int)) {
        sqlite3_bind_int64(insert.Get(), index, as_int);
      } else if (types[i] != TEXT && absl::SimpleAtod(value, &as_double)) {
        sqlite3_bind_double(insert.Get(), index, as_double);
      } else {
        sqlite3_bind_text(insert.Get(), index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
      }
    }
    if (sqlite3_step(insert.Get()) != SQLITE_DONE) {
      std::string msg = sqlite3_errmsg(db_);
      Exec("ROLLBACK");
      throw tool_error(ErrorKind::QUERY_ERROR, msg);
    }
  }
  Exec("COMMIT");
  tables_.push_back(table);
  VLOG(2) << "Loaded table " << table << " with " << rows.size() - 1
          << " rows";
}

void SqlEngine::Seal() {
  Exec("PRAGMA query_only = 1");
  sqlite3_set_authorizer(db_, &SealedAuthorizer, nullptr);
}

nlohmann::json SqlEngine::Query(
    const std::string& sql, size_t max_rows,
    std::chrono::steady_clock::time_point deadline) {
  if (absl::StripAsciiWhitespace(sql).empty()) {
    throw tool_error(ErrorKind::QUERY_ERROR, "Empty query");
  }
  sqlite3_progress_handler(db_, kProgressOps, &DeadlineHandler, &deadline);
  struct ResetHandler {
    sqlite3* db;
    ~ResetHandler() { sqlite3_progress_handler(db, 0, nullptr, nullptr); }
  } reset_handler{db_};

  auto fail = [this](int code) {
    if (code == SQLITE_INTERRUPT) {
      throw tool_error(ErrorKind::TOOL_TIMEOUT, "Query interrupted: timeout");
    }
    throw tool_error(ErrorKind::QUERY_ERROR, sqlite3_errmsg(db_));
  };

  Statement stmt;
  const char* tail = nullptr;
  int code = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), stmt.Out(),
                                &tail);
  if (code != SQLITE_OK) fail(code);
  if (stmt.Get() == nullptr) {
    throw tool_error(ErrorKind::QUERY_ERROR, "Empty query");
  }
  std::string rest(tail, sql.c_str() + sql.size() - tail);
  if (rest.find_first_not_of("; \t\r\n") != std::string::npos) {
    throw tool_error(ErrorKind::QUERY_ERROR,
                     "Only a single statement is allowed");
  }
  if (!sqlite3_stmt_readonly(stmt.Get())) {
    throw tool_error(ErrorKind::QUERY_ERROR, "Only read queries are allowed");
  }

  nlohmann::json result;
  int num_columns = sqlite3_column_count(stmt.Get());
  std::vector<std::string> columns;
  for (int i = 0; i < num_columns; i++) {
    columns.emplace_back(sqlite3_column_name(stmt.Get(), i));
  }
  result["columns"] = columns;
  result["rows"] = nlohmann::json::array();
  result["truncated"] = false;
  while ((code = sqlite3_step(stmt.Get())) == SQLITE_ROW) {
    if (result["rows"].size() == max_rows) {
      result["truncated"] = true;
      break;
    }
    nlohmann::json row = nlohmann::json::object();
    for (int i = 0; i < num_columns; i++) {
      row[columns[i]] = ColumnValue(stmt.Get(), i);
    }
    result["rows"].push_back(row);
  }
  if (code != SQLITE_ROW && code != SQLITE_DONE) fail(code);
  return result;
}

namespace {

class SqlQuery : public Tool {
 public:
  std::string Name() const override { return "sql_query"; }
  std::string Description() const override {
    return "sql_query(query): one read-only SQLite query over the sandbox CSV "
           "files, each a table named after its file";
  }

  nlohmann::json Call(const nlohmann::json& args,
                      const ToolContext& context) const override {
    std::string query = StringArg(args, "query");
    SqlEngine engine;
    const std::string& root = context.resolver->Root();
    for (const util::File::Entry& entry : util::File::ListTree(root)) {
      if (entry.is_directory || !absl::EndsWith(entry.path, ".csv")) continue;
      context.CheckDeadline();
      std::string base = util::File::BaseName(entry.path);
      std::string table = TableName(base.substr(0, base.size() - 4));
      std::string absolute = util::File::JoinPath(root, entry.path);
      bool taken = false;
      for (const std::string& loaded : engine.Tables()) {
        if (absl::EqualsIgnoreCase(loaded, table)) taken = true;
      }
      if (taken || util::File::Size(absolute) > kMaxCsvBytes) {
        VLOG(1) << "Not loading " << entry.path << " as table " << table;
        continue;
      }
      engine.LoadCsv(table, util::File::Read(absolute));
    }
    engine.Seal();
    nlohmann::json result =
        engine.Query(query, context.limits.max_sql_rows, context.deadline);
    result["tables"] = engine.Tables();
    return result;
  }
};

Tool::Register<SqlQuery> r;

}  // namespace

}  // namespace tools
