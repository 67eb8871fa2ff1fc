#include "sqlrpc/database/sqlite_adapter.hpp"

#include "sqlrpc/project/project.hpp"

#include <sqlite3.h>

#include <charconv>
#include <chrono>
#include <format>
#include <thread>

namespace sqlrpc {

namespace {

auto sleep_function(sqlite3_context* ctx, int argc, sqlite3_value** argv)
    -> void {
  if (argc != 1) {
    sqlite3_result_error(ctx, "sleep() takes exactly one argument", -1);
    return;
  }
  auto seconds = sqlite3_value_double(argv[0]);
  if (seconds > 0) {
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
  }
  sqlite3_result_null(ctx);
}

auto column_value(sqlite3_stmt* stmt, int col) -> nlohmann::json {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, col);
    case SQLITE_TEXT: {
      const auto* p =
          reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
      return std::string(p, static_cast<std::size_t>(
                                sqlite3_column_bytes(stmt, col)));
    }
    case SQLITE_BLOB: {
      const auto* p =
          static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
      auto n = sqlite3_column_bytes(stmt, col);
      std::string hex;
      hex.reserve(static_cast<std::size_t>(n) * 2);
      for (int i = 0; i < n; ++i) {
        hex += std::format("{:02x}", p[i]);
      }
      return hex;
    }
    default:
      return nullptr;
  }
}

auto bind_value(sqlite3_stmt* stmt, int idx,
                const std::optional<std::string>& value) -> int {
  if (!value) {
    return sqlite3_bind_null(stmt, idx);
  }
  const auto* first = value->data();
  const auto* last = first + value->size();

  std::int64_t i = 0;
  if (auto [ptr, ec] = std::from_chars(first, last, i);
      ec == std::errc{} && ptr == last) {
    return sqlite3_bind_int64(stmt, idx, i);
  }
  double d = 0;
  if (auto [ptr, ec] = std::from_chars(first, last, d);
      ec == std::errc{} && ptr == last) {
    return sqlite3_bind_double(stmt, idx, d);
  }
  return sqlite3_bind_text(stmt, idx, value->c_str(),
                           static_cast<int>(value->size()), SQLITE_TRANSIENT);
}

auto is_blank(std::string_view sql) -> bool {
  return sql.find_first_not_of(" \t\r\n;") == std::string_view::npos;
}

}  // namespace

auto Table::to_json() const -> nlohmann::json {
  return {{"column_names", column_names}, {"rows", rows}};
}

auto SqliteAdapter::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteAdapter::Statement::~Statement() {
  reset();
}

auto SqliteAdapter::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteAdapter::SqliteAdapter(std::string_view db_path) : db_path_(db_path) {
}

SqliteAdapter::~SqliteAdapter() {
  close();
}

auto SqliteAdapter::open() -> DbResult<void> {
  if (db_) {
    return {};
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    DatabaseError err{raw_db ? sqlite3_errmsg(raw_db) : "out of memory"};
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return std::unexpected(std::move(err));
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  rc = sqlite3_create_function(db_.get(), "sleep", 1,
                               SQLITE_UTF8, nullptr,
                               sleep_function, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    auto err = last_error();
    close();
    return std::unexpected(std::move(err));
  }
  return {};
}

auto SqliteAdapter::close() -> void {
  db_.reset();
}

auto SqliteAdapter::last_error() const -> DatabaseError {
  if (!db_) {
    return {"database is not open"};
  }
  return {sqlite3_errmsg(db_.get())};
}

auto SqliteAdapter::query(std::string_view sql) -> DbResult<Table> {
  if (!db_) {
    return std::unexpected(last_error());
  }

  Table table;
  std::string text{sql};
  const char* cursor = text.c_str();
  const char* end = text.c_str() + text.size();

  while (cursor < end && !is_blank({cursor, static_cast<std::size_t>(end - cursor)})) {
    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db_.get(), cursor, static_cast<int>(end - cursor),
                           &raw, &tail) != SQLITE_OK) {
      return std::unexpected(last_error());
    }
    Statement stmt(raw);
    cursor = tail;
    if (!stmt) {
      // Comment-only remainder.
      continue;
    }

    int columns = sqlite3_column_count(stmt.get());
    if (columns > 0) {
      table = Table{};
      for (int c = 0; c < columns; ++c) {
        const char* name = sqlite3_column_name(stmt.get(), c);
        table.column_names.emplace_back(name ? name : "");
      }
    }

    for (;;) {
      int rc = sqlite3_step(stmt.get());
      if (rc == SQLITE_DONE) {
        break;
      }
      if (rc != SQLITE_ROW) {
        return std::unexpected(last_error());
      }
      auto row = nlohmann::json::array();
      for (int c = 0; c < columns; ++c) {
        row.push_back(column_value(stmt.get(), c));
      }
      table.rows.push_back(std::move(row));
    }
  }
  return table;
}

auto SqliteAdapter::execute(std::string_view sql) -> DbResult<void> {
  if (!db_) {
    return std::unexpected(last_error());
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    DatabaseError err{err_msg ? err_msg : sqlite3_errstr(rc)};
    sqlite3_free(err_msg);
    return std::unexpected(std::move(err));
  }
  return {};
}

auto SqliteAdapter::query_int(std::string_view sql) -> DbResult<std::int64_t> {
  auto table = query(sql);
  if (!table) {
    return std::unexpected(table.error());
  }
  if (table->rows.empty() || table->rows[0].empty() ||
      !table->rows[0][0].is_number_integer()) {
    return std::unexpected(DatabaseError{"query did not return an integer"});
  }
  return table->rows[0][0].get<std::int64_t>();
}

auto SqliteAdapter::relation_type(std::string_view schema,
                                  std::string_view name)
    -> DbResult<std::optional<std::string>> {
  if (!db_) {
    return std::unexpected(last_error());
  }
  auto sql = std::format("SELECT type FROM {}.sqlite_master WHERE name = ? "
                         "AND type IN ('table', 'view')",
                         quote_identifier(schema));
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) !=
      SQLITE_OK) {
    return std::unexpected(last_error());
  }
  Statement stmt(raw);
  sqlite3_bind_text(stmt.get(), 1, name.data(), static_cast<int>(name.size()),
                    SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    const auto* p =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    return std::optional<std::string>{p ? p : ""};
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(last_error());
  }
  return std::optional<std::string>{};
}

auto SqliteAdapter::drop_relation(std::string_view schema,
                                  std::string_view name) -> DbResult<void> {
  auto type = relation_type(schema, name);
  if (!type) {
    return std::unexpected(type.error());
  }
  if (!*type) {
    return {};
  }
  return execute(std::format("DROP {} IF EXISTS {}.{}",
                             **type == "view" ? "VIEW" : "TABLE",
                             quote_identifier(schema), quote_identifier(name)));
}

auto SqliteAdapter::insert_rows(
    std::string_view relation, const std::vector<std::string>& columns,
    const std::vector<std::vector<std::optional<std::string>>>& rows)
    -> DbResult<std::size_t> {
  if (!db_) {
    return std::unexpected(last_error());
  }
  std::string column_list;
  std::string placeholders;
  for (const auto& col : columns) {
    if (!column_list.empty()) {
      column_list += ", ";
      placeholders += ", ";
    }
    column_list += quote_identifier(col);
    placeholders += "?";
  }
  auto sql = std::format("INSERT INTO {} ({}) VALUES ({})", relation,
                         column_list, placeholders);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) !=
      SQLITE_OK) {
    return std::unexpected(last_error());
  }
  Statement stmt(raw);

  std::size_t inserted = 0;
  for (const auto& row : rows) {
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    for (std::size_t c = 0; c < row.size(); ++c) {
      if (bind_value(stmt.get(), static_cast<int>(c + 1), row[c]) !=
          SQLITE_OK) {
        return std::unexpected(last_error());
      }
    }
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return std::unexpected(last_error());
    }
    ++inserted;
  }
  return inserted;
}

auto SqliteAdapter::begin_transaction() -> DbResult<void> {
  return execute("BEGIN TRANSACTION;");
}

auto SqliteAdapter::commit_transaction() -> DbResult<void> {
  return execute("COMMIT;");
}

auto SqliteAdapter::rollback_transaction() -> DbResult<void> {
  return execute("ROLLBACK;");
}

}  // namespace sqlrpc
