#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace sqlrpc {

struct DatabaseError {
  std::string message;
};

template <typename T>
using DbResult = std::expected<T, DatabaseError>;

struct Table {
  std::vector<std::string> column_names;
  // Array of row arrays; SQLite integers, reals, text and NULL map onto the
  // matching JSON types, blobs become lowercase hex.
  nlohmann::json rows = nlohmann::json::array();

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

class SqliteAdapter {
public:
  explicit SqliteAdapter(std::string_view db_path);
  ~SqliteAdapter();

  SqliteAdapter(const SqliteAdapter&) = delete;
  SqliteAdapter& operator=(const SqliteAdapter&) = delete;

  // Also registers the sleep(seconds) SQL function.
  [[nodiscard]] auto open() -> DbResult<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  // Runs every statement in `sql` and returns the rows of the last one that
  // produced columns.
  [[nodiscard]] auto query(std::string_view sql) -> DbResult<Table>;
  [[nodiscard]] auto execute(std::string_view sql) -> DbResult<void>;
  // First column of the first row, as an integer.
  [[nodiscard]] auto query_int(std::string_view sql) -> DbResult<std::int64_t>;

  // "table", "view" or nullopt when `name` does not exist in `schema`.
  [[nodiscard]] auto relation_type(std::string_view schema,
                                   std::string_view name)
      -> DbResult<std::optional<std::string>>;
  [[nodiscard]] auto drop_relation(std::string_view schema,
                                   std::string_view name) -> DbResult<void>;

  // Values are bound as integer, real, text or NULL depending on how they
  // parse.
  [[nodiscard]] auto insert_rows(
      std::string_view relation, const std::vector<std::string>& columns,
      const std::vector<std::vector<std::optional<std::string>>>& rows)
      -> DbResult<std::size_t>;

  [[nodiscard]] auto begin_transaction() -> DbResult<void>;
  [[nodiscard]] auto commit_transaction() -> DbResult<void>;
  [[nodiscard]] auto rollback_transaction() -> DbResult<void>;

private:
  [[nodiscard]] auto last_error() const -> DatabaseError;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace sqlrpc
