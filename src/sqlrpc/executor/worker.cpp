#include "sqlrpc/executor/worker.hpp"

#include "sqlrpc/compiler/compiler.hpp"
#include "sqlrpc/database/sqlite_adapter.hpp"
#include "sqlrpc/project/project_loader.hpp"
#include "sqlrpc/util/util.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>
#include <unordered_set>

#include <unistd.h>

namespace sqlrpc {

auto MessageWriter::log(log::Level level, std::string message) -> void {
  send({{"type", message::kLog},
        {"record",
         log_record_to_json(log::make_record(level, std::move(message)))}});
}

auto MessageWriter::result(nlohmann::json result) -> void {
  send({{"type", message::kResult}, {"result", std::move(result)}});
}

auto MessageWriter::error(const RpcError& error) -> void {
  send({{"type", message::kError}, {"error", error.to_json()}});
}

auto MessageWriter::send(const nlohmann::json& msg) -> void {
  if (!ok_) {
    return;
  }
  auto line =
      msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  line.push_back('\n');

  std::string_view rest = line;
  while (!rest.empty()) {
    auto n = ::write(fd_, rest.data(), rest.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ok_ = false;
      return;
    }
    rest.remove_prefix(static_cast<std::size_t>(n));
  }
}

namespace {

using Clock = std::chrono::system_clock;

inline constexpr std::size_t kSeedPreviewRows = 10;

struct Timing {
  std::string_view name;
  Clock::time_point started_at;
  Clock::time_point completed_at;

  [[nodiscard]] auto to_json() const -> nlohmann::json {
    return {{"name", name},
            {"started_at", format_timestamp_precise(started_at)},
            {"completed_at", format_timestamp_precise(completed_at)}};
  }
  [[nodiscard]] auto as_array() const -> nlohmann::json {
    return nlohmann::json::array({to_json()});
  }
};

auto seconds_since(Clock::time_point start) -> double {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

class Worker {
public:
  Worker(const CompiledProject& project, const WorkRequest& request, int fd)
      : project_(project), request_(request), out_(fd) {
  }

  auto run() -> int {
    switch (request_.method) {
    case TaskMethod::Compile:
    case TaskMethod::Run:
      return run_sql();
    case TaskMethod::CompileProject:
      return compile_project();
    case TaskMethod::RunProject:
      return run_project();
    case TaskMethod::TestProject:
      return test_project();
    case TaskMethod::SeedProject:
      return seed_project();
    }
    out_.error(rpc_error::runtime_error("Unknown task method"));
    return 1;
  }

private:
  // compile / run: a single statement sent by the client.
  auto run_sql() -> int {
    const bool execute = request_.method == TaskMethod::Run;
    auto unique_id = std::format("rpc.{}.{}", project_.name(), request_.name);
    out_.log(log::Level::Debug, std::format("Compiling {}", unique_id));

    Compiler compiler(project_);
    Timing compile{.name = "compile", .started_at = Clock::now()};
    auto compiled = compiler.compile({.name = request_.name,
                                      .sql = request_.sql,
                                      .macros = request_.macros});
    compile.completed_at = Clock::now();
    if (!compiled) {
      out_.log(log::Level::Error,
               std::format("Compilation failed for {}", unique_id));
      out_.error(rpc_error::compilation_error(
          request_.name, compiled.error().message, request_.sql));
      return 1;
    }

    Node node;
    node.unique_id = NodeId{unique_id};
    node.name = request_.name;
    node.original_file_path = "from remote system";
    node.raw_sql = compiled->raw_sql;
    node.compiled_sql = compiled->compiled_sql;
    node.materialized = compiled->materialized.value_or(Materialization::View);
    node.depends_on = compiled->depends_on;
    node.schema = project_.schema();
    node.alias = request_.name;
    auto node_json = node.to_json();
    node_json["resource_type"] = "rpc";

    nlohmann::json result = {{"raw_sql", compiled->raw_sql},
                             {"compiled_sql", compiled->compiled_sql},
                             {"node", std::move(node_json)}};

    Timing exec{.name = "execute", .started_at = Clock::now()};
    if (execute) {
      out_.log(log::Level::Debug, std::format("Executing {}", unique_id));
      auto table = query(compiled->compiled_sql);
      if (!table) {
        out_.log(log::Level::Error,
                 std::format("Database error in {}: {}", unique_id,
                             table.error().message));
        out_.error(rpc_error::database_error(
            request_.name, table.error().message, compiled->raw_sql,
            compiled->compiled_sql));
        return 1;
      }
      result["table"] = table->to_json();
    }
    exec.completed_at = Clock::now();

    result["timing"] =
        nlohmann::json::array({compile.to_json(), exec.to_json()});
    out_.log(log::Level::Debug, std::format("Finished {}", unique_id));
    out_.result(std::move(result));
    return 0;
  }

  auto compile_project() -> int {
    auto started = Clock::now();
    auto results = nlohmann::json::array();
    Compiler compiler(project_);
    for (auto idx : project_.order()) {
      const auto& node = project_.node(idx);
      bool wanted = (node.resource_type == ResourceType::Model &&
                     !node.is_ephemeral()) ||
                    node.resource_type == ResourceType::Test;
      if (!wanted || !selected(node)) {
        continue;
      }
      auto node_started = Clock::now();
      Timing compile{.name = "compile", .started_at = node_started};
      auto compiled =
          compiler.compile({.name = node.name, .sql = node.raw_sql});
      compile.completed_at = Clock::now();
      if (!compiled) {
        auto message = std::format("Compilation Error in {} ({})\n  {}",
                                   node.name, node.original_file_path,
                                   compiled.error().message);
        out_.log(log::Level::Error, message);
        results.push_back(entry(node, "ERROR", message, node_started,
                                compile.as_array()));
        continue;
      }
      auto compiled_node = node;
      compiled_node.compiled_sql = std::move(compiled->compiled_sql);
      results.push_back(entry(compiled_node, nullptr, nullptr, node_started,
                              compile.as_array()));
    }
    out_.log(log::Level::Info,
             std::format("Compiled {} node(s)", results.size()));
    return finish(std::move(results), started);
  }

  auto run_project() -> int {
    auto started = Clock::now();
    auto db = connect();
    if (!db) {
      return 1;
    }

    auto results = nlohmann::json::array();
    std::unordered_set<std::string> failed;
    for (auto idx : project_.order()) {
      const auto& node = project_.node(idx);
      if (node.resource_type != ResourceType::Model || node.is_ephemeral() ||
          !selected(node)) {
        continue;
      }

      auto node_started = Clock::now();
      bool upstream_failed = std::ranges::any_of(
          node.depends_on,
          [&](const NodeId& dep) { return failed.contains(dep.str()); });
      if (upstream_failed) {
        failed.insert(node.unique_id.str());
        out_.log(log::Level::Warn,
                 std::format("Skipping {} because an upstream model failed",
                             node.name));
        auto skipped = entry(node, "SKIP", nullptr, node_started,
                             nlohmann::json::array());
        skipped["skip"] = true;
        results.push_back(std::move(skipped));
        continue;
      }

      const bool table = node.materialized == Materialization::Table;
      out_.log(log::Level::Info,
               std::format("Running {} model {}", table ? "table" : "view",
                           node.name));
      Timing exec{.name = "execute", .started_at = node_started};
      auto built = build_model(*db, node, table);
      exec.completed_at = Clock::now();
      if (!built) {
        failed.insert(node.unique_id.str());
        auto message = std::format("Database Error in model {} ({})\n  {}",
                                   node.name, node.original_file_path,
                                   built.error().message);
        out_.log(log::Level::Error, message);
        results.push_back(entry(node, "ERROR", message, node_started,
                                exec.as_array()));
        continue;
      }
      results.push_back(entry(node, table ? "CREATE TABLE" : "CREATE VIEW",
                              nullptr, node_started, exec.as_array()));
    }
    return finish(std::move(results), started);
  }

  auto test_project() -> int {
    auto started = Clock::now();
    auto db = connect();
    if (!db) {
      return 1;
    }

    auto results = nlohmann::json::array();
    for (auto idx : project_.order()) {
      const auto& node = project_.node(idx);
      if (node.resource_type != ResourceType::Test || !selected(node)) {
        continue;
      }

      auto node_started = Clock::now();
      Timing exec{.name = "execute", .started_at = node_started};
      auto failures = db->query_int(
          std::format("select count(*) from (\n{}\n) dbt_internal_test",
                      node.compiled_sql));
      exec.completed_at = Clock::now();
      if (!failures) {
        auto message = std::format("Database Error in test {} ({})\n  {}",
                                   node.name, node.original_file_path,
                                   failures.error().message);
        out_.log(log::Level::Error, message);
        results.push_back(entry(node, "ERROR", message, node_started,
                                exec.as_array()));
        continue;
      }

      auto result = entry(node, *failures, nullptr, node_started,
                          exec.as_array());
      if (*failures > 0) {
        result["fail"] = true;
        out_.log(log::Level::Warn,
                 std::format("Failure in test {}: got {} result(s)", node.name,
                             *failures));
      } else {
        out_.log(log::Level::Info, std::format("PASS {}", node.name));
      }
      results.push_back(std::move(result));
    }
    return finish(std::move(results), started);
  }

  auto seed_project() -> int {
    auto started = Clock::now();
    auto db = connect();
    if (!db) {
      return 1;
    }

    auto results = nlohmann::json::array();
    for (auto idx : project_.order()) {
      const auto& node = project_.node(idx);
      if (node.resource_type != ResourceType::Seed || !selected(node)) {
        continue;
      }

      auto node_started = Clock::now();
      Timing exec{.name = "execute", .started_at = node_started};
      auto inserted = load_seed(*db, node);
      exec.completed_at = Clock::now();
      if (!inserted) {
        auto message = std::format("Database Error in seed {} ({})\n  {}",
                                   node.name, node.original_file_path,
                                   inserted.error().message);
        out_.log(log::Level::Error, message);
        results.push_back(entry(node, "ERROR", message, node_started,
                                exec.as_array()));
        continue;
      }

      out_.log(log::Level::Info,
               std::format("Loaded {} row(s) into {}", *inserted, node.name));
      auto result = entry(node, std::format("INSERT {}", *inserted), nullptr,
                          node_started, exec.as_array());
      if (request_.show) {
        auto preview = db->query(std::format(
            "select * from {} limit {}", node.relation(), kSeedPreviewRows));
        if (preview) {
          result["table"] = preview->to_json();
        }
      }
      results.push_back(std::move(result));
    }
    return finish(std::move(results), started);
  }

  auto build_model(SqliteAdapter& db, const Node& node, bool table)
      -> DbResult<void> {
    if (auto r = db.drop_relation(node.schema, node.alias); !r) {
      return r;
    }
    return db.execute(std::format("create {} {} as\n{}",
                                  table ? "table" : "view", node.relation(),
                                  node.compiled_sql));
  }

  auto load_seed(SqliteAdapter& db, const Node& node)
      -> DbResult<std::size_t> {
    auto path =
        std::filesystem::path(project_.root()) / node.original_file_path;
    auto text = read_file(path);
    if (!text) {
      return std::unexpected(DatabaseError{
          std::format("Could not read {}: {}", path.string(),
                      text.error().message())});
    }
    auto data = parse_seed_csv(*text);
    if (!data) {
      return std::unexpected(DatabaseError{data.error()});
    }

    std::string columns;
    for (const auto& column : data->columns) {
      if (!columns.empty()) {
        columns += ", ";
      }
      columns += quote_identifier(column);
    }

    if (auto r = db.begin_transaction(); !r) {
      return std::unexpected(r.error());
    }
    auto loaded = [&]() -> DbResult<std::size_t> {
      if (auto r = db.drop_relation(node.schema, node.alias); !r) {
        return std::unexpected(r.error());
      }
      if (auto r = db.execute(
              std::format("create table {} ({})", node.relation(), columns));
          !r) {
        return std::unexpected(r.error());
      }
      return db.insert_rows(node.relation(), data->columns, data->rows);
    }();
    if (!loaded) {
      (void)db.rollback_transaction();
      return loaded;
    }
    if (auto r = db.commit_transaction(); !r) {
      return std::unexpected(r.error());
    }
    return loaded;
  }

  auto query(std::string_view sql) -> DbResult<Table> {
    SqliteAdapter db(request_.db_path);
    if (auto r = db.open(); !r) {
      return std::unexpected(r.error());
    }
    return db.query(sql);
  }

  // Reports the failure itself; null means the worker should exit.
  auto connect() -> std::unique_ptr<SqliteAdapter> {
    auto db = std::make_unique<SqliteAdapter>(request_.db_path);
    if (auto r = db->open(); !r) {
      out_.log(log::Level::Error, r.error().message);
      out_.error(rpc_error::runtime_error(r.error().message));
      return nullptr;
    }
    return db;
  }

  [[nodiscard]] auto selected(const Node& node) const -> bool {
    auto named = [&](const std::vector<std::string>& names) {
      if (std::ranges::find(names, node.name) != names.end()) {
        return true;
      }
      // Tests follow the models they check.
      if (node.resource_type != ResourceType::Test) {
        return false;
      }
      return std::ranges::any_of(node.depends_on, [&](const NodeId& dep) {
        const auto* upstream = project_.find(dep);
        return upstream != nullptr &&
               std::ranges::find(names, upstream->name) != names.end();
      });
    };
    if (!request_.models.empty() && !named(request_.models)) {
      return false;
    }
    return request_.exclude.empty() || !named(request_.exclude);
  }

  auto entry(const Node& node, nlohmann::json status, nlohmann::json error,
             Clock::time_point started, nlohmann::json timing) const
      -> nlohmann::json {
    return {{"node", node.to_json()},
            {"status", std::move(status)},
            {"error", std::move(error)},
            {"execution_time", seconds_since(started)},
            {"timing", std::move(timing)}};
  }

  auto finish(nlohmann::json results, Clock::time_point started) -> int {
    out_.result({{"results", std::move(results)},
                 {"elapsed_time", seconds_since(started)}});
    return 0;
  }

  const CompiledProject& project_;
  const WorkRequest& request_;
  MessageWriter out_;
};

}  // namespace

auto run_worker(const Task& task, const WorkRequest& request, int fd) -> int {
  const auto& project = task.project();
  if (!project) {
    MessageWriter out(fd);
    out.error(rpc_error::runtime_error("No compiled project is available"));
    return 1;
  }
  Worker worker(*project, request, fd);
  return worker.run();
}

}  // namespace sqlrpc
