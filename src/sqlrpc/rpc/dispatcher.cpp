#include "sqlrpc/rpc/dispatcher.hpp"

#include "sqlrpc/util/log.hpp"
#include "sqlrpc/util/util.hpp"

#include <format>
#include <optional>
#include <vector>

#include <unistd.h>

namespace sqlrpc {

using json = nlohmann::json;

namespace {

template <typename T>
using Param = std::expected<T, RpcError>;

auto bad_param(std::string message) -> std::unexpected<RpcError> {
  return std::unexpected(rpc_error::invalid_params(message));
}

auto find_param(const json& params, const char* key) -> const json* {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

auto optional_bool(const json& params, const char* key, bool fallback)
    -> Param<bool> {
  const auto* value = find_param(params, key);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_boolean()) {
    return bad_param(std::format("'{}' must be a boolean", key));
  }
  return value->get<bool>();
}

auto optional_string(const json& params, const char* key)
    -> Param<std::optional<std::string>> {
  const auto* value = find_param(params, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    return bad_param(std::format("'{}' must be a string", key));
  }
  return value->get<std::string>();
}

auto required_string(const json& params, const char* key)
    -> Param<std::string> {
  auto value = optional_string(params, key);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (!*value) {
    return bad_param(std::format("Missing required parameter '{}'", key));
  }
  return std::move(**value);
}

auto decode_param(const std::string& encoded, const char* key)
    -> Param<std::string> {
  auto decoded = decode_base64(encoded);
  if (!decoded) {
    return bad_param(std::format("'{}' is not valid base64", key));
  }
  return std::move(*decoded);
}

// A list of names, or one string of whitespace separated names.
auto name_list(const json& params, const char* key)
    -> Param<std::vector<std::string>> {
  std::vector<std::string> names;
  const auto* value = find_param(params, key);
  if (value == nullptr) {
    return names;
  }
  if (value->is_string()) {
    auto text = value->get<std::string>();
    std::size_t pos = 0;
    while (pos < text.size()) {
      auto start = text.find_first_not_of(" \t\n", pos);
      if (start == std::string::npos) {
        break;
      }
      auto end = text.find_first_of(" \t\n", start);
      names.push_back(text.substr(start, end - start));
      pos = end == std::string::npos ? text.size() : end;
    }
    return names;
  }
  if (!value->is_array()) {
    return bad_param(std::format("'{}' must be a list of names", key));
  }
  for (const auto& item : *value) {
    if (!item.is_string()) {
      return bad_param(std::format("'{}' must be a list of names", key));
    }
    names.push_back(item.get<std::string>());
  }
  return names;
}

struct TimeoutParam {
  std::optional<double> seconds;
  json raw;
};

auto timeout_param(const json& params) -> Param<TimeoutParam> {
  const auto* value = find_param(params, "timeout");
  if (value == nullptr) {
    return TimeoutParam{};
  }
  if (!value->is_number()) {
    return bad_param("'timeout' must be a number of seconds");
  }
  auto seconds = value->get<double>();
  if (seconds < 0) {
    return bad_param("'timeout' must not be negative");
  }
  return TimeoutParam{.seconds = seconds, .raw = *value};
}

auto timestamp_or_null(
    const std::optional<std::chrono::system_clock::time_point>& tp) -> json {
  if (!tp) {
    return nullptr;
  }
  return format_timestamp_precise(*tp);
}

auto timeout_or_null(const TaskSnapshot& snap) -> json {
  return snap.timeout ? snap.timeout_value : json(nullptr);
}

// The handle returned to an async caller.
auto accepted(const Task& task) -> json {
  auto snap = task.snapshot();
  return {{"request_token", task.id().str()},
          {"started", format_timestamp_precise(
                          snap.started_at.value_or(snap.created_at))}};
}

// What a synchronous caller receives once the task is terminal.
auto outcome(const Task& task) -> RpcResult {
  if (auto result = task.result()) {
    return std::move(*result);
  }
  if (auto error = task.error()) {
    return std::unexpected(std::move(*error));
  }
  return std::unexpected(
      rpc_error::internal_error("Task ended without a result"));
}

auto respond(const json& id, RpcResult result) -> json {
  if (!result) {
    return make_error(id, result.error());
  }
  return make_result(id, std::move(*result));
}

}  // namespace

Dispatcher::Dispatcher(TaskRegistry& registry, Executor& executor,
                       ReloadController& reload, DispatcherOptions options)
    : registry_(registry), executor_(executor), reload_(reload),
      options_(std::move(options)) {
}

auto Dispatcher::handle(std::string_view body) -> json {
  auto request = parse_request(body);
  if (!request) {
    log::warn("Rejected request: {}", request.error().error.message);
    return make_error(request.error().id, request.error().error);
  }

  return respond(request->id, dispatch(*request));
}

auto Dispatcher::handle_async(std::string_view body, ReplyFn reply) -> void {
  auto request = parse_request(body);
  if (!request) {
    log::warn("Rejected request: {}", request.error().error.message);
    reply(make_error(request.error().id, request.error().error));
    return;
  }

  auto task_method = parse_task_method(request->method);
  if (!task_method) {
    reply(respond(request->id, dispatch(*request)));
    return;
  }

  log::debug("Dispatching '{}' (id {})", request->method, request->id.dump());
  std::expected<Submission, RpcError> submitted;
  try {
    submitted = submit(*task_method, *request);
  } catch (const json::exception& e) {
    log::error("Request '{}' failed: {}", request->method, e.what());
    submitted = std::unexpected(rpc_error::internal_error(e.what()));
  }
  if (!submitted) {
    reply(make_error(request->id, submitted.error()));
    return;
  }
  if (submitted->async) {
    reply(make_result(request->id, accepted(*submitted->task)));
    return;
  }

  submitted->task->on_terminal(
      [id = request->id, reply = std::move(reply)](const Task& task) {
        reply(respond(id, outcome(task)));
      });
}

auto Dispatcher::dispatch(const RpcRequest& request) -> RpcResult {
  log::debug("Dispatching '{}' (id {})", request.method, request.id.dump());
  try {
    const auto& method = request.method;
    if (method == "status") {
      return status();
    }
    if (method == "ps") {
      return ps(request.params);
    }
    if (method == "kill") {
      return kill(request.params);
    }
    if (method == "poll") {
      return poll(request.params);
    }
    if (auto task_method = parse_task_method(method)) {
      auto submitted = submit(*task_method, request);
      if (!submitted) {
        return std::unexpected(submitted.error());
      }
      if (submitted->async) {
        return accepted(*submitted->task);
      }
      submitted->task->wait();
      return outcome(*submitted->task);
    }
    return std::unexpected(rpc_error::method_not_found(method));
  } catch (const json::exception& e) {
    log::error("Request '{}' failed: {}", request.method, e.what());
    return std::unexpected(rpc_error::internal_error(e.what()));
  }
}

auto Dispatcher::status() const -> RpcResult {
  auto state = reload_.status();
  auto logs = json::array();
  for (const auto& record : log::history()) {
    logs.push_back(log_record_to_json(record));
  }

  json out = {{"status", server_state_name(state.state)},
              {"timestamp", format_timestamp_precise(state.changed_at)},
              {"pid", ::getpid()},
              {"logs", std::move(logs)}};
  if (state.state == ServerState::Error) {
    out["error"] = {{"message", state.error}};
  }
  return out;
}

auto Dispatcher::ps(const json& params) const -> RpcResult {
  auto completed = optional_bool(params, "completed", false);
  if (!completed) {
    return std::unexpected(completed.error());
  }
  auto active = optional_bool(params, "active", true);
  if (!active) {
    return std::unexpected(active.error());
  }

  auto rows = json::array();
  for (const auto& task :
       registry_.list({.include_running = *active,
                       .include_completed = *completed})) {
    auto snap = task->snapshot();
    rows.push_back({{"request_id", snap.request_id},
                    {"task_id", snap.task_id.str()},
                    {"method", task_method_name(snap.method)},
                    {"state", task_state_name(snap.state)},
                    {"start", timestamp_or_null(snap.started_at)},
                    {"end", timestamp_or_null(snap.ended_at)},
                    {"elapsed", snap.elapsed()},
                    {"timeout", timeout_or_null(snap)}});
  }
  return json{{"rows", std::move(rows)}};
}

auto Dispatcher::kill(const json& params) -> RpcResult {
  auto task_id = required_string(params, "task_id");
  if (!task_id) {
    return std::unexpected(task_id.error());
  }
  auto task = registry_.get(TaskId{*task_id});
  if (!task) {
    return bad_param(std::format("No task with id '{}'", *task_id));
  }

  if (!task->is_terminal()) {
    executor_.terminate(*task, TerminationReason::Killed);
  }
  auto state = task->state();
  if (!is_terminal(state) &&
      task->termination_reason() == TerminationReason::Killed) {
    state = TaskState::Killed;
  }
  return json{{"state", task_state_name(state)}};
}

auto Dispatcher::poll(const json& params) const -> RpcResult {
  auto token = required_string(params, "request_token");
  if (!token) {
    return std::unexpected(token.error());
  }
  auto with_logs = optional_bool(params, "logs", true);
  if (!with_logs) {
    return std::unexpected(with_logs.error());
  }
  std::size_t logs_start = 0;
  if (const auto* value = find_param(params, "logs_start")) {
    if (!value->is_number_integer() || value->get<long long>() < 0) {
      return bad_param("'logs_start' must be a non-negative integer");
    }
    logs_start = value->get<std::size_t>();
  }

  auto task = registry_.get(TaskId{*token});
  if (!task) {
    return bad_param(std::format("No task with request token '{}'", *token));
  }

  auto snap = task->snapshot();
  if (snap.state == TaskState::Error || snap.state == TaskState::Killed) {
    if (auto error = task->error()) {
      return std::unexpected(std::move(*error));
    }
  }

  json out = json::object();
  if (snap.state == TaskState::Finished) {
    if (auto result = task->result(); result && result->is_object()) {
      out = std::move(*result);
    }
  }
  out["state"] = task_state_name(snap.state);
  out["start"] = timestamp_or_null(snap.started_at);
  out["end"] = timestamp_or_null(snap.ended_at);
  out["elapsed"] = snap.elapsed();
  out["logs"] = *with_logs ? task->logs_json(logs_start) : json::array();
  return out;
}

auto Dispatcher::submit(TaskMethod method, const RpcRequest& request)
    -> std::expected<Submission, RpcError> {
  auto server = reload_.status();
  if (server.state == ServerState::Error) {
    return std::unexpected(rpc_error::server_error(server.error));
  }
  auto project = reload_.current();
  if (!project) {
    return std::unexpected(rpc_error::server_compiling());
  }

  const auto& params = request.params;
  WorkRequest work;
  work.method = method;
  work.db_path = options_.db_path;

  if (method == TaskMethod::Compile || method == TaskMethod::Run) {
    auto sql = required_string(params, "sql");
    if (!sql) {
      return std::unexpected(sql.error());
    }
    auto decoded = decode_param(*sql, "sql");
    if (!decoded) {
      return std::unexpected(decoded.error());
    }
    work.sql = std::move(*decoded);

    auto macros = optional_string(params, "macros");
    if (!macros) {
      return std::unexpected(macros.error());
    }
    if (*macros) {
      auto decoded_macros = decode_param(**macros, "macros");
      if (!decoded_macros) {
        return std::unexpected(decoded_macros.error());
      }
      work.macros = std::move(*decoded_macros);
    }

    auto name = optional_string(params, "name");
    if (!name) {
      return std::unexpected(name.error());
    }
    if (*name) {
      work.name = std::move(**name);
    }
  } else {
    auto models = name_list(params, "models");
    if (!models) {
      return std::unexpected(models.error());
    }
    auto exclude = name_list(params, "exclude");
    if (!exclude) {
      return std::unexpected(exclude.error());
    }
    auto show = optional_bool(params, "show", false);
    if (!show) {
      return std::unexpected(show.error());
    }
    work.models = std::move(*models);
    work.exclude = std::move(*exclude);
    work.show = *show;
  }

  auto timeout = timeout_param(params);
  if (!timeout) {
    return std::unexpected(timeout.error());
  }
  auto async = optional_bool(params, "async", false);
  if (!async) {
    return std::unexpected(async.error());
  }

  auto created = registry_.create(TaskSpec{.method = method,
                                           .request_id = request.id,
                                           .timeout = timeout->seconds,
                                           .timeout_value = timeout->raw,
                                           .project = std::move(project)});
  if (!created) {
    if (created.error() == make_error_code(Error::DuplicateRequest)) {
      return std::unexpected(rpc_error::duplicate_request(request.id));
    }
    return std::unexpected(
        rpc_error::internal_error(created.error().message()));
  }
  auto task = std::move(*created);

  if (auto r = executor_.execute(task, std::move(work)); !r) {
    log::error("Task {} could not be started: {}", task->id(),
               r.error().message());
  }

  return Submission{.task = std::move(task), .async = *async};
}

}  // namespace sqlrpc
