#pragma once

#include "sqlrpc/executor/executor.hpp"
#include "sqlrpc/executor/worker.hpp"
#include "sqlrpc/project/reload_controller.hpp"
#include "sqlrpc/rpc/jsonrpc.hpp"
#include "sqlrpc/rpc/rpc_error.hpp"
#include "sqlrpc/task/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sqlrpc {

struct DispatcherOptions {
  std::string db_path;
};

using RpcResult = std::expected<nlohmann::json, RpcError>;

// Receives the complete JSON-RPC response.
using ReplyFn = std::function<void(nlohmann::json)>;

// Validates requests and routes them. status, ps, kill and poll answer
// immediately; every other method becomes a task.
class Dispatcher {
public:
  Dispatcher(TaskRegistry& registry, Executor& executor,
             ReloadController& reload, DispatcherOptions options);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Raw HTTP body in, complete JSON-RPC response out. Blocks until a
  // synchronous task is terminal.
  [[nodiscard]] auto handle(std::string_view body) -> nlohmann::json;
  // Same as handle() without blocking the calling thread: `reply` runs
  // inline for everything except a synchronous task, whose reply runs on
  // the thread that finishes it.
  auto handle_async(std::string_view body, ReplyFn reply) -> void;
  [[nodiscard]] auto dispatch(const RpcRequest& request) -> RpcResult;

private:
  struct Submission {
    std::shared_ptr<Task> task;
    bool async{false};
  };

  auto status() const -> RpcResult;
  auto ps(const nlohmann::json& params) const -> RpcResult;
  auto kill(const nlohmann::json& params) -> RpcResult;
  auto poll(const nlohmann::json& params) const -> RpcResult;
  auto submit(TaskMethod method, const RpcRequest& request)
      -> std::expected<Submission, RpcError>;

  TaskRegistry& registry_;
  Executor& executor_;
  ReloadController& reload_;
  DispatcherOptions options_;
};

}  // namespace sqlrpc
