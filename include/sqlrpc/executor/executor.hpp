#pragma once

#include "sqlrpc/core/error.hpp"
#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/executor/process.hpp"
#include "sqlrpc/executor/worker.hpp"
#include "sqlrpc/task/task.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sqlrpc {

struct ExecutorOptions {
  // How long a signalled worker may take to exit before it gets SIGKILL.
  std::chrono::milliseconds kill_grace{2000};
};

// Runs each task in its own forked worker and drives it to a terminal state.
// Monitors run as coroutines on the runtime; execute() and terminate() may be
// called from any thread.
class Executor {
public:
  Executor(Runtime& runtime, ExecutorOptions options = {},
           WorkerFn worker = run_worker);

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  // The task is terminal or running with a monitor attached when this
  // returns. A spawn failure finalizes the task as a runtime error.
  [[nodiscard]] auto execute(std::shared_ptr<Task> task, WorkRequest request)
      -> Result<void>;

  // Records the reason and signals the worker: SIGINT for Killed, SIGTERM for
  // Timeout. False when the task is terminal or another reason was recorded
  // first.
  auto terminate(Task& task, TerminationReason reason) -> bool;

  // SIGKILL to every live worker.
  auto kill_all() -> void;

  [[nodiscard]] auto active() const -> std::size_t;

private:
  struct Outcome {
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
    int wait_status{-1};
  };

  auto monitor(std::shared_ptr<Task> task, int read_fd, int pidfd)
      -> spawn_task;
  auto handle_message(Task& task, std::string_view line, Outcome& outcome)
      -> void;
  auto escalate_if_due(const Task& task, bool& escalated) -> void;
  auto signal(const TaskId& id, int signum) -> bool;
  auto try_release(const TaskId& id) -> std::optional<int>;
  auto finalize(Task& task, Outcome outcome) -> void;

  Runtime& runtime_;
  ExecutorOptions options_;
  WorkerFn worker_;

  mutable std::mutex mu_;
  std::unordered_map<TaskId, ChildProcess> active_;
};

}  // namespace sqlrpc
