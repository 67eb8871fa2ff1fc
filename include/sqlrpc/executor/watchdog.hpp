#pragma once

#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/executor/executor.hpp"
#include "sqlrpc/task/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace sqlrpc {

// Terminates running tasks that outlived their timeout. Only ever asks the
// executor to terminate; task state is never touched here.
class Watchdog {
public:
  Watchdog(Runtime& runtime, TaskRegistry& registry, Executor& executor,
           std::chrono::milliseconds interval);

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;

  // Spawns the polling loop on the runtime.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // One pass over the running tasks. Returns how many were newly terminated.
  auto tick(std::chrono::system_clock::time_point now) -> std::size_t;

private:
  auto loop() -> spawn_task;

  Runtime& runtime_;
  TaskRegistry& registry_;
  Executor& executor_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> running_{false};
};

}  // namespace sqlrpc
