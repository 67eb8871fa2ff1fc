#include "sqlrpc/executor/watchdog.hpp"

#include "sqlrpc/util/log.hpp"

namespace sqlrpc {

Watchdog::Watchdog(Runtime& runtime, TaskRegistry& registry,
                   Executor& executor, std::chrono::milliseconds interval)
    : runtime_(runtime), registry_(registry), executor_(executor),
      interval_(interval) {
}

auto Watchdog::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  runtime_.spawn(loop());
  log::debug("Watchdog started, interval {}ms", interval_.count());
}

auto Watchdog::stop() -> void {
  running_.store(false, std::memory_order_release);
}

auto Watchdog::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Watchdog::tick(std::chrono::system_clock::time_point now) -> std::size_t {
  std::size_t terminated = 0;
  for (const auto& task : registry_.running()) {
    auto snap = task->snapshot();
    if (!snap.timeout || !snap.started_at) {
      continue;
    }
    auto elapsed = std::chrono::duration<double>(now - *snap.started_at);
    if (elapsed.count() <= *snap.timeout) {
      continue;
    }
    if (executor_.terminate(*task, TerminationReason::Timeout)) {
      log::warn("Task {} exceeded its timeout of {}s", task->id(),
                *snap.timeout);
      ++terminated;
    }
  }
  return terminated;
}

auto Watchdog::loop() -> spawn_task {
  while (running_.load(std::memory_order_acquire) && !runtime_.stopping()) {
    tick(std::chrono::system_clock::now());
    (void)co_await async_sleep(interval_);
  }
  running_.store(false, std::memory_order_release);
}

}  // namespace sqlrpc
