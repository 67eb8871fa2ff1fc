#pragma once

#include "sqlrpc/core/constants.hpp"
#include "sqlrpc/core/coroutine.hpp"
#include "sqlrpc/core/io_ring.hpp"
#include "sqlrpc/core/lockfree_queue.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <expected>
#include <system_error>
#include <thread>

namespace sqlrpc {

// Single-threaded io_uring reactor. Coroutines handed to spawn() run on the
// reactor thread; other threads only ever enqueue work.
class Runtime : public scheduler {
public:
  Runtime();
  ~Runtime() override;

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  auto start() -> void;
  // Gives live coroutines up to `drain` to finish before the loop exits.
  auto stop(std::chrono::milliseconds drain = timing::kShutdownDrain) -> void;

  [[nodiscard]] auto is_running() const noexcept -> bool;
  [[nodiscard]] auto stopping() const noexcept -> bool;

  auto spawn(spawn_task t) -> void;
  auto schedule(std::coroutine_handle<> handle) noexcept -> void override;
  [[nodiscard]] auto in_loop() const noexcept -> bool override;

  [[nodiscard]] auto submit_io(const IoRequest& req) -> bool;

  [[nodiscard]] auto live_tasks() const noexcept -> std::size_t {
    return live_.load(std::memory_order_acquire);
  }

  auto task_finished() noexcept -> void {
    live_.fetch_sub(1, std::memory_order_acq_rel);
  }

private:
  auto run_loop() -> void;
  auto process_ready() -> bool;
  auto process_completions() -> bool;
  auto wake() -> void;
  auto destroy_queued() -> void;

  IoRing ring_;
  int wake_fd_ = -1;

  std::deque<std::coroutine_handle<>> ready_;
  BoundedMPSCQueue<std::coroutine_handle<>> remote_{4096};

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> live_{0};
  std::chrono::milliseconds drain_{0};
};

namespace detail {
inline thread_local Runtime* current_runtime = nullptr;
}  // namespace detail

struct PollResult {
  bool ready = false;
  bool timed_out = false;
  std::errc error{};

  [[nodiscard]] explicit operator bool() const noexcept {
    return ready;
  }
  [[nodiscard]] auto has_error() const noexcept -> bool {
    return !ready && !timed_out && error != std::errc{};
  }
};

[[nodiscard]] inline auto decode_result(std::int32_t result) noexcept
    -> std::expected<std::uint32_t, std::errc> {
  if (result < 0)
    return std::unexpected{static_cast<std::errc>(-result)};
  return static_cast<std::uint32_t>(result);
}

class poll_timeout_awaiter {
public:
  poll_timeout_awaiter(int fd, std::uint32_t mask,
                       std::chrono::milliseconds timeout) noexcept
      : fd_{fd}, mask_{mask}, timeout_{timeout} {
  }

  poll_timeout_awaiter(const poll_timeout_awaiter&) = delete;
  poll_timeout_awaiter& operator=(const poll_timeout_awaiter&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }
  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() const noexcept -> PollResult {
    if (data_.result > 0)
      return {.ready = true};
    if (data_.result == -ECANCELED)
      return {.timed_out = true};
    if (data_.result < 0)
      return {.error = static_cast<std::errc>(-data_.result)};
    return {};
  }

private:
  io_data data_{};
  int fd_;
  std::uint32_t mask_;
  std::chrono::milliseconds timeout_;
};

class sleep_awaiter {
public:
  explicit sleep_awaiter(std::chrono::milliseconds duration) noexcept
      : duration_{duration} {
  }

  sleep_awaiter(const sleep_awaiter&) = delete;
  sleep_awaiter& operator=(const sleep_awaiter&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }
  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() const noexcept
      -> std::expected<void, std::errc> {
    if (data_.result == -ETIME || data_.result >= 0)
      return {};
    return std::unexpected{static_cast<std::errc>(-data_.result)};
  }

private:
  io_data data_{};
  std::chrono::milliseconds duration_;
};

[[nodiscard]] inline auto
async_poll_timeout(int fd, std::uint32_t mask,
                   std::chrono::milliseconds timeout) noexcept
    -> poll_timeout_awaiter {
  return poll_timeout_awaiter{fd, mask, timeout};
}

[[nodiscard]] inline auto
async_sleep(std::chrono::milliseconds duration) noexcept -> sleep_awaiter {
  return sleep_awaiter{duration};
}

}  // namespace sqlrpc
