#include "sqlrpc/core/runtime.hpp"

#include "sqlrpc/util/log.hpp"

#include <sys/eventfd.h>

#include <unistd.h>

namespace sqlrpc {

namespace {

auto run_detached(Runtime* rt, spawn_task t) -> detached_task {
  co_await std::move(t);
  rt->task_finished();
}

auto to_timespec(std::chrono::milliseconds d) -> __kernel_timespec {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(d - secs);
  return {.tv_sec = secs.count(), .tv_nsec = nsecs.count()};
}

}  // namespace

Runtime::Runtime() {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create runtime eventfd");
  }
  if (!ring_.valid()) {
    log::error("Failed to initialize io_uring");
  }
}

Runtime::~Runtime() {
  stop();
  destroy_queued();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

auto Runtime::start() -> void {
  if (running_.exchange(true))
    return;
  stop_requested_.store(false);
  thread_ = std::thread([this] { run_loop(); });
}

auto Runtime::stop(std::chrono::milliseconds drain) -> void {
  if (!running_.exchange(false))
    return;
  drain_ = drain;
  stop_requested_.store(true, std::memory_order_release);
  wake();

  if (thread_.joinable()) {
    thread_.join();
  }

  if (auto live = live_.load(); live > 0) {
    log::warn("Runtime stopped with {} coroutine(s) still suspended", live);
  }
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::stopping() const noexcept -> bool {
  return stop_requested_.load(std::memory_order_acquire);
}

auto Runtime::in_loop() const noexcept -> bool {
  return detail::current_runtime == this;
}

auto Runtime::spawn(spawn_task t) -> void {
  live_.fetch_add(1, std::memory_order_acq_rel);
  schedule(run_detached(this, std::move(t)).release());
}

auto Runtime::schedule(std::coroutine_handle<> handle) noexcept -> void {
  if (!handle)
    return;

  if (in_loop()) {
    ready_.push_back(handle);
    return;
  }
  remote_.push_blocking(handle);
  wake();
}

auto Runtime::submit_io(const IoRequest& req) -> bool {
  if (!in_loop()) {
    log::error("Cannot submit IO: not on the runtime thread");
    return false;
  }
  if (!ring_.prepare(req)) {
    log::error("Cannot submit IO: submission queue unavailable");
    return false;
  }
  return true;
}

auto Runtime::run_loop() -> void {
  detail::current_runtime = this;
  ring_.setup_wake_poll(wake_fd_);

  std::chrono::steady_clock::time_point deadline{};
  bool draining = false;

  while (true) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      if (!draining) {
        draining = true;
        deadline = std::chrono::steady_clock::now() + drain_;
      }
      if (live_.load(std::memory_order_acquire) == 0 ||
          std::chrono::steady_clock::now() >= deadline) {
        break;
      }
    }

    bool did_work = process_ready();
    ring_.submit();
    did_work |= process_completions();

    if (!did_work && ready_.empty() && remote_.empty()) {
      if (!ring_.valid()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      ring_.wait(draining ? timing::kShutdownPollInterval : timing::kIdleWait);
      process_completions();
    }
  }

  process_ready();
  detail::current_runtime = nullptr;
}

auto Runtime::process_ready() -> bool {
  bool did_work = false;

  while (auto h = remote_.try_pop()) {
    ready_.push_back(*h);
  }

  std::deque<std::coroutine_handle<>> batch;
  batch.swap(ready_);
  for (auto handle : batch) {
    // A detached frame frees itself on completion, so the handle must not be
    // touched after resume().
    handle.resume();
    did_work = true;
  }
  return did_work;
}

auto Runtime::process_completions() -> bool {
  unsigned count =
      ring_.process_completions([this](void* raw, int res, unsigned flags) {
        if (raw == reinterpret_cast<void*>(WAKE_EVENT_TOKEN)) {
          std::uint64_t val;
          while (read(wake_fd_, &val, sizeof(val)) > 0) {
          }
          if (!(flags & IORING_CQE_F_MORE)) {
            ring_.setup_wake_poll(wake_fd_);
          }
          return;
        }
        if (raw == nullptr) {
          return;
        }

        auto* data = static_cast<io_data*>(raw);
        data->result = res;
        data->flags = flags;
        if (data->coroutine != nullptr) {
          std::coroutine_handle<>::from_address(data->coroutine).resume();
        }
      });
  return count > 0;
}

auto Runtime::wake() -> void {
  if (wake_fd_ < 0)
    return;

  std::uint64_t val = 1;
  while (true) {
    auto ret = write(wake_fd_, &val, sizeof(val));
    if (ret < 0 && errno == EINTR)
      continue;
    break;
  }
}

auto Runtime::destroy_queued() -> void {
  while (auto h = remote_.try_pop()) {
    ready_.push_back(*h);
  }
  for (auto handle : ready_) {
    handle.destroy();
  }
  ready_.clear();
}

auto poll_timeout_awaiter::await_suspend(
    std::coroutine_handle<> handle) noexcept -> bool {
  data_.coroutine = handle.address();
  data_.ts = to_timespec(timeout_);
  auto* rt = detail::current_runtime;
  if (rt == nullptr || !rt->submit_io({.op = IoOpType::PollTimeout,
                                       .data = &data_,
                                       .fd = fd_,
                                       .poll_mask = mask_,
                                       .ts_ptr = &data_.ts})) {
    data_.result = -ENXIO;
    return false;
  }
  return true;
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  data_.coroutine = handle.address();
  data_.ts = to_timespec(duration_);
  auto* rt = detail::current_runtime;
  if (rt == nullptr ||
      !rt->submit_io(
          {.op = IoOpType::Timeout, .data = &data_, .ts_ptr = &data_.ts})) {
    data_.result = -ENXIO;
    return false;
  }
  return true;
}

}  // namespace sqlrpc
