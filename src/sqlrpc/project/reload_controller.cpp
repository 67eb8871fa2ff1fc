#include "sqlrpc/project/reload_controller.hpp"

#include "sqlrpc/core/constants.hpp"
#include "sqlrpc/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace sqlrpc {

auto server_state_name(ServerState state) noexcept -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < kServerStateNames.size() ? kServerStateNames[idx] : "unknown";
}

ReloadController::ReloadController(ProjectLoadFn load)
    : load_(std::move(load)) {
  status_.changed_at = std::chrono::system_clock::now();
}

ReloadController::~ReloadController() {
  stop();
  if (signal_fd_ >= 0) {
    ::close(signal_fd_);
  }
}

auto ReloadController::initial_load() -> bool {
  {
    std::lock_guard lock(mu_);
    busy_ = true;
  }
  auto loaded = load_and_publish();
  {
    std::lock_guard lock(mu_);
    busy_ = false;
  }
  cv_.notify_all();
  return loaded;
}

auto ReloadController::start() -> void {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token st) { reload_loop(st); });
}

auto ReloadController::stop() -> void {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
}

auto ReloadController::request_reload() -> void {
  {
    std::lock_guard lock(mu_);
    if (pending_) {
      log::debug("Reload already queued");
      return;
    }
    pending_ = true;
  }
  log::info("Project reload requested");
  cv_.notify_all();
}

auto ReloadController::current() const -> ProjectSnapshot {
  return current_.load(std::memory_order_acquire);
}

auto ReloadController::status() const -> ReloadStatus {
  std::lock_guard lock(mu_);
  return status_;
}

auto ReloadController::wait_idle(std::chrono::milliseconds timeout) const
    -> bool {
  std::unique_lock lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return !pending_ && !busy_; });
}

auto ReloadController::reload_loop(std::stop_token stop) -> void {
  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(mu_);
      if (!cv_.wait(lock, stop, [this] { return pending_; })) {
        return;
      }
      pending_ = false;
      busy_ = true;
    }

    load_and_publish();

    {
      std::lock_guard lock(mu_);
      busy_ = false;
    }
    cv_.notify_all();
  }
}

auto ReloadController::load_and_publish() -> bool {
  {
    std::lock_guard lock(mu_);
    status_.state = ServerState::Compiling;
    status_.changed_at = std::chrono::system_clock::now();
  }

  auto started = std::chrono::steady_clock::now();
  auto loaded = load_();
  auto elapsed = std::chrono::duration<double>(
      std::chrono::steady_clock::now() - started);

  std::lock_guard lock(mu_);
  status_.changed_at = std::chrono::system_clock::now();
  if (!loaded) {
    status_.state = ServerState::Error;
    status_.error = loaded.error().message;
    log::error("Project compilation failed: {}", status_.error);
    return false;
  }

  current_.store(std::move(*loaded), std::memory_order_release);
  status_.state = ServerState::Ready;
  status_.error.clear();
  ++status_.generation;
  log::info("Project snapshot {} published in {:.3f}s", status_.generation,
            elapsed.count());
  return true;
}

auto ReloadController::block_reload_signal() -> bool {
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGHUP);
  return pthread_sigmask(SIG_BLOCK, &mask, nullptr) == 0;
}

auto ReloadController::watch_sighup(Runtime& runtime) -> Result<void> {
  if (signal_fd_ >= 0) {
    return fail(Error::AlreadyExists);
  }
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGHUP);
  signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
  if (signal_fd_ < 0) {
    log::error("Failed to create signalfd: {}", strerror(errno));
    return fail(std::error_code(errno, std::system_category()));
  }
  runtime.spawn(sighup_loop(runtime, signal_fd_));
  log::info("Listening for SIGHUP to reload the project");
  return ok();
}

auto ReloadController::sighup_loop(Runtime& runtime, int fd) -> spawn_task {
  while (!runtime.stopping()) {
    auto polled =
        co_await async_poll_timeout(fd, POLLIN, timing::kSignalPollInterval);
    if (polled.timed_out) {
      continue;
    }
    if (polled.has_error()) {
      log::error("Polling signalfd failed: {}",
                 std::make_error_code(polled.error).message());
      co_return;
    }

    signalfd_siginfo info{};
    while (::read(fd, &info, sizeof(info)) == sizeof(info)) {
      log::info("Received SIGHUP");
      request_reload();
    }
  }
}

auto make_project_loader(ProjectOptions options) -> ProjectLoadFn {
  return [options = std::move(options)] {
    return ProjectLoader(options).load();
  };
}

}  // namespace sqlrpc
