#pragma once

#include "sqlrpc/core/error.hpp"
#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/project/project.hpp"
#include "sqlrpc/project/project_loader.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <stop_token>
#include <thread>

namespace sqlrpc {

enum class ServerState : std::uint8_t {
  Compiling,
  Ready,
  Error,
};

inline constexpr std::array kServerStateNames = {"compiling", "ready",
                                                 "error"};

[[nodiscard]] auto server_state_name(ServerState state) noexcept
    -> std::string_view;

struct ReloadStatus {
  ServerState state{ServerState::Compiling};
  // Failure message of the last load when state is Error.
  std::string error;
  std::chrono::system_clock::time_point changed_at;
  // Number of snapshots published so far.
  std::uint64_t generation{0};
};

using ProjectLoadFn =
    std::function<std::expected<ProjectSnapshot, ProjectError>()>;

// Owns the published project snapshot. Reloads run on one background thread;
// any number of requests made while a reload is queued collapse into one.
class ReloadController {
public:
  explicit ReloadController(ProjectLoadFn load);
  ~ReloadController();

  ReloadController(const ReloadController&) = delete;
  ReloadController& operator=(const ReloadController&) = delete;

  // Synchronous first compile. False when the project failed to load.
  auto initial_load() -> bool;

  auto start() -> void;
  auto stop() -> void;

  // Thread-safe; never blocks on the reload itself.
  auto request_reload() -> void;

  // Null until the first successful load.
  [[nodiscard]] auto current() const -> ProjectSnapshot;
  [[nodiscard]] auto status() const -> ReloadStatus;

  // True once no reload is queued or running.
  [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) const
      -> bool;

  // Routes SIGHUP into request_reload() through a signalfd polled on the
  // runtime. SIGHUP must already be blocked in every thread.
  [[nodiscard]] auto watch_sighup(Runtime& runtime) -> Result<void>;

  // Blocks SIGHUP for the calling thread and every thread it creates later.
  // Call before any other thread exists.
  [[nodiscard]] static auto block_reload_signal() -> bool;

private:
  auto reload_loop(std::stop_token stop) -> void;
  auto load_and_publish() -> bool;
  auto sighup_loop(Runtime& runtime, int fd) -> spawn_task;

  ProjectLoadFn load_;
  std::atomic<ProjectSnapshot> current_;

  mutable std::mutex mu_;
  mutable std::condition_variable_any cv_;
  bool pending_{false};
  bool busy_{false};
  ReloadStatus status_;

  std::jthread thread_;
  int signal_fd_{-1};
};

// The loader-backed ProjectLoadFn used by the server.
[[nodiscard]] auto make_project_loader(ProjectOptions options)
    -> ProjectLoadFn;

}  // namespace sqlrpc
