#pragma once

#include "sqlrpc/config/config.hpp"
#include "sqlrpc/core/error.hpp"
#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/executor/executor.hpp"
#include "sqlrpc/executor/watchdog.hpp"
#include "sqlrpc/project/reload_controller.hpp"
#include "sqlrpc/rpc/dispatcher.hpp"
#include "sqlrpc/task/task_registry.hpp"

#include <atomic>
#include <memory>

namespace sqlrpc {

class ApiServer;

// Owns every long-lived component and wires them together.
class Application {
public:
  explicit Application(ServerConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Compiles the project, then starts the runtime, watchdog, reload thread,
  // SIGHUP watcher and (when `serve_http`) the HTTP server. A project that
  // fails to compile leaves the server running in the error state.
  [[nodiscard]] auto start(bool serve_http = true) -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const ServerConfig& {
    return config_;
  }
  [[nodiscard]] auto registry() noexcept -> TaskRegistry& {
    return registry_;
  }
  [[nodiscard]] auto reload() noexcept -> ReloadController& {
    return *reload_;
  }
  [[nodiscard]] auto dispatcher() noexcept -> Dispatcher& {
    return *dispatcher_;
  }

private:
  std::atomic<bool> running_{false};
  ServerConfig config_;

  Runtime runtime_;
  TaskRegistry registry_;
  std::unique_ptr<Executor> executor_;
  std::unique_ptr<Watchdog> watchdog_;
  std::unique_ptr<ReloadController> reload_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<ApiServer> api_;
};

// The loader options implied by a server configuration.
[[nodiscard]] auto project_options(const ServerConfig& config)
    -> ProjectOptions;

}  // namespace sqlrpc
