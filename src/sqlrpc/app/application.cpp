#include "sqlrpc/app/application.hpp"

#include "sqlrpc/app/api_server.hpp"
#include "sqlrpc/util/log.hpp"

#include <chrono>
#include <thread>

namespace sqlrpc {

namespace {

constexpr auto kShutdownPollInterval = std::chrono::milliseconds(10);

}  // namespace

auto project_options(const ServerConfig& config) -> ProjectOptions {
  ProjectOptions options{.root = config.project.dir,
                         .schema = config.project.schema};
  for (const auto& [key, value] : config.vars) {
    options.vars[key] = value;
  }
  return options;
}

Application::Application(ServerConfig config)
    : config_(std::move(config)),
      executor_(std::make_unique<Executor>(
          runtime_, ExecutorOptions{.kill_grace = config_.tasks.kill_grace})),
      watchdog_(std::make_unique<Watchdog>(runtime_, registry_, *executor_,
                                           config_.tasks.watchdog_interval)),
      reload_(std::make_unique<ReloadController>(
          make_project_loader(project_options(config_)))),
      dispatcher_(std::make_unique<Dispatcher>(
          registry_, *executor_, *reload_,
          DispatcherOptions{.db_path = config_.database.path})) {
  log::logger().set_history_capacity(config_.tasks.log_history);
}

Application::~Application() {
  stop();
}

auto Application::start(bool serve_http) -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  log::info("Compiling project in {}", config_.project.dir);
  if (!reload_->initial_load()) {
    log::warn("Serving in error state until the project compiles");
  }

  runtime_.start();
  watchdog_->start();
  reload_->start();
  if (auto r = reload_->watch_sighup(runtime_); !r) {
    log::warn("SIGHUP reloads disabled: {}", r.error().message());
  }

  if (serve_http) {
    api_ = std::make_unique<ApiServer>(*dispatcher_, config_.server.port,
                                       config_.server.host,
                                       config_.server.threads);
    api_->start();
  }

  log::info("sqlrpc started (state {})",
            server_state_name(reload_->status().state));
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping sqlrpc...");

  watchdog_->stop();
  reload_->stop();

  // Waiting callers get their killed replies once the monitors reap the
  // workers, which needs the runtime still running. Whatever is left after
  // the grace period is closed by the API server.
  executor_->kill_all();
  auto deadline =
      std::chrono::steady_clock::now() + config_.tasks.kill_grace * 2;
  while (registry_.live() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kShutdownPollInterval);
  }
  if (api_) {
    api_->stop();
  }
  runtime_.stop();
  api_.reset();

  log::info("sqlrpc stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

}  // namespace sqlrpc
