#include "sqlrpc/app/application.hpp"
#include "sqlrpc/config/config.hpp"
#include "sqlrpc/project/reload_controller.hpp"
#include "sqlrpc/util/log.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("sqlrpc - JSON-RPC server for compiling and running SQL");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>      Server config file (YAML)");
  std::println("  --project-dir <dir>      Project directory (default: .)");
  std::println("  --db <file>              SQLite database (default: sqlrpc.db)");
  std::println("  --host <host>            Listen address (default: 127.0.0.1)");
  std::println("  --port <port>            Listen port (default: 8580)");
  std::println("  --log-level <level>      trace, debug, info, warn or error");
  std::println("  -v, --version            Show version and exit");
  std::println("  -h, --help               Show this help message");
  std::println("");
  std::println("Send SIGHUP to recompile the project without a restart.");
}

void print_version() {
  std::println("sqlrpc v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> project_dir;
  std::optional<std::string> db_file;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
  std::optional<std::string> log_level;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--project-dir") {
      opts.project_dir = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "--host") {
      opts.host = require_value(i, argc, argv, arg);
    } else if (arg == "--port") {
      auto value = require_value(i, argc, argv, arg);
      std::uint16_t port = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), port);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        std::println(stderr, "Error: invalid port '{}'", value);
        std::exit(1);
      }
      opts.port = port;
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto apply_overrides(const Options& opts, sqlrpc::ServerConfig& config)
    -> void {
  if (opts.project_dir) {
    config.project.dir = *opts.project_dir;
  }
  if (opts.db_file) {
    config.database.path = *opts.db_file;
  }
  if (opts.host) {
    config.server.host = *opts.host;
  }
  if (opts.port) {
    config.server.port = *opts.port;
  }
  if (opts.log_level) {
    config.server.log_level = *opts.log_level;
  }
}

auto setup_logging(const sqlrpc::ServerConfig& config) -> bool {
  if (!config.server.log_file.empty() &&
      !sqlrpc::log::logger().open_file(config.server.log_file)) {
    std::println(stderr, "Error: cannot open log file {}",
                 config.server.log_file);
    return false;
  }
  sqlrpc::log::set_level(config.server.log_level);
  sqlrpc::log::start();
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  // Before any thread exists, so every thread inherits the blocked mask and
  // SIGHUP only ever reaches the signalfd.
  if (!sqlrpc::ReloadController::block_reload_signal()) {
    std::println(stderr, "Warning: could not block SIGHUP");
  }

  auto opts = parse_args(argc, argv);

  sqlrpc::ServerConfig config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return 1;
    }
    auto loaded = sqlrpc::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }
  apply_overrides(opts, config);

  if (!setup_logging(config)) {
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  sqlrpc::Application app(config);
  if (auto r = app.start(); !r) {
    sqlrpc::log::error("Failed to start: {}", r.error().message());
    sqlrpc::log::stop();
    return 1;
  }

  while (app.is_running() &&
         !g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    sqlrpc::log::info("Received shutdown signal, stopping...");
  }

  app.stop();
  sqlrpc::log::stop();
  return 0;
}
