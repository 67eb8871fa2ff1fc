#pragma once

#include "sqlrpc/core/lockfree_queue.hpp"
#include "sqlrpc/util/util.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sqlrpc::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Names and numeric levels as reported to RPC clients.
[[nodiscard]] constexpr auto level_label(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view labels[] = {"DEBUG", "DEBUG", "INFO", "WARNING",
                                         "ERROR"};
  return labels[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_number(Level level) noexcept -> int {
  constexpr int numbers[] = {5, 10, 20, 30, 40};
  return numbers[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug" || name == "DEBUG")
    return Level::Debug;
  if (name == "warn" || name == "warning" || name == "WARNING")
    return Level::Warn;
  if (name == "error" || name == "ERROR")
    return Level::Error;
  return Level::Info;
}

struct Record {
  std::string message;
  std::string timestamp;
  Level level{Level::Info};
};

[[nodiscard]] inline auto make_record(Level level, std::string message)
    -> Record {
  return Record{.message = std::move(message),
                .timestamp = format_timestamp_precise(),
                .level = level};
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(4096);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger. Formatting happens on the caller, a single writer thread
// drains the queue. The last `history_capacity` records are also kept in
// memory so the server can report them through the status method.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t DEFAULT_HISTORY = 200;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;
  std::FILE* sink_{stdout};
  bool owns_sink_{false};

  mutable std::mutex history_mu_;
  std::deque<Record> history_;
  std::size_t history_capacity_{DEFAULT_HISTORY};

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < 64) {
        auto msg = queue_.try_pop();
        if (!msg) {
          break;
        }
        batch.push_back(std::move(*msg));
      }

      for (const auto& msg : batch) {
        std::print(sink_, "{}", msg);
      }
      if (batch.empty()) {
        std::fflush(sink_);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }

    while (auto msg = queue_.try_pop()) {
      std::print(sink_, "{}", *msg);
    }
    std::fflush(sink_);
  }

  auto remember(Level level, const std::string& message) -> void {
    std::lock_guard lock(history_mu_);
    if (history_capacity_ == 0) {
      return;
    }
    history_.push_back(make_record(level, message));
    while (history_.size() > history_capacity_) {
      history_.pop_front();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Must be called before start().
  [[nodiscard]] auto open_file(const std::string& path) -> bool {
    auto* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    if (owns_sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_history_capacity(std::size_t capacity) -> void {
    std::lock_guard lock(history_mu_);
    history_capacity_ = capacity;
    while (history_.size() > history_capacity_) {
      history_.pop_front();
    }
  }

  [[nodiscard]] auto history() const -> std::vector<Record> {
    std::lock_guard lock(history_mu_);
    return {history_.begin(), history_.end()};
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto message = std::format(fmt, std::forward<Args>(args)...);
    remember(level, message);

    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto& buf = t_buffer.buffer;
    buf.clear();
    std::format_to(std::back_inserter(buf),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                   level_color(level), level_name(level), "\033[0m", tid,
                   message);

    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.push(std::string(buf))) {
      std::print(sink_, "{}", buf);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

[[nodiscard]] inline auto history() -> std::vector<Record> {
  return logger().history();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace sqlrpc::log
