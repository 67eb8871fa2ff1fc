#pragma once

#include "sqlrpc/task/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sqlrpc {

// Everything a worker needs besides the task itself. Built by the dispatcher
// from validated params.
struct WorkRequest {
  TaskMethod method{TaskMethod::Compile};
  std::string name = "request";
  std::string sql;
  std::string macros;
  // Node names restricting the project methods; empty selects everything.
  std::vector<std::string> models;
  std::vector<std::string> exclude;
  bool show{false};
  std::string db_path;
};

// Worker -> server messages, one JSON object per line:
//
//   {"type": "log",    "record": {timestamp, message, levelname, level}}
//   {"type": "result", "result": {...}}
//   {"type": "error",  "error":  {code, message, data}}
namespace message {
inline constexpr std::string_view kLog = "log";
inline constexpr std::string_view kResult = "result";
inline constexpr std::string_view kError = "error";
}  // namespace message

// Runs inside the forked child. Writes messages to `fd` and returns the exit
// status for _exit(). Never touches the server logger.
[[nodiscard]] auto run_worker(const Task& task, const WorkRequest& request,
                              int fd) -> int;

// Appends framed messages to a pipe. Write errors are sticky: once the
// server side is gone nothing more is attempted.
class MessageWriter {
public:
  explicit MessageWriter(int fd) noexcept : fd_(fd) {
  }

  auto log(log::Level level, std::string message) -> void;
  auto result(nlohmann::json result) -> void;
  auto error(const RpcError& error) -> void;

  [[nodiscard]] auto ok() const noexcept -> bool {
    return ok_;
  }

private:
  auto send(const nlohmann::json& msg) -> void;

  int fd_;
  bool ok_{true};
};

}  // namespace sqlrpc
