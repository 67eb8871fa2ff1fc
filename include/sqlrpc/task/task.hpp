#pragma once

#include "sqlrpc/project/project.hpp"
#include "sqlrpc/rpc/rpc_error.hpp"
#include "sqlrpc/util/id.hpp"
#include "sqlrpc/util/log.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace sqlrpc {

enum class TaskState : std::uint8_t {
  Pending,
  Running,
  Finished,
  Error,
  Killed,
};

enum class TaskMethod : std::uint8_t {
  Compile,
  Run,
  CompileProject,
  RunProject,
  TestProject,
  SeedProject,
};

enum class TerminationReason : std::uint8_t {
  None,
  Killed,
  Timeout,
};

inline constexpr std::array kTaskStateNames = {"pending", "running",
                                               "finished", "error", "killed"};
inline constexpr std::array kTaskMethodNames = {
    "compile",     "run",          "compile_project",
    "run_project", "test_project", "seed_project"};

[[nodiscard]] auto task_state_name(TaskState state) noexcept
    -> std::string_view;
[[nodiscard]] auto task_method_name(TaskMethod method) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_task_method(std::string_view name) noexcept
    -> std::optional<TaskMethod>;

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Finished || state == TaskState::Error ||
         state == TaskState::Killed;
}

[[nodiscard]] auto log_record_to_json(const log::Record& record)
    -> nlohmann::json;
[[nodiscard]] auto log_record_from_json(const nlohmann::json& j)
    -> log::Record;

struct TaskSpec {
  TaskMethod method{TaskMethod::Compile};
  nlohmann::json request_id;
  // Seconds; absent means no limit.
  std::optional<double> timeout;
  // The timeout exactly as the client sent it.
  nlohmann::json timeout_value;
  ProjectSnapshot project;
};

struct TaskSnapshot {
  TaskId task_id;
  nlohmann::json request_id;
  TaskMethod method{TaskMethod::Compile};
  TaskState state{TaskState::Pending};
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> ended_at;
  std::optional<double> timeout;
  nlohmann::json timeout_value;
  pid_t pid{0};
  TerminationReason termination{TerminationReason::None};
  std::size_t log_count{0};

  // Seconds between start and end (or now, while running).
  [[nodiscard]] auto elapsed() const -> double;
};

struct TerminationRequest {
  // False when an earlier request already won.
  bool recorded{false};
  TaskState state{TaskState::Pending};
  pid_t pid{0};
};

class Task;

using TerminalCallback = std::function<void(const Task&)>;

// One unit of work. Identity fields are immutable; everything else is
// guarded by the task's own mutex so readers of one task never contend with
// unrelated work.
class Task {
public:
  Task(TaskId id, TaskSpec spec);

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  [[nodiscard]] auto id() const noexcept -> const TaskId& {
    return id_;
  }
  [[nodiscard]] auto request_id() const noexcept -> const nlohmann::json& {
    return spec_.request_id;
  }
  [[nodiscard]] auto method() const noexcept -> TaskMethod {
    return spec_.method;
  }
  [[nodiscard]] auto timeout() const noexcept -> std::optional<double> {
    return spec_.timeout;
  }
  [[nodiscard]] auto timeout_value() const noexcept -> const nlohmann::json& {
    return spec_.timeout_value;
  }
  [[nodiscard]] auto project() const noexcept -> const ProjectSnapshot& {
    return spec_.project;
  }
  [[nodiscard]] auto created_at() const noexcept
      -> std::chrono::system_clock::time_point {
    return created_at_;
  }

  [[nodiscard]] auto snapshot() const -> TaskSnapshot;
  [[nodiscard]] auto state() const -> TaskState;
  [[nodiscard]] auto is_terminal() const -> bool;
  [[nodiscard]] auto termination_reason() const -> TerminationReason;
  [[nodiscard]] auto termination_requested_at() const
      -> std::optional<std::chrono::steady_clock::time_point>;

  // Pending -> Running. Returns the termination reason recorded so far so the
  // caller can signal a process that was asked to stop before it existed.
  auto mark_running(pid_t pid) -> TerminationReason;
  // First request wins; a no-op on terminal tasks.
  auto request_termination(TerminationReason reason) -> TerminationRequest;

  auto append_log(log::Record record) -> void;
  [[nodiscard]] auto logs(std::size_t start = 0) const
      -> std::vector<log::Record>;
  [[nodiscard]] auto logs_json(std::size_t start = 0) const -> nlohmann::json;

  // Terminal transitions. Exactly one succeeds; `logs` is attached to the
  // payload in both cases.
  auto succeed(nlohmann::json result) -> bool;
  auto fail(TaskState state, RpcError error) -> bool;

  [[nodiscard]] auto result() const -> std::optional<nlohmann::json>;
  [[nodiscard]] auto error() const -> std::optional<RpcError>;

  auto wait() const -> void;
  [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

  // Runs `callback` once on the thread that makes the task terminal, after
  // the task's lock is released. Runs it inline when the task already is.
  auto on_terminal(TerminalCallback callback) -> void;

private:
  auto logs_json_locked(std::size_t start) const -> nlohmann::json;
  auto finish_locked(TaskState state) -> std::vector<TerminalCallback>;

  const TaskId id_;
  const TaskSpec spec_;
  const std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  TaskState state_{TaskState::Pending};
  std::optional<std::chrono::system_clock::time_point> started_at_;
  std::optional<std::chrono::system_clock::time_point> ended_at_;
  pid_t pid_{0};
  TerminationReason termination_{TerminationReason::None};
  std::optional<std::chrono::steady_clock::time_point> termination_at_;
  std::vector<log::Record> logs_;
  std::optional<nlohmann::json> result_;
  std::optional<RpcError> error_;
  std::vector<TerminalCallback> callbacks_;
};

}  // namespace sqlrpc
