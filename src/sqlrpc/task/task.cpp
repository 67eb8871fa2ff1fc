#include "sqlrpc/task/task.hpp"

#include <algorithm>
#include <utility>

namespace sqlrpc {

auto task_state_name(TaskState state) noexcept -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < kTaskStateNames.size() ? kTaskStateNames[idx] : "unknown";
}

auto task_method_name(TaskMethod method) noexcept -> std::string_view {
  auto idx = std::to_underlying(method);
  return idx < kTaskMethodNames.size() ? kTaskMethodNames[idx] : "unknown";
}

auto parse_task_method(std::string_view name) noexcept
    -> std::optional<TaskMethod> {
  auto it = std::ranges::find(kTaskMethodNames, name);
  if (it == kTaskMethodNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskMethod>(
      std::ranges::distance(kTaskMethodNames.begin(), it));
}

auto log_record_to_json(const log::Record& record) -> nlohmann::json {
  return {{"timestamp", record.timestamp},
          {"message", record.message},
          {"levelname", log::level_label(record.level)},
          {"level", log::level_number(record.level)}};
}

auto log_record_from_json(const nlohmann::json& j) -> log::Record {
  log::Record record;
  record.message = j.value("message", "");
  record.timestamp = j.value("timestamp", "");
  record.level = log::parse_level(j.value("levelname", "INFO"));
  return record;
}

auto TaskSnapshot::elapsed() const -> double {
  if (!started_at) {
    return 0.0;
  }
  auto end = ended_at.value_or(std::chrono::system_clock::now());
  return std::chrono::duration<double>(end - *started_at).count();
}

Task::Task(TaskId id, TaskSpec spec)
    : id_(std::move(id)), spec_(std::move(spec)),
      created_at_(std::chrono::system_clock::now()) {
}

auto Task::snapshot() const -> TaskSnapshot {
  std::lock_guard lock(mu_);
  return TaskSnapshot{.task_id = id_,
                      .request_id = spec_.request_id,
                      .method = spec_.method,
                      .state = state_,
                      .created_at = created_at_,
                      .started_at = started_at_,
                      .ended_at = ended_at_,
                      .timeout = spec_.timeout,
                      .timeout_value = spec_.timeout_value,
                      .pid = pid_,
                      .termination = termination_,
                      .log_count = logs_.size()};
}

auto Task::state() const -> TaskState {
  std::lock_guard lock(mu_);
  return state_;
}

auto Task::is_terminal() const -> bool {
  return sqlrpc::is_terminal(state());
}

auto Task::termination_reason() const -> TerminationReason {
  std::lock_guard lock(mu_);
  return termination_;
}

auto Task::termination_requested_at() const
    -> std::optional<std::chrono::steady_clock::time_point> {
  std::lock_guard lock(mu_);
  return termination_at_;
}

auto Task::mark_running(pid_t pid) -> TerminationReason {
  std::lock_guard lock(mu_);
  if (state_ == TaskState::Pending) {
    state_ = TaskState::Running;
    pid_ = pid;
    started_at_ = std::chrono::system_clock::now();
  }
  return termination_;
}

auto Task::request_termination(TerminationReason reason)
    -> TerminationRequest {
  std::lock_guard lock(mu_);
  TerminationRequest req{.recorded = false, .state = state_, .pid = pid_};
  if (sqlrpc::is_terminal(state_) || reason == TerminationReason::None ||
      termination_ != TerminationReason::None) {
    return req;
  }
  termination_ = reason;
  termination_at_ = std::chrono::steady_clock::now();
  req.recorded = true;
  return req;
}

auto Task::append_log(log::Record record) -> void {
  std::lock_guard lock(mu_);
  logs_.push_back(std::move(record));
}

auto Task::logs(std::size_t start) const -> std::vector<log::Record> {
  std::lock_guard lock(mu_);
  if (start >= logs_.size()) {
    return {};
  }
  return {logs_.begin() + static_cast<std::ptrdiff_t>(start), logs_.end()};
}

auto Task::logs_json(std::size_t start) const -> nlohmann::json {
  std::lock_guard lock(mu_);
  return logs_json_locked(start);
}

auto Task::logs_json_locked(std::size_t start) const -> nlohmann::json {
  auto out = nlohmann::json::array();
  for (auto i = start; i < logs_.size(); ++i) {
    out.push_back(log_record_to_json(logs_[i]));
  }
  return out;
}

auto Task::succeed(nlohmann::json result) -> bool {
  std::unique_lock lock(mu_);
  if (sqlrpc::is_terminal(state_)) {
    return false;
  }
  if (result.is_object()) {
    result["logs"] = logs_json_locked(0);
  }
  result_ = std::move(result);
  auto callbacks = finish_locked(TaskState::Finished);
  lock.unlock();

  for (auto& callback : callbacks) {
    callback(*this);
  }
  return true;
}

auto Task::fail(TaskState state, RpcError error) -> bool {
  std::unique_lock lock(mu_);
  if (sqlrpc::is_terminal(state_) || !sqlrpc::is_terminal(state) ||
      state == TaskState::Finished) {
    return false;
  }
  if (!error.data.is_object()) {
    error.data = nlohmann::json::object();
  }
  error.data["logs"] = logs_json_locked(0);
  error_ = std::move(error);
  auto callbacks = finish_locked(state);
  lock.unlock();

  for (auto& callback : callbacks) {
    callback(*this);
  }
  return true;
}

auto Task::finish_locked(TaskState state) -> std::vector<TerminalCallback> {
  state_ = state;
  ended_at_ = std::chrono::system_clock::now();
  pid_ = 0;
  cv_.notify_all();
  return std::exchange(callbacks_, {});
}

auto Task::on_terminal(TerminalCallback callback) -> void {
  {
    std::lock_guard lock(mu_);
    if (!sqlrpc::is_terminal(state_)) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback(*this);
}

auto Task::result() const -> std::optional<nlohmann::json> {
  std::lock_guard lock(mu_);
  return result_;
}

auto Task::error() const -> std::optional<RpcError> {
  std::lock_guard lock(mu_);
  return error_;
}

auto Task::wait() const -> void {
  std::unique_lock lock(mu_);
  cv_.wait(lock, [this] { return sqlrpc::is_terminal(state_); });
}

auto Task::wait_for(std::chrono::milliseconds timeout) const -> bool {
  std::unique_lock lock(mu_);
  return cv_.wait_for(lock, timeout,
                      [this] { return sqlrpc::is_terminal(state_); });
}

}  // namespace sqlrpc
