#pragma once

#include "sqlrpc/core/error.hpp"
#include "sqlrpc/task/task.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrpc {

struct ListFilter {
  // Pending and running tasks.
  bool include_running{true};
  // Finished, error and killed tasks.
  bool include_completed{true};
};

// Every task the server has seen. Membership only grows; the live set
// shrinks as tasks finish.
class TaskRegistry {
public:
  TaskRegistry() = default;
  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  // Fails with Error::DuplicateRequest when a non-terminal task already uses
  // the same (non-null) request id.
  [[nodiscard]] auto create(TaskSpec spec) -> Result<std::shared_ptr<Task>>;

  [[nodiscard]] auto get(const TaskId& id) const -> std::shared_ptr<Task>;
  // Most recent task with this request id. Ids that compare equal as JSON
  // (1 and 1.0) name the same request.
  [[nodiscard]] auto find_by_request_id(const nlohmann::json& request_id) const
      -> std::shared_ptr<Task>;
  // In creation order.
  [[nodiscard]] auto list(ListFilter filter) const
      -> std::vector<std::shared_ptr<Task>>;
  // Scans only tasks that were live at the last call; terminal ones are
  // dropped from that set on the way.
  [[nodiscard]] auto running() -> std::vector<std::shared_ptr<Task>>;
  // Pending and running tasks.
  [[nodiscard]] auto live() -> std::size_t;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  auto prune_locked() -> void;

  mutable std::shared_mutex mu_;
  std::vector<std::shared_ptr<Task>> tasks_;
  std::unordered_map<TaskId, std::shared_ptr<Task>> by_id_;
  // Non-terminal tasks, and the one live task holding each request id.
  std::unordered_map<TaskId, std::shared_ptr<Task>> live_;
  std::unordered_map<std::string, std::shared_ptr<Task>> live_requests_;
};

// Canonical text of a request id; integral floats print as integers.
[[nodiscard]] auto request_key(const nlohmann::json& request_id)
    -> std::string;

}  // namespace sqlrpc
