#include "sqlrpc/task/task_registry.hpp"

#include "sqlrpc/util/log.hpp"

#include <cmath>
#include <cstdint>
#include <mutex>

namespace sqlrpc {

namespace {

// Largest magnitude below which every integral double is exact.
constexpr double kExactIntegerLimit = 9007199254740992.0;

}  // namespace

auto request_key(const nlohmann::json& request_id) -> std::string {
  if (request_id.is_number_float()) {
    auto value = request_id.get<double>();
    if (std::isfinite(value) && std::trunc(value) == value &&
        std::fabs(value) < kExactIntegerLimit) {
      return nlohmann::json(static_cast<std::int64_t>(value)).dump();
    }
  }
  return request_id.dump();
}

auto TaskRegistry::create(TaskSpec spec) -> Result<std::shared_ptr<Task>> {
  std::unique_lock lock(mu_);

  std::string key;
  if (!spec.request_id.is_null()) {
    key = request_key(spec.request_id);
    if (auto it = live_requests_.find(key); it != live_requests_.end()) {
      if (!it->second->is_terminal()) {
        log::warn("Rejecting request {}: task {} is still {}", key,
                  it->second->id(), task_state_name(it->second->state()));
        return fail(Error::DuplicateRequest);
      }
      live_requests_.erase(it);
    }
  }

  auto task = std::make_shared<Task>(generate_task_id(), std::move(spec));
  tasks_.push_back(task);
  by_id_.emplace(task->id(), task);
  live_.emplace(task->id(), task);
  if (!key.empty()) {
    live_requests_.emplace(std::move(key), task);
  }
  return task;
}

auto TaskRegistry::get(const TaskId& id) const -> std::shared_ptr<Task> {
  std::shared_lock lock(mu_);
  auto it = by_id_.find(id);
  return it != by_id_.end() ? it->second : nullptr;
}

auto TaskRegistry::find_by_request_id(const nlohmann::json& request_id) const
    -> std::shared_ptr<Task> {
  auto key = request_key(request_id);
  std::shared_lock lock(mu_);
  for (auto it = tasks_.rbegin(); it != tasks_.rend(); ++it) {
    if (request_key((*it)->request_id()) == key) {
      return *it;
    }
  }
  return nullptr;
}

auto TaskRegistry::list(ListFilter filter) const
    -> std::vector<std::shared_ptr<Task>> {
  std::vector<std::shared_ptr<Task>> out;
  if (!filter.include_running && !filter.include_completed) {
    return out;
  }

  std::shared_lock lock(mu_);
  for (const auto& task : tasks_) {
    bool terminal = task->is_terminal();
    if ((terminal && filter.include_completed) ||
        (!terminal && filter.include_running)) {
      out.push_back(task);
    }
  }
  return out;
}

auto TaskRegistry::running() -> std::vector<std::shared_ptr<Task>> {
  std::vector<std::shared_ptr<Task>> out;
  std::unique_lock lock(mu_);
  prune_locked();
  for (const auto& [id, task] : live_) {
    if (task->state() == TaskState::Running) {
      out.push_back(task);
    }
  }
  return out;
}

auto TaskRegistry::prune_locked() -> void {
  std::erase_if(live_, [](const auto& entry) {
    return entry.second->is_terminal();
  });
  std::erase_if(live_requests_, [](const auto& entry) {
    return entry.second->is_terminal();
  });
}

auto TaskRegistry::live() -> std::size_t {
  std::unique_lock lock(mu_);
  prune_locked();
  return live_.size();
}

auto TaskRegistry::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return tasks_.size();
}

}  // namespace sqlrpc
