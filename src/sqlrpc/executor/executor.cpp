#include "sqlrpc/executor/executor.hpp"

#include "sqlrpc/core/constants.hpp"
#include "sqlrpc/util/log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>
#include <system_error>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace sqlrpc {

namespace {

constexpr auto signal_for(TerminationReason reason) noexcept -> int {
  return reason == TerminationReason::Killed ? SIGINT : SIGTERM;
}

}  // namespace

Executor::Executor(Runtime& runtime, ExecutorOptions options, WorkerFn worker)
    : runtime_(runtime), options_(options), worker_(std::move(worker)) {
}

auto Executor::execute(std::shared_ptr<Task> task, WorkRequest request)
    -> Result<void> {
  if (task->termination_reason() != TerminationReason::None) {
    log::info("Task {} was terminated before it started", task->id());
    finalize(*task, {});
    return ok();
  }

  auto child = spawn_worker(*task, request, worker_);
  if (!child) {
    task->fail(TaskState::Error,
               rpc_error::runtime_error("Failed to start a worker process"));
    return fail(child.error());
  }

  auto pid = child->pid();
  auto read_fd = child->read_fd();
  auto pidfd = child->pidfd();
  {
    std::lock_guard lock(mu_);
    active_.insert_or_assign(task->id(), std::move(*child));
  }

  log::info("Task {} ({}) started in worker {}", task->id(),
            task_method_name(task->method()), pid);

  // kill or timeout raced with the fork: the reason is recorded but nobody
  // has signalled the new process yet.
  if (auto reason = task->mark_running(pid);
      reason != TerminationReason::None) {
    signal(task->id(), signal_for(reason));
  }

  runtime_.spawn(monitor(std::move(task), read_fd, pidfd));
  return ok();
}

auto Executor::terminate(Task& task, TerminationReason reason) -> bool {
  auto request = task.request_termination(reason);
  if (!request.recorded) {
    return false;
  }
  log::info("Terminating task {} ({})", task.id(),
            reason == TerminationReason::Killed ? "killed" : "timeout");
  signal(task.id(), signal_for(reason));
  return true;
}

auto Executor::kill_all() -> void {
  std::lock_guard lock(mu_);
  for (auto& [id, child] : active_) {
    if (child.signal(SIGKILL)) {
      log::warn("Killed worker {} of task {}", child.pid(), id);
    }
  }
}

auto Executor::active() const -> std::size_t {
  std::lock_guard lock(mu_);
  return active_.size();
}

auto Executor::monitor(std::shared_ptr<Task> task, int read_fd, int pidfd)
    -> spawn_task {
  Outcome outcome;
  std::string pending;
  std::array<char, io::kReadBufferSize> buffer{};
  bool escalated = false;
  bool eof = false;

  while (!eof) {
    escalate_if_due(*task, escalated);

    auto polled = co_await async_poll_timeout(read_fd, POLLIN,
                                              timing::kMonitorPollInterval);
    if (polled.timed_out) {
      continue;
    }
    if (polled.has_error()) {
      log::error("Polling worker pipe of task {} failed: {}", task->id(),
                 std::make_error_code(polled.error).message());
      signal(task->id(), SIGKILL);
      break;
    }

    while (true) {
      auto n = ::read(read_fd, buffer.data(), buffer.size());
      if (n > 0) {
        pending.append(buffer.data(), static_cast<std::size_t>(n));
        continue;
      }
      if (n == 0) {
        eof = true;
      } else if (errno == EINTR) {
        continue;
      } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
        log::error("Reading worker pipe of task {} failed: {}", task->id(),
                   strerror(errno));
        eof = true;
      }
      break;
    }

    std::size_t start = 0;
    for (auto nl = pending.find('\n'); nl != std::string::npos;
         nl = pending.find('\n', start)) {
      handle_message(*task, std::string_view(pending).substr(start, nl - start),
                     outcome);
      start = nl + 1;
    }
    pending.erase(0, start);
    if (pending.size() > io::kMaxMessageSize) {
      log::warn("Dropping oversized message from task {}", task->id());
      pending.clear();
    }
  }
  if (!pending.empty()) {
    handle_message(*task, pending, outcome);
  }

  // The pipe is closed; wait for the process itself.
  while (true) {
    if (auto status = try_release(task->id())) {
      outcome.wait_status = *status;
      break;
    }
    escalate_if_due(*task, escalated);
    if (pidfd >= 0) {
      (void)co_await async_poll_timeout(pidfd, POLLIN,
                                        timing::kMonitorPollInterval);
    } else {
      (void)co_await async_sleep(timing::kMonitorPollInterval);
    }
  }

  finalize(*task, std::move(outcome));
}

auto Executor::handle_message(Task& task, std::string_view line,
                              Outcome& outcome) -> void {
  if (line.empty()) {
    return;
  }
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) {
    log::warn("Discarding malformed message from task {}", task.id());
    return;
  }

  auto type = msg.value("type", std::string{});
  if (type == message::kLog) {
    if (auto it = msg.find("record"); it != msg.end() && it->is_object()) {
      task.append_log(log_record_from_json(*it));
    }
  } else if (type == message::kResult) {
    outcome.result = msg.value("result", nlohmann::json::object());
  } else if (type == message::kError) {
    auto err = msg.value("error", nlohmann::json::object());
    outcome.error = RpcError{
        .code = err.value("code", rpc_code::kInternalError),
        .message = err.value("message", std::string{"Unknown error"}),
        .data = err.value("data", nlohmann::json{})};
  } else {
    log::warn("Unknown message type '{}' from task {}", type, task.id());
  }
}

auto Executor::escalate_if_due(const Task& task, bool& escalated) -> void {
  if (escalated) {
    return;
  }
  bool due = runtime_.stopping();
  if (!due) {
    auto requested = task.termination_requested_at();
    due = requested &&
          std::chrono::steady_clock::now() - *requested >= options_.kill_grace;
  }
  if (!due) {
    return;
  }
  escalated = true;
  log::warn("Worker of task {} is still alive, sending SIGKILL", task.id());
  signal(task.id(), SIGKILL);
}

auto Executor::signal(const TaskId& id, int signum) -> bool {
  std::lock_guard lock(mu_);
  auto it = active_.find(id);
  if (it == active_.end()) {
    return false;
  }
  return it->second.signal(signum);
}

auto Executor::try_release(const TaskId& id) -> std::optional<int> {
  std::lock_guard lock(mu_);
  auto it = active_.find(id);
  if (it == active_.end()) {
    return -1;
  }
  auto status = it->second.try_reap();
  if (status) {
    active_.erase(it);
  }
  return status;
}

auto Executor::finalize(Task& task, Outcome outcome) -> void {
  switch (task.termination_reason()) {
  case TerminationReason::Killed:
    task.fail(TaskState::Killed, rpc_error::killed(SIGINT));
    break;
  case TerminationReason::Timeout:
    task.fail(TaskState::Error, rpc_error::timeout(task.timeout_value()));
    break;
  case TerminationReason::None:
    if (outcome.result) {
      task.succeed(std::move(*outcome.result));
    } else if (outcome.error) {
      task.fail(TaskState::Error, std::move(*outcome.error));
    } else {
      task.fail(TaskState::Error,
                rpc_error::runtime_error(
                    std::format("Worker process {} without reporting a result",
                                describe_wait_status(outcome.wait_status))));
    }
    break;
  }

  auto snap = task.snapshot();
  log::info("Task {} ({}) {} in {:.3f}s", task.id(),
            task_method_name(task.method()), task_state_name(snap.state),
            snap.elapsed());
}

}  // namespace sqlrpc
