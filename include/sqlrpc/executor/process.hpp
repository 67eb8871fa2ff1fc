#pragma once

#include "sqlrpc/core/error.hpp"
#include "sqlrpc/executor/worker.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <sys/types.h>

namespace sqlrpc {

// Body of the forked child. Receives the write end of the message pipe and
// returns the exit status.
using WorkerFn =
    std::function<int(const Task& task, const WorkRequest& request, int fd)>;

// A forked worker: pid, pidfd and the read end of its message pipe. Closing
// the descriptors is the only cleanup done on destruction; reaping is the
// owner's job.
class ChildProcess {
public:
  ChildProcess() = default;
  ChildProcess(pid_t pid, int pidfd, int read_fd) noexcept
      : pid_(pid), pidfd_(pidfd), read_fd_(read_fd) {
  }
  ~ChildProcess();

  ChildProcess(ChildProcess&& other) noexcept
      : pid_(std::exchange(other.pid_, 0)),
        pidfd_(std::exchange(other.pidfd_, -1)),
        read_fd_(std::exchange(other.read_fd_, -1)),
        reaped_(std::exchange(other.reaped_, false)) {
  }
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  [[nodiscard]] auto pid() const noexcept -> pid_t {
    return pid_;
  }
  [[nodiscard]] auto pidfd() const noexcept -> int {
    return pidfd_;
  }
  [[nodiscard]] auto read_fd() const noexcept -> int {
    return read_fd_;
  }

  // Through the pidfd when there is one, so a recycled pid is never hit.
  auto signal(int signum) const -> bool;
  // Wait status once the child has exited, nullopt while it is running.
  [[nodiscard]] auto try_reap() -> std::optional<int>;

private:
  auto close_fds() noexcept -> void;

  pid_t pid_{0};
  int pidfd_{-1};
  int read_fd_{-1};
  bool reaped_{false};
};

// fork() without exec: the child resets signal state, keeps only stdio and
// the message pipe (moved to io::kWorkerMessageFd), runs `worker` and exits.
[[nodiscard]] auto spawn_worker(const Task& task, const WorkRequest& request,
                                const WorkerFn& worker)
    -> Result<ChildProcess>;

// "exited with status 3", "terminated by signal 9".
[[nodiscard]] auto describe_wait_status(int status) -> std::string;

}  // namespace sqlrpc
