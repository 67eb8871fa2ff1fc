#include "sqlrpc/executor/process.hpp"

#include "sqlrpc/core/constants.hpp"
#include "sqlrpc/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <format>

#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sqlrpc {

namespace {

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto pidfd_send_signal(int pidfd, int sig) -> int {
  return static_cast<int>(
      syscall(SYS_pidfd_send_signal, pidfd, sig, nullptr, 0));
}

auto close_from(unsigned int first) -> void {
  if (syscall(SYS_close_range, first, ~0U, 0U) == 0) {
    return;
  }
  auto max_fd = sysconf(_SC_OPEN_MAX);
  for (long fd = first; fd < max_fd; ++fd) {
    ::close(static_cast<int>(fd));
  }
}

auto reset_signals() -> void {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  for (int sig = 1; sig < NSIG; ++sig) {
    if (sig == SIGKILL || sig == SIGSTOP) {
      continue;
    }
    ::signal(sig, SIG_DFL);
  }
}

[[noreturn]] auto run_child(const Task& task, const WorkRequest& request,
                            const WorkerFn& worker, int read_fd, int write_fd)
    -> void {
  reset_signals();
  ::close(read_fd);
  if (write_fd != io::kWorkerMessageFd) {
    if (dup2(write_fd, io::kWorkerMessageFd) < 0) {
      _exit(127);
    }
    ::close(write_fd);
  }
  close_from(io::kWorkerMessageFd + 1);

  int code = 1;
  try {
    code = worker(task, request, io::kWorkerMessageFd);
  } catch (const std::exception& e) {
    MessageWriter out(io::kWorkerMessageFd);
    out.error(rpc_error::runtime_error(e.what()));
  }
  _exit(code);
}

}  // namespace

ChildProcess::~ChildProcess() {
  close_fds();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    close_fds();
    pid_ = std::exchange(other.pid_, 0);
    pidfd_ = std::exchange(other.pidfd_, -1);
    read_fd_ = std::exchange(other.read_fd_, -1);
    reaped_ = std::exchange(other.reaped_, false);
  }
  return *this;
}

auto ChildProcess::close_fds() noexcept -> void {
  if (pidfd_ >= 0) {
    ::close(pidfd_);
    pidfd_ = -1;
  }
  if (read_fd_ >= 0) {
    ::close(read_fd_);
    read_fd_ = -1;
  }
}

auto ChildProcess::signal(int signum) const -> bool {
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  if (pidfd_ >= 0) {
    return pidfd_send_signal(pidfd_, signum) == 0;
  }
  return ::kill(pid_, signum) == 0;
}

auto ChildProcess::try_reap() -> std::optional<int> {
  if (pid_ <= 0) {
    return std::nullopt;
  }
  int status = 0;
  auto r = waitpid(pid_, &status, WNOHANG);
  if (r == 0) {
    return std::nullopt;
  }
  if (r < 0) {
    if (errno == EINTR) {
      return std::nullopt;
    }
    log::warn("waitpid failed for pid {}: {}", pid_, strerror(errno));
    status = -1;
  }
  reaped_ = true;
  return status;
}

auto spawn_worker(const Task& task, const WorkRequest& request,
                  const WorkerFn& worker) -> Result<ChildProcess> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    log::error("Failed to create worker pipe: {}", strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  pid_t pid = fork();
  if (pid < 0) {
    log::error("Failed to fork worker for task {}: {}", task.id(),
               strerror(errno));
    ::close(fds[0]);
    ::close(fds[1]);
    return fail(Error::ProcessSpawnFailed);
  }

  if (pid == 0) {
    run_child(task, request, worker, fds[0], fds[1]);
  }

  ::close(fds[1]);
  int flags = fcntl(fds[0], F_GETFL);
  if (flags < 0 || fcntl(fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
    log::warn("Failed to make worker pipe non-blocking: {}", strerror(errno));
  }

  int pidfd = pidfd_open(pid, 0);
  if (pidfd < 0) {
    log::warn("pidfd_open failed for pid {}", pid);
  }
  return ChildProcess{pid, pidfd, fds[0]};
}

auto describe_wait_status(int status) -> std::string {
  if (status < 0) {
    return "exited with an unknown status";
  }
  if (WIFEXITED(status)) {
    return std::format("exited with status {}", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return std::format("terminated by signal {}", WTERMSIG(status));
  }
  return std::format("stopped with wait status {}", status);
}

}  // namespace sqlrpc
