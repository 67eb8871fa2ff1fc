#include "sqlrpc/core/io_ring.hpp"

#include <poll.h>

namespace sqlrpc {

IoRing::IoRing() {
  if (io_uring_queue_init(RING_SIZE, &ring_, 0) == 0) {
    initialized_ = true;
  }
}

IoRing::~IoRing() {
  if (initialized_) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::prepare(const IoRequest& req) -> bool {
  if (!initialized_)
    return false;

  // A linked poll needs two entries, make sure both fit before starting.
  unsigned needed = req.op == IoOpType::PollTimeout ? 2 : 1;
  if (io_uring_sq_space_left(&ring_) < needed) {
    submit();
    if (io_uring_sq_space_left(&ring_) < needed)
      return false;
  }

  auto* sqe = io_uring_get_sqe(&ring_);
  switch (req.op) {
    case IoOpType::PollTimeout: {
      io_uring_prep_poll_add(sqe, req.fd, req.poll_mask);
      sqe->flags |= IOSQE_IO_LINK;
      io_uring_sqe_set_data(sqe, req.data);

      auto* timeout_sqe = io_uring_get_sqe(&ring_);
      io_uring_prep_link_timeout(timeout_sqe, req.ts_ptr, 0);
      io_uring_sqe_set_data(timeout_sqe, nullptr);
      pending_count_ += 2;
      return true;
    }
    case IoOpType::Timeout:
      io_uring_prep_timeout(sqe, req.ts_ptr, 0, 0);
      break;
  }

  io_uring_sqe_set_data(sqe, req.data);
  ++pending_count_;
  return true;
}

auto IoRing::submit() -> int {
  if (pending_count_ == 0)
    return 0;
  pending_count_ = 0;
  return io_uring_submit(&ring_);
}

auto IoRing::wait(std::chrono::milliseconds timeout) -> void {
  if (!initialized_)
    return;

  submit();
  __kernel_timespec ts{.tv_sec = timeout.count() / 1000,
                       .tv_nsec = (timeout.count() % 1000) * 1000000};
  io_uring_cqe* cqe = nullptr;
  // -ETIME and -EINTR just mean there is nothing to reap yet.
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

auto IoRing::setup_wake_poll(int fd) -> void {
  if (!initialized_ || fd < 0)
    return;

  auto* sqe = io_uring_get_sqe(&ring_);
  if (!sqe) {
    submit();
    sqe = io_uring_get_sqe(&ring_);
    if (!sqe)
      return;
  }

  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, reinterpret_cast<void*>(WAKE_EVENT_TOKEN));
  ++pending_count_;
  submit();
}

}  // namespace sqlrpc
