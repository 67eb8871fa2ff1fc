#pragma once

#include <chrono>
#include <cstdint>

#include <liburing.h>

namespace sqlrpc {

inline constexpr std::uint32_t RING_SIZE = 256;
inline constexpr std::uintptr_t WAKE_EVENT_TOKEN = 0x1;

// Completion slot shared between an awaiter and the reactor. Lives inside the
// awaiter, which lives in the suspended coroutine frame.
struct io_data {
  void* coroutine = nullptr;
  std::int32_t result = 0;
  std::uint32_t flags = 0;
  __kernel_timespec ts{};
};

enum class IoOpType : std::uint8_t {
  PollTimeout,
  Timeout,
};

struct IoRequest {
  IoOpType op{IoOpType::Timeout};
  io_data* data{nullptr};
  int fd{-1};
  std::uint32_t poll_mask{0};
  __kernel_timespec* ts_ptr{nullptr};
};

class IoRing {
public:
  IoRing();
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return initialized_;
  }

  [[nodiscard]] auto prepare(const IoRequest& req) -> bool;
  auto submit() -> int;

  template <typename Callback>
  auto process_completions(Callback&& cb) -> unsigned {
    if (!initialized_)
      return 0;

    io_uring_cqe* cqe = nullptr;
    unsigned head, count = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
      cb(io_uring_cqe_get_data(cqe), cqe->res, cqe->flags);
      ++count;
    }
    io_uring_cq_advance(&ring_, count);
    return count;
  }

  auto wait(std::chrono::milliseconds timeout) -> void;
  auto setup_wake_poll(int fd) -> void;

private:
  io_uring ring_{};
  bool initialized_ = false;
  std::uint32_t pending_count_ = 0;
};

}  // namespace sqlrpc
