#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace sqlrpc {

template <typename T>
class task;

class scheduler {
public:
  virtual ~scheduler() = default;
  virtual auto schedule(std::coroutine_handle<> handle) noexcept -> void = 0;
  [[nodiscard]] virtual auto in_loop() const noexcept -> bool = 0;
};

template <typename T>
concept await_suspend_result = std::same_as<T, void> || std::same_as<T, bool> ||
                               std::same_as<T, std::coroutine_handle<>>;

template <typename T>
concept awaiter = requires(T t, std::coroutine_handle<> h) {
  { t.await_ready() } -> std::same_as<bool>;
  { t.await_suspend(h) } -> await_suspend_result;
  { t.await_resume() };
};

class final_awaiter {
public:
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) const noexcept
      -> std::coroutine_handle<> {
    auto continuation = h.promise().continuation();
    if (continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  auto await_resume() const noexcept -> void {
  }
};

class promise_base {
public:
  [[nodiscard]] auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }
  [[nodiscard]] auto final_suspend() const noexcept -> final_awaiter {
    return {};
  }

  [[noreturn]] auto unhandled_exception() const noexcept -> void {
    std::terminate();
  }

  [[nodiscard]] auto continuation() const noexcept -> std::coroutine_handle<> {
    return continuation_;
  }

  auto set_continuation(std::coroutine_handle<> c) noexcept -> void {
    continuation_ = c;
  }

private:
  std::coroutine_handle<> continuation_;
};

template <typename T>
class task_promise : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<T>;

  template <typename U>
    requires std::convertible_to<U&&, T>
  auto return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
      -> void {
    result_.emplace(std::forward<U>(value));
  }

  [[nodiscard]] auto result() && noexcept -> T&& {
    return std::move(*result_);
  }

private:
  std::optional<T> result_;
};

template <>
class task_promise<void> : public promise_base {
public:
  [[nodiscard]] auto get_return_object() noexcept -> task<void>;

  auto return_void() const noexcept -> void {
  }
};

// Lazily started coroutine. The task object owns the frame for its whole
// life, including while it is being awaited.
template <typename T = void>
class [[nodiscard]] task {
public:
  using promise_type = task_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;
  explicit task(handle_type h) noexcept : handle_(h) {
  }

  task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {
  }

  task& operator=(task&& other) noexcept {
    if (this != &other) {
      destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  task(const task&) = delete;
  task& operator=(const task&) = delete;

  ~task() {
    destroy();
  }

  [[nodiscard]] auto done() const noexcept -> bool {
    return !handle_ || handle_.done();
  }

  class awaiter {
  public:
    explicit awaiter(handle_type h) noexcept : handle_(h) {
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return !handle_ || handle_.done();
    }

    auto await_suspend(std::coroutine_handle<> continuation) noexcept
        -> std::coroutine_handle<> {
      handle_.promise().set_continuation(continuation);
      return handle_;
    }

    auto await_resume() noexcept -> T {
      if constexpr (!std::same_as<T, void>) {
        return std::move(handle_.promise()).result();
      }
    }

  private:
    handle_type handle_;
  };

  auto operator co_await() & noexcept -> awaiter {
    return awaiter{handle_};
  }

  auto operator co_await() && noexcept -> awaiter {
    return awaiter{handle_};
  }

private:
  auto destroy() noexcept -> void {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  handle_type handle_;
};

template <typename T>
auto task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto task_promise<void>::get_return_object() noexcept -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

// Fire-and-forget wrapper. Starts suspended; once resumed it runs the inner
// task to completion and frees its own frame.
class detached_task {
public:
  class promise_type {
  public:
    [[nodiscard]] auto get_return_object() noexcept -> detached_task {
      return detached_task{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    [[nodiscard]] auto initial_suspend() const noexcept -> std::suspend_always {
      return {};
    }
    [[nodiscard]] auto final_suspend() const noexcept -> std::suspend_never {
      return {};
    }
    auto return_void() const noexcept -> void {
    }
    [[noreturn]] auto unhandled_exception() const noexcept -> void {
      std::terminate();
    }
  };

  explicit detached_task(std::coroutine_handle<promise_type> h) noexcept
      : handle_(h) {
  }

  [[nodiscard]] auto release() noexcept -> std::coroutine_handle<> {
    return std::exchange(handle_, nullptr);
  }

private:
  std::coroutine_handle<promise_type> handle_;
};

using spawn_task = task<void>;

}  // namespace sqlrpc
