#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace cachify {

namespace detail {

class PromiseBase {
public:
  std::suspend_always initial_suspend() noexcept { return {}; }

  struct FinalAwaiter {
    bool await_ready() const noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      auto continuation = h.promise().continuation_;
      if (continuation)
        return continuation;
      return std::noop_coroutine();
    }

    void await_resume() noexcept {}
  };

  FinalAwaiter final_suspend() noexcept { return {}; }

  void set_continuation(std::coroutine_handle<> h) noexcept {
    continuation_ = h;
  }

protected:
  std::coroutine_handle<> continuation_;
};

} // namespace detail

// Lazy coroutine result. Nothing runs until the task is awaited (or handed
// to EventLoop::spawn / run_until_complete); awaiting transfers control
// symmetrically and resumes the awaiter when the body finishes. Destroying
// the task destroys the frame, and with it every frame it is awaiting.
template <typename T> class [[nodiscard]] Task {
public:
  struct promise_type : detail::PromiseBase {
    Task get_return_object() noexcept {
      return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    template <typename U = T,
              std::enable_if_t<std::is_convertible_v<U &&, T>, int> = 0>
    void return_value(U &&value) {
      result_.template emplace<1>(std::forward<U>(value));
    }

    void unhandled_exception() noexcept {
      result_.template emplace<2>(std::current_exception());
    }

    T result() {
      if (result_.index() == 2)
        std::rethrow_exception(std::get<2>(result_));
      return std::move(std::get<1>(result_));
    }

  private:
    std::variant<std::monostate, T, std::exception_ptr> result_;
  };

  struct Awaiter {
    std::coroutine_handle<promise_type> h;

    bool await_ready() const noexcept { return false; }
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<> awaiting) noexcept {
      h.promise().set_continuation(awaiting);
      return h;
    }
    T await_resume() { return h.promise().result(); }
  };

  Task() noexcept = default;
  ~Task() {
    if (handle_)
      handle_.destroy();
  }

  Task(const Task &) = delete;
  Task &operator=(const Task &) = delete;

  Task(Task &&other) noexcept : handle_(std::exchange(other.handle_, {})) {}
  Task &operator=(Task &&other) noexcept {
    if (this != &other) {
      if (handle_)
        handle_.destroy();
      handle_ = std::exchange(other.handle_, {});
    }
    return *this;
  }

  Awaiter operator co_await() const noexcept { return Awaiter{handle_}; }

  std::coroutine_handle<promise_type> handle() const noexcept {
    return handle_;
  }
  bool done() const noexcept { return !handle_ || handle_.done(); }

private:
  explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}

  std::coroutine_handle<promise_type> handle_;
};

template <> class [[nodiscard]] Task<void> {
public:
  struct promise_type : detail::PromiseBase {
    Task get_return_object() noexcept {
      return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    void return_void() noexcept {}

    void unhandled_exception() noexcept {
      exception_ = std::current_exception();
    }

    void result() {
      if (exception_)
        std::rethrow_exception(exception_);
    }

  private:
    std::exception_ptr exception_;
  };

  struct Awaiter {
    std::coroutine_handle<promise_type> h;

    bool await_ready() const noexcept { return false; }
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<> awaiting) noexcept {
      h.promise().set_continuation(awaiting);
      return h;
    }
    void await_resume() { h.promise().result(); }
  };

  Task() noexcept = default;
  ~Task() {
    if (handle_)
      handle_.destroy();
  }

  Task(const Task &) = delete;
  Task &operator=(const Task &) = delete;

  Task(Task &&other) noexcept : handle_(std::exchange(other.handle_, {})) {}
  Task &operator=(Task &&other) noexcept {
    if (this != &other) {
      if (handle_)
        handle_.destroy();
      handle_ = std::exchange(other.handle_, {});
    }
    return *this;
  }

  Awaiter operator co_await() const noexcept { return Awaiter{handle_}; }

  std::coroutine_handle<promise_type> handle() const noexcept {
    return handle_;
  }
  bool done() const noexcept { return !handle_ || handle_.done(); }

private:
  explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}

  std::coroutine_handle<promise_type> handle_;
};

template <typename T> struct is_task : std::false_type {};
template <typename T> struct is_task<Task<T>> : std::true_type {
  using value_type = T;
};
template <typename T> inline constexpr bool is_task_v = is_task<T>::value;

} // namespace cachify
