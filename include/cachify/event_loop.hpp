#pragma once

#include "cachify/task.hpp"
#include "cachify/types.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace cachify {

class EventLoop;

namespace detail {

// Frame of a spawned task. Registers itself with the loop so that frames
// still suspended when the loop dies are destroyed rather than leaked.
struct Detached {
  struct promise_type {
    promise_type(EventLoop &loop, Task<void> &);
    ~promise_type();

    Detached get_return_object() noexcept {
      return Detached{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() noexcept {}
    void unhandled_exception() noexcept;

    EventLoop &loop;
    std::uint64_t id;
  };

  std::coroutine_handle<promise_type> handle;
};

} // namespace detail

// Single-threaded scheduler for Task coroutines. post() may be called from
// any thread; everything else belongs to the thread driving run().
class EventLoop {
public:
  EventLoop() = default;
  // Destroys the frames of spawned tasks that never finished.
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void post(std::coroutine_handle<> h);
  void post(std::function<void()> fn);

  // Starts `task` on the next turn of the loop. An exception escaping it is
  // rethrown from run() / run_until_complete().
  void spawn(Task<void> task);

  struct SleepAwaiter {
    EventLoop &loop;
    TimePoint deadline;
    std::shared_ptr<bool> cancelled = std::make_shared<bool>(false);

    SleepAwaiter(EventLoop &l, TimePoint d) : loop(l), deadline(d) {}
    SleepAwaiter(const SleepAwaiter &) = delete;
    SleepAwaiter &operator=(const SleepAwaiter &) = delete;
    // Runs when the awaiting frame is destroyed mid-sleep as well.
    ~SleepAwaiter() { *cancelled = true; }

    bool await_ready() const noexcept { return deadline <= Clock::now(); }
    void await_suspend(std::coroutine_handle<> h);
    void await_resume() const noexcept {}
  };

  SleepAwaiter sleep_for(Duration d) {
    return SleepAwaiter{*this, Clock::now() + d};
  }

  // Runs until stop() or until there is nothing left that could make
  // progress: no queued work, no timers, no outstanding holds.
  void run();
  void stop();

  template <typename T> T run_until_complete(Task<T> task);

  // Outstanding work owned by another thread that will post() back. The
  // loop does not go idle while holds are outstanding.
  void hold();
  void unhold();

  std::size_t pending_tasks() const { return live_.size(); }

private:
  friend struct detail::Detached::promise_type;

  struct Timer {
    TimePoint deadline;
    std::uint64_t seq;
    std::coroutine_handle<> handle;
    std::shared_ptr<bool> cancelled;
    bool operator>(const Timer &other) const {
      if (deadline != other.deadline)
        return deadline > other.deadline;
      return seq > other.seq;
    }
  };

  // Spawns and returns the frame's id, for cancel(). Ids are never reused,
  // so work queued for a destroyed frame cannot reach a later one.
  std::uint64_t start(Task<void> task);
  // Destroys a spawned frame if it is still suspended.
  void cancel(std::uint64_t id);
  void drive(const std::function<bool()> &keep_going);
  void add_timer(TimePoint deadline, std::coroutine_handle<> h,
                 std::shared_ptr<bool> cancelled);
  void report(std::exception_ptr e);

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> ready_;
  std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
  std::uint64_t timer_seq_{0};
  std::size_t holds_{0};
  bool stopped_{false};
  std::exception_ptr error_;
  std::uint64_t next_id_{0};
  std::unordered_map<std::uint64_t, void *> live_;
};

// One-shot event. Waiters resume on the loop after set().
class AsyncEvent {
public:
  explicit AsyncEvent(EventLoop &loop) : loop_(loop) {}

  void set();
  bool is_set() const { return set_; }

  struct Awaiter {
    AsyncEvent &event;
    std::shared_ptr<bool> abandoned = std::make_shared<bool>(false);

    explicit Awaiter(AsyncEvent &e) : event(e) {}
    Awaiter(const Awaiter &) = delete;
    Awaiter &operator=(const Awaiter &) = delete;
    ~Awaiter() { *abandoned = true; }

    bool await_ready() const noexcept { return event.set_; }
    void await_suspend(std::coroutine_handle<> h);
    void await_resume() const noexcept {}
  };

  Awaiter wait() { return Awaiter{*this}; }

private:
  struct Waiter {
    std::coroutine_handle<> handle;
    std::shared_ptr<bool> abandoned;
  };

  EventLoop &loop_;
  bool set_{false};
  std::vector<Waiter> waiters_;
};

template <typename T> T EventLoop::run_until_complete(Task<T> task) {
  std::optional<std::conditional_t<std::is_void_v<T>, bool, T>> result;
  std::exception_ptr failure;
  bool finished = false;

  auto runner = [](Task<T> inner, decltype(result) &out,
                   std::exception_ptr &err, bool &done) -> Task<void> {
    try {
      if constexpr (std::is_void_v<T>) {
        co_await inner;
        out.emplace(true);
      } else {
        out.emplace(co_await inner);
      }
    } catch (...) {
      err = std::current_exception();
    }
    done = true;
  };
  const std::uint64_t id =
      start(runner(std::move(task), result, failure, finished));
  try {
    drive([&finished] { return !finished; });
  } catch (...) {
    if (!finished)
      cancel(id);
    throw;
  }

  if (!finished) {
    cancel(id);
    throw std::logic_error("event loop stopped before the task completed");
  }
  if (failure)
    std::rethrow_exception(failure);
  if constexpr (!std::is_void_v<T>)
    return std::move(*result);
}

} // namespace cachify
