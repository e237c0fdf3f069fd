#include "cachify/event_loop.hpp"

#include <utility>

namespace cachify {

namespace detail {

Detached::promise_type::promise_type(EventLoop &l, Task<void> &)
    : loop(l), id(l.next_id_++) {
  loop.live_.emplace(
      id, std::coroutine_handle<promise_type>::from_promise(*this).address());
}

Detached::promise_type::~promise_type() { loop.live_.erase(id); }

void Detached::promise_type::unhandled_exception() noexcept {
  loop.report(std::current_exception());
}

} // namespace detail

namespace {

detail::Detached run_detached(EventLoop &, Task<void> task) {
  co_await task;
}

} // namespace

EventLoop::~EventLoop() {
  while (!live_.empty())
    std::coroutine_handle<>::from_address(live_.begin()->second).destroy();
  std::lock_guard<std::mutex> lk(mu_);
  ready_.clear();
}

void EventLoop::post(std::coroutine_handle<> h) {
  post([h] { h.resume(); });
}

void EventLoop::post(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ready_.push_back(std::move(fn));
  }
  cv_.notify_one();
}

void EventLoop::spawn(Task<void> task) { start(std::move(task)); }

std::uint64_t EventLoop::start(Task<void> task) {
  auto detached = run_detached(*this, std::move(task));
  const std::uint64_t id = detached.handle.promise().id;
  post([this, id] {
    if (auto it = live_.find(id); it != live_.end())
      std::coroutine_handle<>::from_address(it->second).resume();
  });
  return id;
}

void EventLoop::cancel(std::uint64_t id) {
  if (auto it = live_.find(id); it != live_.end())
    std::coroutine_handle<>::from_address(it->second).destroy();
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

void EventLoop::hold() {
  std::lock_guard<std::mutex> lk(mu_);
  ++holds_;
}

void EventLoop::unhold() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    --holds_;
  }
  cv_.notify_all();
}

void EventLoop::report(std::exception_ptr e) {
  if (!error_)
    error_ = std::move(e);
}

void EventLoop::add_timer(TimePoint deadline, std::coroutine_handle<> h,
                          std::shared_ptr<bool> cancelled) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    timers_.push(Timer{deadline, timer_seq_++, h, std::move(cancelled)});
  }
  cv_.notify_one();
}

void EventLoop::SleepAwaiter::await_suspend(std::coroutine_handle<> h) {
  loop.add_timer(deadline, h, cancelled);
}

void EventLoop::run() {
  drive([] { return true; });
}

void EventLoop::drive(const std::function<bool()> &keep_going) {
  while (keep_going()) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      while (true) {
        if (stopped_) {
          stopped_ = false;
          return;
        }
        const auto now = Clock::now();
        while (!timers_.empty() && (*timers_.top().cancelled ||
                                    timers_.top().deadline <= now)) {
          Timer t = timers_.top();
          timers_.pop();
          if (*t.cancelled)
            continue;
          ready_.push_back([h = t.handle, flag = t.cancelled] {
            if (!*flag)
              h.resume();
          });
        }
        if (!ready_.empty()) {
          job = std::move(ready_.front());
          ready_.pop_front();
          break;
        }
        if (timers_.empty() && holds_ == 0)
          return;
        if (!timers_.empty())
          cv_.wait_until(lk, timers_.top().deadline);
        else
          cv_.wait(lk);
      }
    }
    job();
    if (error_)
      std::rethrow_exception(std::exchange(error_, nullptr));
  }
}

void AsyncEvent::set() {
  if (set_)
    return;
  set_ = true;
  for (auto &w : waiters_) {
    loop_.post([w] {
      if (!*w.abandoned)
        w.handle.resume();
    });
  }
  waiters_.clear();
}

void AsyncEvent::Awaiter::await_suspend(std::coroutine_handle<> h) {
  event.waiters_.push_back(Waiter{h, abandoned});
}

} // namespace cachify
