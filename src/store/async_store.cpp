#include "cachify/async_store.hpp"

#include <atomic>
#include <coroutine>
#include <stdexcept>
#include <utility>

namespace cachify {

namespace {

template <typename R> struct OffloadState {
  std::optional<R> value;
  std::exception_ptr error;
  std::atomic<bool> abandoned{false};
  // Undoes a result nobody resumed to take, e.g. a lock acquired for a
  // frame that was destroyed meanwhile.
  std::function<void(R &)> discard;

  ~OffloadState() {
    if (value && discard)
      discard(*value);
  }
};

// Suspends the awaiting coroutine while `op` runs on the pool. If the frame
// is destroyed first, the completion is dropped instead of resuming it.
template <typename R> struct OffloadAwaiter {
  WorkerPool &pool;
  EventLoop &loop;
  std::function<R()> op;
  std::shared_ptr<OffloadState<R>> state =
      std::make_shared<OffloadState<R>>();

  OffloadAwaiter(WorkerPool &p, EventLoop &l, std::function<R()> f,
                 std::function<void(R &)> discard = {})
      : pool(p), loop(l), op(std::move(f)) {
    state->discard = std::move(discard);
  }
  OffloadAwaiter(const OffloadAwaiter &) = delete;
  OffloadAwaiter &operator=(const OffloadAwaiter &) = delete;
  ~OffloadAwaiter() { state->abandoned = true; }

  bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> h) {
    loop.hold();
    try {
      pool.submit([st = state, fn = std::move(op), &lp = loop, h]() mutable {
        try {
          st->value.emplace(fn());
        } catch (...) {
          st->error = std::current_exception();
        }
        lp.post([st, h] {
          if (!st->abandoned)
            h.resume();
        });
        // Dropped before unhold so an idle loop has no result left behind.
        st.reset();
        lp.unhold();
      });
    } catch (const std::runtime_error &) {
      loop.unhold();
      throw;
    }
  }

  R await_resume() {
    if (state->error)
      std::rethrow_exception(state->error);
    R out = std::move(*state->value);
    state->value.reset();
    return out;
  }
};

} // namespace

InlineAsyncStore::InlineAsyncStore(std::shared_ptr<Store> store)
    : store_(std::move(store)) {}

Task<std::optional<std::string>> InlineAsyncStore::get(std::string key) {
  co_return store_->get(key);
}

Task<void> InlineAsyncStore::set(std::string key, std::string value,
                                 Duration ttl) {
  store_->set(key, value, ttl);
  co_return;
}

Task<void> InlineAsyncStore::del(std::string key) {
  store_->del(key);
  co_return;
}

Task<bool> InlineAsyncStore::exists(std::string key) {
  co_return store_->exists(key);
}

Task<std::optional<Token>> InlineAsyncStore::try_acquire(std::string key,
                                                         Duration ttl) {
  co_return store_->try_acquire(key, ttl);
}

Task<bool> InlineAsyncStore::release(std::string key, Token token) {
  co_return store_->release(key, token);
}

void InlineAsyncStore::release_nowait(std::string key, Token token,
                                      ReleaseCallback done) noexcept {
  bool released = false;
  std::exception_ptr error;
  try {
    released = store_->release(key, token);
  } catch (const std::exception &) {
    error = std::current_exception();
  }
  if (done)
    done(released, error);
}

OffloadAsyncStore::OffloadAsyncStore(std::shared_ptr<Store> store,
                                     WorkerPool &pool, EventLoop &loop)
    : store_(std::move(store)), pool_(pool), loop_(loop) {}

// Each job is bound to a named local before it is awaited: GCC 12 misplaces
// lambda captures built inside a co_await operand into the coroutine frame.

Task<std::optional<std::string>> OffloadAsyncStore::get(std::string key) {
  std::function<std::optional<std::string>()> op = [store = store_, key] {
    return store->get(key);
  };
  co_return co_await OffloadAwaiter<std::optional<std::string>>(
      pool_, loop_, std::move(op));
}

Task<void> OffloadAsyncStore::set(std::string key, std::string value,
                                  Duration ttl) {
  std::function<bool()> op = [store = store_, key, value, ttl] {
    store->set(key, value, ttl);
    return true;
  };
  co_await OffloadAwaiter<bool>(pool_, loop_, std::move(op));
}

Task<void> OffloadAsyncStore::del(std::string key) {
  std::function<bool()> op = [store = store_, key] {
    store->del(key);
    return true;
  };
  co_await OffloadAwaiter<bool>(pool_, loop_, std::move(op));
}

Task<bool> OffloadAsyncStore::exists(std::string key) {
  std::function<bool()> op = [store = store_, key] {
    return store->exists(key);
  };
  co_return co_await OffloadAwaiter<bool>(pool_, loop_, std::move(op));
}

Task<std::optional<Token>> OffloadAsyncStore::try_acquire(std::string key,
                                                          Duration ttl) {
  std::function<std::optional<Token>()> op = [store = store_, key, ttl] {
    return store->try_acquire(key, ttl);
  };
  std::function<void(std::optional<Token> &)> discard =
      [store = store_, key](std::optional<Token> &token) {
        if (!token)
          return;
        try {
          store->release(key, *token);
        } catch (const std::exception &) {
          // Nobody holds the token; the lock expires with its ttl.
        }
      };
  co_return co_await OffloadAwaiter<std::optional<Token>>(
      pool_, loop_, std::move(op), std::move(discard));
}

Task<bool> OffloadAsyncStore::release(std::string key, Token token) {
  std::function<bool()> op = [store = store_, key, token] {
    return store->release(key, token);
  };
  co_return co_await OffloadAwaiter<bool>(pool_, loop_, std::move(op));
}

void OffloadAsyncStore::release_nowait(std::string key, Token token,
                                       ReleaseCallback done) noexcept {
  auto store = store_;
  auto job = [store, key, token, done] {
    bool released = false;
    std::exception_ptr error;
    try {
      released = store->release(key, token);
    } catch (const std::exception &) {
      error = std::current_exception();
    }
    if (done)
      done(released, error);
  };
  try {
    pool_.submit(job);
  } catch (const std::exception &) {
    // Pool already shut down; release on this thread instead.
    job();
  }
}

} // namespace cachify
