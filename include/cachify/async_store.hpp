#pragma once

#include "cachify/event_loop.hpp"
#include "cachify/store.hpp"
#include "cachify/task.hpp"
#include "cachify/worker_pool.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace cachify {

// Outcome of a fire-and-forget release: whether the token still owned the
// key, or the failure that prevented finding out.
using ReleaseCallback =
    std::function<void(bool released, std::exception_ptr error)>;

// The Store operations for coroutine callers. Arguments are taken by value
// because the tasks are lazy.
class AsyncStore {
public:
  virtual ~AsyncStore() = default;

  virtual Task<std::optional<std::string>> get(std::string key) = 0;
  virtual Task<void> set(std::string key, std::string value, Duration ttl) = 0;
  virtual Task<void> del(std::string key) = 0;
  virtual Task<bool> exists(std::string key) = 0;
  virtual Task<std::optional<Token>> try_acquire(std::string key,
                                                 Duration ttl) = 0;
  virtual Task<bool> release(std::string key, Token token) = 0;

  // Release without a coroutine to resume, for frames destroyed while
  // holding a lock. `done` may run on another thread.
  virtual void release_nowait(std::string key, Token token,
                              ReleaseCallback done) noexcept = 0;
};

// For stores that never wait on I/O (MemoryStore). Tasks complete without
// suspending.
class InlineAsyncStore : public AsyncStore {
public:
  explicit InlineAsyncStore(std::shared_ptr<Store> store);

  Task<std::optional<std::string>> get(std::string key) override;
  Task<void> set(std::string key, std::string value, Duration ttl) override;
  Task<void> del(std::string key) override;
  Task<bool> exists(std::string key) override;
  Task<std::optional<Token>> try_acquire(std::string key,
                                         Duration ttl) override;
  Task<bool> release(std::string key, Token token) override;
  void release_nowait(std::string key, Token token,
                      ReleaseCallback done) noexcept override;

private:
  std::shared_ptr<Store> store_;
};

// Runs each blocking round trip on a WorkerPool thread and resumes the
// awaiting coroutine on the EventLoop. The pool must be shut down before the
// loop is destroyed.
class OffloadAsyncStore : public AsyncStore {
public:
  OffloadAsyncStore(std::shared_ptr<Store> store, WorkerPool &pool,
                    EventLoop &loop);

  Task<std::optional<std::string>> get(std::string key) override;
  Task<void> set(std::string key, std::string value, Duration ttl) override;
  Task<void> del(std::string key) override;
  Task<bool> exists(std::string key) override;
  Task<std::optional<Token>> try_acquire(std::string key,
                                         Duration ttl) override;
  Task<bool> release(std::string key, Token token) override;
  void release_nowait(std::string key, Token token,
                      ReleaseCallback done) noexcept override;

private:
  std::shared_ptr<Store> store_;
  WorkerPool &pool_;
  EventLoop &loop_;
};

} // namespace cachify
