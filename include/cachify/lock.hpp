#pragma once

#include "cachify/async_store.hpp"
#include "cachify/context.hpp"
#include "cachify/store.hpp"
#include "cachify/task.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace cachify {

struct LockOptions {
  std::optional<Duration> ttl;     // Config::default_lock_ttl when unset
  bool nowait{false};              // acquire() tries exactly once
  std::optional<Duration> timeout; // acquire() waits forever when unset
  Duration poll_interval{std::chrono::milliseconds(100)};
};

// Store-backed mutual exclusion on one key, shared by every process using
// the same store. Not re-entrant. A held lock is released on destruction.
//
// The ttl is a fixed bound with no renewal: if the protected work outlives
// it, the store drops the lock and another holder may enter.
class Lock {
public:
  Lock(Context &ctx, std::string name, LockOptions opts = {});
  ~Lock();

  Lock(Lock &&other) noexcept;
  Lock &operator=(Lock &&other) noexcept;
  Lock(const Lock &) = delete;
  Lock &operator=(const Lock &) = delete;

  // One set-if-absent round trip. Store failures are reported to listeners
  // and thrown as StoreUnavailableError.
  bool try_acquire();
  // Polls until acquired; LockContentionError on nowait or timeout.
  void acquire();
  // Store failures are reported to listeners, not thrown; the ttl reclaims
  // the key. Returns whether this holder still owned the lock.
  bool release();

  bool held() const { return token_.has_value(); }
  bool is_locked();
  const std::string &key() const { return key_; }
  Duration ttl() const { return ttl_; }

private:
  Context *ctx_;
  std::string key_;
  LockOptions opts_;
  Duration ttl_;
  std::shared_ptr<Store> store_;
  std::optional<Token> token_;
};

// Coroutine form of Lock. Destroying a frame that holds one releases it
// without waiting for the round trip.
class AsyncLock {
public:
  AsyncLock(Context &ctx, std::string name, LockOptions opts = {});
  ~AsyncLock();

  AsyncLock(AsyncLock &&other) noexcept;
  AsyncLock &operator=(AsyncLock &&other) noexcept;
  AsyncLock(const AsyncLock &) = delete;
  AsyncLock &operator=(const AsyncLock &) = delete;

  Task<bool> try_acquire();
  Task<void> acquire();
  Task<bool> release();

  bool held() const { return token_.has_value(); }
  Task<bool> is_locked();
  const std::string &key() const { return key_; }
  Duration ttl() const { return ttl_; }

private:
  void release_in_background() noexcept;

  Context *ctx_;
  std::string key_;
  LockOptions opts_;
  Duration ttl_;
  std::shared_ptr<AsyncStore> store_;
  std::optional<Token> token_;
};

} // namespace cachify
