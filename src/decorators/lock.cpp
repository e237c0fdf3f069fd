#include "cachify/lock.hpp"

#include "cachify/errors.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

namespace cachify {
namespace {

Duration lock_ttl(const Context &ctx, const LockOptions &opts) {
  const Duration ttl = opts.ttl.value_or(ctx.config().default_lock_ttl);
  if (ttl.count() <= 0)
    throw std::invalid_argument("lock ttl must be positive");
  return ttl;
}

std::string describe(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  }
}

// How long to wait before the next attempt, or nullopt once the deadline
// has passed.
std::optional<Duration> next_wait(const LockOptions &opts,
                                  const std::optional<TimePoint> &deadline) {
  if (!deadline)
    return opts.poll_interval;
  const auto now = Clock::now();
  if (now >= *deadline)
    return std::nullopt;
  return std::min(opts.poll_interval,
                  std::chrono::duration_cast<Duration>(*deadline - now));
}

std::optional<TimePoint> deadline_for(const LockOptions &opts) {
  if (!opts.timeout)
    return std::nullopt;
  return Clock::now() + *opts.timeout;
}

} // namespace

Lock::Lock(Context &ctx, std::string name, LockOptions opts)
    : ctx_(&ctx), key_(ctx.full_key(name)), opts_(opts),
      ttl_(lock_ttl(ctx, opts)) {}

Lock::~Lock() { release(); }

Lock::Lock(Lock &&other) noexcept
    : ctx_(other.ctx_), key_(std::move(other.key_)), opts_(other.opts_),
      ttl_(other.ttl_), store_(std::move(other.store_)),
      token_(std::exchange(other.token_, std::nullopt)) {}

Lock &Lock::operator=(Lock &&other) noexcept {
  if (this != &other) {
    release();
    ctx_ = other.ctx_;
    key_ = std::move(other.key_);
    opts_ = other.opts_;
    ttl_ = other.ttl_;
    store_ = std::move(other.store_);
    token_ = std::exchange(other.token_, std::nullopt);
  }
  return *this;
}

bool Lock::try_acquire() {
  if (token_)
    throw std::logic_error("lock already held: " + key_);
  auto store = ctx_->store();
  std::optional<Token> token;
  try {
    token = store->try_acquire(key_, ttl_);
  } catch (const StoreUnavailableError &e) {
    ctx_->notify_store_error(key_, "try_acquire", e.what());
    throw;
  }
  if (!token) {
    ctx_->notify_lock_contended(key_);
    return false;
  }
  store_ = std::move(store);
  token_ = std::move(token);
  ctx_->notify_lock_acquired(key_);
  return true;
}

void Lock::acquire() {
  const auto deadline = deadline_for(opts_);
  while (!try_acquire()) {
    if (opts_.nowait)
      throw LockContentionError(key_);
    const auto wait = next_wait(opts_, deadline);
    if (!wait)
      throw LockContentionError(key_);
    std::this_thread::sleep_for(*wait);
  }
}

bool Lock::release() {
  if (!token_)
    return false;
  const Token token = std::move(*token_);
  token_.reset();
  auto store = std::move(store_);
  bool released = false;
  try {
    released = store->release(key_, token);
  } catch (const StoreUnavailableError &e) {
    ctx_->notify_store_error(key_, "release", e.what());
    return false;
  }
  ctx_->notify_lock_released(key_, released);
  return released;
}

bool Lock::is_locked() { return ctx_->store()->exists(key_); }

AsyncLock::AsyncLock(Context &ctx, std::string name, LockOptions opts)
    : ctx_(&ctx), key_(ctx.full_key(name)), opts_(opts),
      ttl_(lock_ttl(ctx, opts)) {}

AsyncLock::~AsyncLock() { release_in_background(); }

AsyncLock::AsyncLock(AsyncLock &&other) noexcept
    : ctx_(other.ctx_), key_(std::move(other.key_)), opts_(other.opts_),
      ttl_(other.ttl_), store_(std::move(other.store_)),
      token_(std::exchange(other.token_, std::nullopt)) {}

AsyncLock &AsyncLock::operator=(AsyncLock &&other) noexcept {
  if (this != &other) {
    release_in_background();
    ctx_ = other.ctx_;
    key_ = std::move(other.key_);
    opts_ = other.opts_;
    ttl_ = other.ttl_;
    store_ = std::move(other.store_);
    token_ = std::exchange(other.token_, std::nullopt);
  }
  return *this;
}

Task<bool> AsyncLock::try_acquire() {
  if (token_)
    throw std::logic_error("lock already held: " + key_);
  auto store = ctx_->async_store();
  std::optional<Token> token;
  try {
    token = co_await store->try_acquire(key_, ttl_);
  } catch (const StoreUnavailableError &e) {
    ctx_->notify_store_error(key_, "try_acquire", e.what());
    throw;
  }
  if (!token) {
    ctx_->notify_lock_contended(key_);
    co_return false;
  }
  store_ = std::move(store);
  token_ = std::move(token);
  ctx_->notify_lock_acquired(key_);
  co_return true;
}

Task<void> AsyncLock::acquire() {
  const auto deadline = deadline_for(opts_);
  while (!co_await try_acquire()) {
    if (opts_.nowait)
      throw LockContentionError(key_);
    const auto wait = next_wait(opts_, deadline);
    if (!wait)
      throw LockContentionError(key_);
    co_await ctx_->loop().sleep_for(*wait);
  }
}

Task<bool> AsyncLock::release() {
  if (!token_)
    co_return false;
  const Token token = std::move(*token_);
  token_.reset();
  auto store = std::move(store_);
  bool released = false;
  try {
    released = co_await store->release(key_, token);
  } catch (const StoreUnavailableError &e) {
    ctx_->notify_store_error(key_, "release", e.what());
    co_return false;
  }
  ctx_->notify_lock_released(key_, released);
  co_return released;
}

Task<bool> AsyncLock::is_locked() {
  auto store = ctx_->async_store();
  co_return co_await store->exists(key_);
}

void AsyncLock::release_in_background() noexcept {
  if (!token_)
    return;
  Context *ctx = ctx_;
  std::string key = key_;
  auto store = std::move(store_);
  Token token = std::move(*token_);
  token_.reset();
  store->release_nowait(
      key_, std::move(token),
      [ctx, key](bool released, std::exception_ptr error) {
        if (error)
          ctx->notify_store_error(key, "release", describe(error));
        else
          ctx->notify_lock_released(key, released);
      });
}

} // namespace cachify
