#include "cachify/once.hpp"

#include <stdexcept>
#include <utility>

namespace cachify {
namespace detail {

OnceCore::OnceCore(Context &ctx, std::string pattern,
                   std::vector<std::string> params, std::size_t arity,
                   OnceOptions opts)
    : ctx_(ctx), template_(std::move(pattern)), params_(std::move(params)),
      ttl_(opts.ttl.value_or(ctx.config().default_lock_ttl)),
      policy_(opts.on_store_error.value_or(ctx.config().lock_on_store_error)) {
  if (params_.size() != arity)
    throw KeyResolutionError("'" + template_.pattern() + "': declared " +
                             std::to_string(params_.size()) +
                             " parameter names for a function of arity " +
                             std::to_string(arity));
  template_.check_params(params_);
  if (ttl_.count() <= 0)
    throw std::invalid_argument("lock ttl must be positive");
}

LockOptions OnceCore::lock_options() const {
  LockOptions opts;
  opts.ttl = ttl_;
  opts.nowait = true;
  return opts;
}

std::optional<Lock> OnceCore::enter(const std::string &name) const {
  Lock lock(ctx_, name, lock_options());
  try {
    if (!lock.try_acquire())
      return std::nullopt;
  } catch (const StoreUnavailableError &) {
    if (policy_ == LockStoreErrorPolicy::propagate)
      throw;
    ctx_.notify_lock_contended(lock.key());
    return std::nullopt;
  }
  return std::optional<Lock>(std::move(lock));
}

Task<std::optional<AsyncLock>> OnceCore::enter_async(std::string name) const {
  AsyncLock lock(ctx_, name, lock_options());
  try {
    if (!co_await lock.try_acquire())
      co_return std::nullopt;
  } catch (const StoreUnavailableError &) {
    if (policy_ == LockStoreErrorPolicy::propagate)
      throw;
    ctx_.notify_lock_contended(lock.key());
    co_return std::nullopt;
  }
  co_return std::optional<AsyncLock>(std::move(lock));
}

bool OnceCore::is_locked(const std::string &name) const {
  return ctx_.store()->exists(full_key(name));
}

Task<bool> OnceCore::is_locked_async(std::string name) const {
  auto store = ctx_.async_store();
  co_return co_await store->exists(full_key(name));
}

} // namespace detail
} // namespace cachify
