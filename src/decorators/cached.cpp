#include "cachify/cached.hpp"

#include "cachify/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cachify {
namespace detail {

CacheCore::CacheCore(Context &ctx, std::string pattern,
                     std::vector<std::string> params, std::size_t arity,
                     CacheOptions opts)
    : ctx_(ctx), template_(std::move(pattern)), params_(std::move(params)),
      ttl_(opts.ttl.value_or(ctx.config().default_cache_ttl)),
      policy_(opts.on_store_error.value_or(ctx.config().cache_on_store_error)) {
  if (params_.size() != arity)
    throw KeyResolutionError("'" + template_.pattern() + "': declared " +
                             std::to_string(params_.size()) +
                             " parameter names for a function of arity " +
                             std::to_string(arity));
  template_.check_params(params_);
  if (ttl_.count() < 0)
    throw std::invalid_argument("cache ttl must not be negative");
}

std::optional<std::string> CacheCore::lookup(const std::string &key) const {
  auto store = ctx_.store();
  try {
    return store->get(key);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "get", e.what());
    if (policy_ == CacheStoreErrorPolicy::propagate)
      throw;
    return std::nullopt;
  }
}

void CacheCore::record(const std::string &key,
                       const std::string &payload) const {
  auto store = ctx_.store();
  try {
    store->set(key, payload, ttl_);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "set", e.what());
    if (policy_ == CacheStoreErrorPolicy::propagate)
      throw;
  }
}

void CacheCore::invalidate(const std::string &key) const {
  auto store = ctx_.store();
  try {
    store->del(key);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "del", e.what());
    throw;
  }
}

Task<std::optional<std::string>>
CacheCore::lookup_async(std::string key) const {
  auto store = ctx_.async_store();
  try {
    co_return co_await store->get(key);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "get", e.what());
    if (policy_ == CacheStoreErrorPolicy::propagate)
      throw;
  }
  co_return std::nullopt;
}

Task<void> CacheCore::record_async(std::string key, std::string payload) const {
  auto store = ctx_.async_store();
  try {
    co_await store->set(key, payload, ttl_);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "set", e.what());
    if (policy_ == CacheStoreErrorPolicy::propagate)
      throw;
  }
}

Task<void> CacheCore::invalidate_async(std::string key) const {
  auto store = ctx_.async_store();
  try {
    co_await store->del(key);
  } catch (const StoreUnavailableError &e) {
    ctx_.notify_store_error(key, "del", e.what());
    throw;
  }
}

} // namespace detail
} // namespace cachify
