#pragma once

#include "cachify/codec.hpp"
#include "cachify/context.hpp"
#include "cachify/dispatch.hpp"
#include "cachify/key_template.hpp"
#include "cachify/task.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cachify {

struct CacheOptions {
  std::optional<Duration> ttl; // Config::default_cache_ttl when unset
  std::optional<CacheStoreErrorPolicy> on_store_error;
};

namespace detail {

// Everything about a cached function that does not depend on its
// signature: the key template, ttl, store access and error policy.
class CacheCore {
public:
  CacheCore(Context &ctx, std::string pattern, std::vector<std::string> params,
            std::size_t arity, CacheOptions opts);

  template <typename... Args> std::string key(const Args &...args) const {
    return ctx_.full_key(template_.resolve(bind_arguments(params_, args...)));
  }

  // Payload for `key`, or nullopt on a miss. Under call_through a failed
  // read is a miss.
  std::optional<std::string> lookup(const std::string &key) const;
  void record(const std::string &key, const std::string &payload) const;
  // Store errors always propagate.
  void invalidate(const std::string &key) const;

  Task<std::optional<std::string>> lookup_async(std::string key) const;
  Task<void> record_async(std::string key, std::string payload) const;
  Task<void> invalidate_async(std::string key) const;

  void hit(const std::string &key) const { ctx_.notify_hit(key); }
  void miss(const std::string &key) const { ctx_.notify_miss(key); }

  Duration ttl() const { return ttl_; }
  CacheStoreErrorPolicy policy() const { return policy_; }

private:
  Context &ctx_;
  KeyTemplate template_;
  std::vector<std::string> params_;
  Duration ttl_;
  CacheStoreErrorPolicy policy_;
};

} // namespace detail

template <typename Sig> class CachedFunction;
template <typename Sig> class AsyncCachedFunction;

// Result cache around a plain callable. Copies share one core.
template <typename R, typename... Args> class CachedFunction<R(Args...)> {
  static_assert(!std::is_void_v<R> && !std::is_reference_v<R>,
                "cached functions must return a value");

public:
  using result_type = R;

  CachedFunction(Context &ctx, std::string pattern,
                 std::vector<std::string> params,
                 std::function<R(Args...)> fn, CacheOptions opts = {})
      : core_(std::make_shared<detail::CacheCore>(
            ctx, std::move(pattern), std::move(params), sizeof...(Args),
            opts)),
        fn_(std::move(fn)) {}

  R operator()(Args... args) const {
    const std::string k = core_->key(args...);
    if (auto payload = core_->lookup(k)) {
      if (auto value = Codec<R>::decode(*payload)) {
        core_->hit(k);
        return std::move(*value);
      }
    }
    core_->miss(k);
    R result = fn_(std::forward<Args>(args)...);
    core_->record(k, Codec<R>::encode(result));
    return result;
  }

  // Drops the entry the same arguments would read. Idempotent.
  void reset(Args... args) const { core_->invalidate(core_->key(args...)); }

  std::string key(Args... args) const { return core_->key(args...); }
  Duration ttl() const { return core_->ttl(); }

private:
  std::shared_ptr<detail::CacheCore> core_;
  std::function<R(Args...)> fn_;
};

// Result cache around a coroutine. The key is resolved when the call is
// made; store round trips suspend.
template <typename T, typename... Args>
class AsyncCachedFunction<Task<T>(Args...)> {
  static_assert(!std::is_void_v<T> && !std::is_reference_v<T>,
                "cached coroutines must produce a value");

public:
  using result_type = Task<T>;

  AsyncCachedFunction(Context &ctx, std::string pattern,
                      std::vector<std::string> params,
                      std::function<Task<T>(Args...)> fn,
                      CacheOptions opts = {})
      : core_(std::make_shared<detail::CacheCore>(
            ctx, std::move(pattern), std::move(params), sizeof...(Args),
            opts)),
        fn_(std::move(fn)) {}

  Task<T> operator()(Args... args) const {
    std::string k = core_->key(args...);
    return call(core_, fn_, std::move(k), std::forward<Args>(args)...);
  }

  Task<void> reset(Args... args) const {
    return invalidate(core_, core_->key(args...));
  }

  std::string key(Args... args) const { return core_->key(args...); }
  Duration ttl() const { return core_->ttl(); }

private:
  static Task<T> call(std::shared_ptr<detail::CacheCore> core,
                      std::function<Task<T>(Args...)> fn, std::string k,
                      std::decay_t<Args>... args) {
    if (auto payload = co_await core->lookup_async(k)) {
      if (auto value = Codec<T>::decode(*payload)) {
        core->hit(k);
        co_return std::move(*value);
      }
    }
    core->miss(k);
    T result = co_await fn(std::forward<Args>(args)...);
    co_await core->record_async(k, Codec<T>::encode(result));
    co_return result;
  }

  static Task<void> invalidate(std::shared_ptr<detail::CacheCore> core,
                               std::string k) {
    co_await core->invalidate_async(std::move(k));
  }

  std::shared_ptr<detail::CacheCore> core_;
  std::function<Task<T>(Args...)> fn_;
};

// Wraps `fn` in a result cache keyed by `pattern`. `params` names fn's
// parameters in order, for use in the pattern. A coroutine returning Task<T>
// gets an AsyncCachedFunction, anything else a CachedFunction.
template <typename F>
auto cached(Context &ctx, std::string pattern,
            std::vector<std::string> params, F fn, CacheOptions opts = {}) {
  using Wrapper = select_wrapper_t<F, CachedFunction, AsyncCachedFunction>;
  return Wrapper(ctx, std::move(pattern), std::move(params), std::move(fn),
                 opts);
}

} // namespace cachify
