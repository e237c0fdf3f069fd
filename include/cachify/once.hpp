#pragma once

#include "cachify/context.hpp"
#include "cachify/dispatch.hpp"
#include "cachify/errors.hpp"
#include "cachify/key_template.hpp"
#include "cachify/lock.hpp"
#include "cachify/task.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cachify {

struct OnceOptions {
  std::optional<Duration> ttl; // Config::default_lock_ttl when unset
  std::optional<LockStoreErrorPolicy> on_store_error;
};

struct RaiseOnContended {};

template <typename T> struct ReturnOnContended {
  T value;
};
template <> struct ReturnOnContended<void> {};

// Contended calls throw LockContentionError.
inline RaiseOnContended raise_on_contended() { return {}; }

// Contended calls return `value` without running the function.
template <typename T>
ReturnOnContended<std::decay_t<T>> return_on_contended(T &&value) {
  return {std::forward<T>(value)};
}

// Contended calls of a void function return without running it.
inline ReturnOnContended<void> return_on_contended() { return {}; }

// What a call that could not take its lock produces instead.
template <typename R> class ContentionPolicy {
public:
  ContentionPolicy(RaiseOnContended) {}
  template <typename U,
            std::enable_if_t<std::is_convertible_v<U, R>, int> = 0>
  ContentionPolicy(ReturnOnContended<U> fallback)
      : fallback_(std::in_place, std::move(fallback.value)) {}

  R apply(const std::string &key) const {
    if (!fallback_)
      throw LockContentionError(key);
    return *fallback_;
  }

  bool raises() const { return !fallback_; }

private:
  std::optional<R> fallback_;
};

template <> class ContentionPolicy<void> {
public:
  ContentionPolicy(RaiseOnContended) {}
  ContentionPolicy(ReturnOnContended<void>) : raises_(false) {}

  void apply(const std::string &key) const {
    if (raises_)
      throw LockContentionError(key);
  }

  bool raises() const { return raises_; }

private:
  bool raises_{true};
};

namespace detail {

class OnceCore {
public:
  OnceCore(Context &ctx, std::string pattern, std::vector<std::string> params,
           std::size_t arity, OnceOptions opts);

  // Lock name for a call, before the key prefix is applied.
  template <typename... Args> std::string name(const Args &...args) const {
    return template_.resolve(bind_arguments(params_, args...));
  }

  // The held lock, or nullopt when the call must take the contention path.
  std::optional<Lock> enter(const std::string &name) const;
  Task<std::optional<AsyncLock>> enter_async(std::string name) const;

  bool is_locked(const std::string &name) const;
  Task<bool> is_locked_async(std::string name) const;

  std::string full_key(const std::string &name) const {
    return ctx_.full_key(name);
  }
  Duration ttl() const { return ttl_; }

private:
  LockOptions lock_options() const;

  Context &ctx_;
  KeyTemplate template_;
  std::vector<std::string> params_;
  Duration ttl_;
  LockStoreErrorPolicy policy_;
};

} // namespace detail

template <typename Sig> class OnceFunction;
template <typename Sig> class AsyncOnceFunction;

// Runs the wrapped callable only while holding the store lock for its key.
// Concurrent calls with the same key, in this process or any other, take
// the contention path. The lock is released on every exit.
template <typename R, typename... Args> class OnceFunction<R(Args...)> {
public:
  using result_type = R;

  OnceFunction(Context &ctx, std::string pattern,
               std::vector<std::string> params, std::function<R(Args...)> fn,
               ContentionPolicy<R> on_contended, OnceOptions opts = {})
      : core_(std::make_shared<detail::OnceCore>(
            ctx, std::move(pattern), std::move(params), sizeof...(Args),
            opts)),
        fn_(std::move(fn)), on_contended_(std::move(on_contended)) {}

  R operator()(Args... args) const {
    const std::string name = core_->name(args...);
    auto lock = core_->enter(name);
    if (!lock)
      return on_contended_.apply(core_->full_key(name));
    return fn_(std::forward<Args>(args)...);
  }

  bool is_locked(Args... args) const {
    return core_->is_locked(core_->name(args...));
  }

  std::string key(Args... args) const {
    return core_->full_key(core_->name(args...));
  }

private:
  std::shared_ptr<detail::OnceCore> core_;
  std::function<R(Args...)> fn_;
  ContentionPolicy<R> on_contended_;
};

template <typename T, typename... Args>
class AsyncOnceFunction<Task<T>(Args...)> {
public:
  using result_type = Task<T>;

  AsyncOnceFunction(Context &ctx, std::string pattern,
                    std::vector<std::string> params,
                    std::function<Task<T>(Args...)> fn,
                    ContentionPolicy<T> on_contended, OnceOptions opts = {})
      : core_(std::make_shared<detail::OnceCore>(
            ctx, std::move(pattern), std::move(params), sizeof...(Args),
            opts)),
        fn_(std::move(fn)), on_contended_(std::move(on_contended)) {}

  Task<T> operator()(Args... args) const {
    std::string name = core_->name(args...);
    return call(core_, fn_, on_contended_, std::move(name),
                std::forward<Args>(args)...);
  }

  Task<bool> is_locked(Args... args) const {
    return check_locked(core_, core_->name(args...));
  }

  std::string key(Args... args) const {
    return core_->full_key(core_->name(args...));
  }

private:
  // If the frame is destroyed while `fn` is suspended, the lock's
  // destructor releases it.
  static Task<T> call(std::shared_ptr<detail::OnceCore> core,
                      std::function<Task<T>(Args...)> fn,
                      ContentionPolicy<T> on_contended, std::string name,
                      std::decay_t<Args>... args) {
    auto lock = co_await core->enter_async(name);
    if (!lock)
      co_return on_contended.apply(core->full_key(name));

    std::exception_ptr failure;
    if constexpr (std::is_void_v<T>) {
      try {
        co_await fn(std::forward<Args>(args)...);
      } catch (...) {
        failure = std::current_exception();
      }
      co_await lock->release();
      if (failure)
        std::rethrow_exception(failure);
    } else {
      std::optional<T> result;
      try {
        result.emplace(co_await fn(std::forward<Args>(args)...));
      } catch (...) {
        failure = std::current_exception();
      }
      co_await lock->release();
      if (failure)
        std::rethrow_exception(failure);
      co_return std::move(*result);
    }
  }

  static Task<bool> check_locked(std::shared_ptr<detail::OnceCore> core,
                          std::string name) {
    co_return co_await core->is_locked_async(std::move(name));
  }

  std::shared_ptr<detail::OnceCore> core_;
  std::function<Task<T>(Args...)> fn_;
  ContentionPolicy<T> on_contended_;
};

namespace detail {

template <typename R> struct unwrap_task {
  using type = R;
};
template <typename T> struct unwrap_task<Task<T>> {
  using type = T;
};

// What a contended call yields: R for R(Args...), T for Task<T>(Args...).
template <typename F>
using contended_value_t =
    typename unwrap_task<typename callable_traits_t<F>::result_type>::type;

} // namespace detail

// Wraps `fn` in a store lock keyed by `pattern`. `on_contended` is
// raise_on_contended() or return_on_contended(fallback). A coroutine
// returning Task<T> gets an AsyncOnceFunction, anything else a OnceFunction.
template <typename F, typename OnContended>
auto once(Context &ctx, std::string pattern, std::vector<std::string> params,
          F fn, OnContended on_contended, OnceOptions opts = {}) {
  using Wrapper = select_wrapper_t<F, OnceFunction, AsyncOnceFunction>;
  return Wrapper(ctx, std::move(pattern), std::move(params), std::move(fn),
                 ContentionPolicy<detail::contended_value_t<F>>(
                     std::move(on_contended)),
                 opts);
}

} // namespace cachify
