#pragma once

#include "cachify/task.hpp"

#include <cstddef>
#include <type_traits>

namespace cachify {

// Signature of a function, function pointer, member call operator or
// lambda, read once when a decorator is built.
template <typename F>
struct callable_traits : callable_traits<decltype(&F::operator())> {};

template <typename R, typename... Args> struct callable_traits<R(Args...)> {
  using result_type = R;
  using signature = R(Args...);
  static constexpr std::size_t arity = sizeof...(Args);
  static constexpr bool is_async = is_task_v<R>;
};

template <typename R, typename... Args>
struct callable_traits<R(Args...) noexcept> : callable_traits<R(Args...)> {};
template <typename R, typename... Args>
struct callable_traits<R (*)(Args...)> : callable_traits<R(Args...)> {};
template <typename R, typename... Args>
struct callable_traits<R (*)(Args...) noexcept> : callable_traits<R(Args...)> {
};
template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R(Args...)> {};
template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R(Args...)> {
};
template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) noexcept>
    : callable_traits<R(Args...)> {};
template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const noexcept>
    : callable_traits<R(Args...)> {};

template <typename F>
using callable_traits_t = callable_traits<std::remove_cv_t<std::remove_reference_t<F>>>;

// Picks the synchronous or the coroutine wrapper for F. Both must be class
// templates over a function signature.
template <typename F, template <typename> class Sync,
          template <typename> class Async>
using select_wrapper_t =
    std::conditional_t<callable_traits_t<F>::is_async,
                       Async<typename callable_traits_t<F>::signature>,
                       Sync<typename callable_traits_t<F>::signature>>;

} // namespace cachify
