#pragma once

#include "cachify/value.hpp"

#include <optional>
#include <string>
#include <type_traits>

namespace cachify {

// Wire form of cached results: JSON text of to_value(result). Specialize for
// types that need a different encoding.
template <typename T> struct Codec {
  static_assert(has_to_value_v<T>,
                "cached result type needs a to_value(const T&) overload");
  static_assert(has_from_value_v<T>,
                "cached result type needs a from_value(const Value&, T&) "
                "overload");
  static_assert(std::is_default_constructible_v<T>,
                "default Codec needs a default constructible type");

  static std::string encode(const T &value) {
    return encode_json(to_value(value));
  }

  static std::optional<T> decode(const std::string &payload) {
    Value v;
    if (!decode_json(payload, v))
      return std::nullopt;
    T out{};
    if (!from_value(v, out))
      return std::nullopt;
    return out;
  }
};

} // namespace cachify
