#pragma once

#include "cachify/errors.hpp"
#include "cachify/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cachify {

// Call arguments mapped onto the declared parameter names. An argument
// whose type has no to_value() is bound as nullopt: it may be passed but
// cannot appear in a key.
struct BoundArgs {
  std::vector<std::string> names;
  std::vector<std::optional<Value>> values;
};

namespace detail {

template <typename T> std::optional<Value> bind_one(const T &arg) {
  if constexpr (has_to_value_v<T>)
    return to_value(arg);
  else
    return std::nullopt;
}

} // namespace detail

template <typename... Args>
BoundArgs bind_arguments(const std::vector<std::string> &names,
                         const Args &...args) {
  if (names.size() != sizeof...(Args))
    throw KeyResolutionError("declared " + std::to_string(names.size()) +
                             " parameter names for a call with " +
                             std::to_string(sizeof...(Args)) + " arguments");
  BoundArgs bound;
  bound.names = names;
  bound.values.reserve(sizeof...(Args));
  (bound.values.push_back(detail::bind_one(args)), ...);
  return bound;
}

// A key pattern such as "read_user-{user_id}" or "order-{order.customer.id}".
// Parsed once; resolve() is pure and deterministic.
class KeyTemplate {
public:
  struct FieldStep {
    std::string name;
  };
  struct IndexStep {
    std::size_t index;
  };
  using Step = std::variant<FieldStep, IndexStep>;

  struct Placeholder {
    std::string root;                 // parameter name, or empty if positional
    std::optional<std::size_t> index; // positional argument index
    std::vector<Step> path;
    std::string text;                 // placeholder as written, for errors
  };

  explicit KeyTemplate(std::string pattern);

  const std::string &pattern() const { return pattern_; }
  const std::vector<Placeholder> &placeholders() const { return placeholders_; }

  // Throws KeyResolutionError if a placeholder cannot refer to any of the
  // given parameters. Called once at decoration time.
  void check_params(const std::vector<std::string> &names) const;

  std::string resolve(const BoundArgs &args) const;

private:
  // Literal text and placeholders alternate; segments_[i] holds either.
  using Segment = std::variant<std::string, std::size_t>;

  std::string pattern_;
  std::vector<Segment> segments_;
  std::vector<Placeholder> placeholders_;
};

} // namespace cachify
