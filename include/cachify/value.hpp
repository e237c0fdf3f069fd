#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cachify {

// Generic representation of call arguments and cached results. Objects keep
// insertion order so that rendering is deterministic.
class Value {
public:
  using Array = std::vector<Value>;
  using Object = std::vector<std::pair<std::string, Value>>;

  enum class Kind { null, boolean, integer, real, string, array, object };

  Value() = default;
  Value(std::nullptr_t) {}
  // Integral types only; a pointer must not turn into a bool here.
  template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
  Value(T v) {
    if constexpr (std::is_same_v<T, bool>)
      data_ = v;
    else
      data_ = static_cast<std::int64_t>(v);
  }
  Value(double d) : data_(d) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(std::string_view s) : data_(std::string(s)) {}
  Value(const char *s) : data_(std::string(s)) {}
  Value(Array a) : data_(std::move(a)) {}
  Value(Object o) : data_(std::move(o)) {}

  Kind kind() const { return static_cast<Kind>(data_.index()); }
  bool is_null() const { return kind() == Kind::null; }
  bool is_bool() const { return kind() == Kind::boolean; }
  bool is_int() const { return kind() == Kind::integer; }
  bool is_double() const { return kind() == Kind::real; }
  bool is_number() const { return is_int() || is_double(); }
  bool is_string() const { return kind() == Kind::string; }
  bool is_array() const { return kind() == Kind::array; }
  bool is_object() const { return kind() == Kind::object; }

  bool as_bool() const { return std::get<bool>(data_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
  double as_double() const {
    return is_int() ? static_cast<double>(as_int()) : std::get<double>(data_);
  }
  const std::string &as_string() const { return std::get<std::string>(data_); }
  const Array &as_array() const { return std::get<Array>(data_); }
  const Object &as_object() const { return std::get<Object>(data_); }

  // nullptr when this is not an object or has no such field.
  const Value *find(std::string_view field) const;
  // nullptr when this is not an array or the index is out of range.
  const Value *at(std::size_t index) const;

  bool operator==(const Value &other) const { return data_ == other.data_; }
  bool operator!=(const Value &other) const { return !(*this == other); }

private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string, Array,
               Object>
      data_;
};

const char *kind_name(Value::Kind kind);

// String form used inside keys: strings verbatim, scalars in their shortest
// exact text, containers as compact JSON.
std::string render(const Value &v);

std::string encode_json(const Value &v);
bool decode_json(std::string_view text, Value &out, std::string *err = nullptr);

// to_value / from_value are the customization points for argument and
// result types. User types provide overloads found by ADL.
template <typename T> Value to_value(const std::optional<T> &v);
template <typename T> Value to_value(const std::vector<T> &items);
template <typename T> bool from_value(const Value &v, std::optional<T> &out);
template <typename T> bool from_value(const Value &v, std::vector<T> &out);

inline Value to_value(const Value &v) { return v; }
inline Value to_value(const std::string &s) { return Value(s); }
inline Value to_value(std::string_view s) { return Value(s); }
inline Value to_value(const char *s) { return Value(s); }
inline Value to_value(std::nullptr_t) { return Value(); }

template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
Value to_value(T v) {
  if constexpr (std::is_same_v<T, bool>)
    return Value(v);
  else if constexpr (std::is_integral_v<T>)
    return Value(static_cast<std::int64_t>(v));
  else
    return Value(static_cast<double>(v));
}

template <typename T> Value to_value(const std::optional<T> &v) {
  if (!v.has_value())
    return Value();
  return to_value(*v);
}

template <typename T> Value to_value(const std::vector<T> &items) {
  Value::Array out;
  out.reserve(items.size());
  for (const auto &item : items)
    out.push_back(to_value(item));
  return Value(std::move(out));
}

inline bool from_value(const Value &v, Value &out) {
  out = v;
  return true;
}

inline bool from_value(const Value &v, std::string &out) {
  if (!v.is_string())
    return false;
  out = v.as_string();
  return true;
}

template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
bool from_value(const Value &v, T &out) {
  if constexpr (std::is_same_v<T, bool>) {
    if (!v.is_bool())
      return false;
    out = v.as_bool();
  } else if constexpr (std::is_integral_v<T>) {
    if (!v.is_int())
      return false;
    out = static_cast<T>(v.as_int());
  } else {
    if (!v.is_number())
      return false;
    out = static_cast<T>(v.as_double());
  }
  return true;
}

template <typename T> bool from_value(const Value &v, std::optional<T> &out) {
  if (v.is_null()) {
    out.reset();
    return true;
  }
  T inner{};
  if (!from_value(v, inner))
    return false;
  out = std::move(inner);
  return true;
}

template <typename T> bool from_value(const Value &v, std::vector<T> &out) {
  if (!v.is_array())
    return false;
  std::vector<T> items;
  items.reserve(v.as_array().size());
  for (const auto &elem : v.as_array()) {
    T item{};
    if (!from_value(elem, item))
      return false;
    items.push_back(std::move(item));
  }
  out = std::move(items);
  return true;
}

namespace detail {

template <typename T, typename = void> struct has_to_value : std::false_type {};
template <typename T>
struct has_to_value<T, std::void_t<decltype(to_value(std::declval<const T &>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_from_value : std::false_type {};
template <typename T>
struct has_from_value<T, std::void_t<decltype(from_value(
                             std::declval<const Value &>(),
                             std::declval<T &>()))>> : std::true_type {};

} // namespace detail

template <typename T>
inline constexpr bool has_to_value_v =
    detail::has_to_value<std::remove_cv_t<std::remove_reference_t<T>>>::value;
template <typename T>
inline constexpr bool has_from_value_v = detail::has_from_value<T>::value;

} // namespace cachify
