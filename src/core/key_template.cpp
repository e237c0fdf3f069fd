#include "cachify/key_template.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace cachify {
namespace {

bool is_identifier(const std::string &s) {
  if (s.empty())
    return false;
  if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_'))
    return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_';
  });
}

bool is_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
           return std::isdigit(c);
         });
}

std::size_t parse_index(const std::string &pattern, const std::string &digits) {
  std::size_t out = 0;
  auto res = std::from_chars(digits.data(), digits.data() + digits.size(), out);
  if (res.ec != std::errc())
    throw KeyResolutionError("invalid key template '" + pattern +
                             "': index " + digits + " is too large");
  return out;
}

[[noreturn]] void bad_template(const std::string &pattern,
                               const std::string &why) {
  throw KeyResolutionError("invalid key template '" + pattern + "': " + why);
}

// Parses the inside of "{...}" into a root and an access path.
KeyTemplate::Placeholder parse_field(const std::string &pattern,
                                     const std::string &field,
                                     std::size_t &auto_index, bool &used_auto,
                                     bool &used_manual) {
  if (field.find('!') != std::string::npos)
    bad_template(pattern, "conversions are not supported in {" + field + "}");
  if (field.find(':') != std::string::npos)
    bad_template(pattern, "format specs are not supported in {" + field + "}");

  KeyTemplate::Placeholder ph;
  ph.text = "{" + field + "}";

  std::size_t pos = 0;
  while (pos < field.size() && field[pos] != '.' && field[pos] != '[')
    ++pos;
  const std::string root = field.substr(0, pos);

  if (root.empty()) {
    if (used_manual)
      bad_template(pattern, "cannot mix automatic and manual field numbering");
    used_auto = true;
    ph.index = auto_index++;
  } else if (is_digits(root)) {
    if (used_auto)
      bad_template(pattern, "cannot mix automatic and manual field numbering");
    used_manual = true;
    ph.index = parse_index(pattern, root);
  } else if (is_identifier(root)) {
    ph.root = root;
  } else {
    bad_template(pattern, "invalid field name '" + root + "'");
  }

  while (pos < field.size()) {
    if (field[pos] == '.') {
      std::size_t end = pos + 1;
      while (end < field.size() && field[end] != '.' && field[end] != '[')
        ++end;
      std::string name = field.substr(pos + 1, end - pos - 1);
      if (!is_identifier(name))
        bad_template(pattern, "invalid attribute in " + ph.text);
      ph.path.push_back(KeyTemplate::FieldStep{std::move(name)});
      pos = end;
    } else {
      const auto close = field.find(']', pos);
      if (close == std::string::npos)
        bad_template(pattern, "missing ']' in " + ph.text);
      std::string inner = field.substr(pos + 1, close - pos - 1);
      if (is_digits(inner))
        ph.path.push_back(KeyTemplate::IndexStep{parse_index(pattern, inner)});
      else if (!inner.empty() && inner.find('[') == std::string::npos)
        ph.path.push_back(KeyTemplate::FieldStep{std::move(inner)});
      else
        bad_template(pattern, "invalid index in " + ph.text);
      pos = close + 1;
      if (pos < field.size() && field[pos] != '.' && field[pos] != '[')
        bad_template(pattern, "unexpected text after ']' in " + ph.text);
    }
  }
  return ph;
}

} // namespace

KeyTemplate::KeyTemplate(std::string pattern) : pattern_(std::move(pattern)) {
  std::string literal;
  std::size_t auto_index = 0;
  bool used_auto = false;
  bool used_manual = false;

  std::size_t i = 0;
  while (i < pattern_.size()) {
    const char c = pattern_[i];
    if (c == '{') {
      if (i + 1 < pattern_.size() && pattern_[i + 1] == '{') {
        literal.push_back('{');
        i += 2;
        continue;
      }
      const auto close = pattern_.find('}', i + 1);
      if (close == std::string::npos)
        bad_template(pattern_, "unmatched '{'");
      const std::string field = pattern_.substr(i + 1, close - i - 1);
      if (field.find('{') != std::string::npos)
        bad_template(pattern_, "nested '{' in placeholder");
      if (!literal.empty()) {
        segments_.emplace_back(std::move(literal));
        literal.clear();
      }
      placeholders_.push_back(
          parse_field(pattern_, field, auto_index, used_auto, used_manual));
      segments_.emplace_back(placeholders_.size() - 1);
      i = close + 1;
    } else if (c == '}') {
      if (i + 1 < pattern_.size() && pattern_[i + 1] == '}') {
        literal.push_back('}');
        i += 2;
        continue;
      }
      bad_template(pattern_, "single '}' encountered");
    } else {
      literal.push_back(c);
      ++i;
    }
  }
  if (!literal.empty())
    segments_.emplace_back(std::move(literal));
}

void KeyTemplate::check_params(const std::vector<std::string> &names) const {
  for (const auto &ph : placeholders_) {
    if (ph.index.has_value()) {
      if (*ph.index >= names.size())
        throw KeyResolutionError("key template '" + pattern_ + "': " + ph.text +
                                 " refers to argument " +
                                 std::to_string(*ph.index) + " but only " +
                                 std::to_string(names.size()) + " declared");
      continue;
    }
    if (std::find(names.begin(), names.end(), ph.root) == names.end())
      throw KeyResolutionError("key template '" + pattern_ + "': " + ph.text +
                               " names no parameter");
  }
}

std::string KeyTemplate::resolve(const BoundArgs &args) const {
  std::string out;
  for (const auto &seg : segments_) {
    if (const auto *text = std::get_if<std::string>(&seg)) {
      out += *text;
      continue;
    }
    const auto &ph = placeholders_[std::get<std::size_t>(seg)];

    std::size_t slot = 0;
    if (ph.index.has_value()) {
      slot = *ph.index;
      if (slot >= args.values.size())
        throw KeyResolutionError(ph.text + ": missing positional argument " +
                                 std::to_string(slot));
    } else {
      auto it = std::find(args.names.begin(), args.names.end(), ph.root);
      if (it == args.names.end())
        throw KeyResolutionError(ph.text + ": missing parameter '" + ph.root +
                                 "'");
      slot = static_cast<std::size_t>(it - args.names.begin());
      if (slot >= args.values.size())
        throw KeyResolutionError(ph.text + ": parameter '" + ph.root +
                                 "' was not bound");
    }
    if (!args.values[slot].has_value())
      throw KeyResolutionError(ph.text +
                               ": argument type cannot be used in a key");

    const Value *cur = &*args.values[slot];
    for (const auto &step : ph.path) {
      if (const auto *field = std::get_if<FieldStep>(&step)) {
        const Value *next = cur->find(field->name);
        if (!next)
          throw KeyResolutionError(
              ph.text + ": no attribute '" + field->name + "' on " +
              kind_name(cur->kind()));
        cur = next;
      } else {
        const auto idx = std::get<IndexStep>(step).index;
        const Value *next = cur->at(idx);
        if (!next)
          throw KeyResolutionError(ph.text + ": index " + std::to_string(idx) +
                                   " out of range on " +
                                   kind_name(cur->kind()));
        cur = next;
      }
    }
    out += render(*cur);
  }
  return out;
}

} // namespace cachify
