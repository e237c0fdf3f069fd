#include "cachify/value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace cachify {
namespace {

std::string format_double(double d) {
  if (!std::isfinite(d))
    return "null";
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), d);
  std::string out(buf, res.ptr);
  if (out.find_first_of(".eEn") == std::string::npos)
    out += ".0";
  return out;
}

void append_json_string(std::string &out, const std::string &s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (c < 0x20) {
        char esc[8];
        std::snprintf(esc, sizeof(esc), "\\u%04x", c);
        out += esc;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  out.push_back('"');
}

void append_json(std::string &out, const Value &v) {
  switch (v.kind()) {
  case Value::Kind::null:
    out += "null";
    break;
  case Value::Kind::boolean:
    out += v.as_bool() ? "true" : "false";
    break;
  case Value::Kind::integer:
    out += std::to_string(v.as_int());
    break;
  case Value::Kind::real:
    out += format_double(v.as_double());
    break;
  case Value::Kind::string:
    append_json_string(out, v.as_string());
    break;
  case Value::Kind::array: {
    out.push_back('[');
    bool first = true;
    for (const auto &item : v.as_array()) {
      if (!first)
        out.push_back(',');
      first = false;
      append_json(out, item);
    }
    out.push_back(']');
    break;
  }
  case Value::Kind::object: {
    out.push_back('{');
    bool first = true;
    for (const auto &[name, item] : v.as_object()) {
      if (!first)
        out.push_back(',');
      first = false;
      append_json_string(out, name);
      out.push_back(':');
      append_json(out, item);
    }
    out.push_back('}');
    break;
  }
  }
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class JsonReader {
public:
  explicit JsonReader(std::string_view text) : text_(text) {}

  bool parse(Value &out) {
    if (!parse_value(out, 0))
      return false;
    skip_ws();
    if (pos_ != text_.size())
      return fail("trailing characters");
    return true;
  }

  const std::string &error() const { return error_; }

private:
  static constexpr int kMaxDepth = 64;

  bool fail(const std::string &what) {
    if (error_.empty())
      error_ = what + " at offset " + std::to_string(pos_);
    return false;
  }

  void skip_ws() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' ||
            text_[pos_] == '\t'))
      ++pos_;
  }

  bool consume(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word)
      return false;
    pos_ += word.size();
    return true;
  }

  bool parse_value(Value &out, int depth) {
    if (depth > kMaxDepth)
      return fail("nesting too deep");
    skip_ws();
    if (pos_ >= text_.size())
      return fail("unexpected end of input");
    const char c = text_[pos_];
    if (c == '{')
      return parse_object(out, depth);
    if (c == '[')
      return parse_array(out, depth);
    if (c == '"') {
      std::string s;
      if (!parse_string(s))
        return false;
      out = Value(std::move(s));
      return true;
    }
    if (consume("null")) {
      out = Value();
      return true;
    }
    if (consume("true")) {
      out = Value(true);
      return true;
    }
    if (consume("false")) {
      out = Value(false);
      return true;
    }
    return parse_number(out);
  }

  bool parse_number(Value &out) {
    const std::size_t start = pos_;
    bool real = false;
    if (pos_ < text_.size() && text_[pos_] == '-')
      ++pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c >= '0' && c <= '9') {
        ++pos_;
      } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
        real = true;
        ++pos_;
      } else {
        break;
      }
    }
    if (pos_ == start)
      return fail("unexpected character");
    const char *first = text_.data() + start;
    const char *last = text_.data() + pos_;
    if (!real) {
      std::int64_t i = 0;
      auto res = std::from_chars(first, last, i);
      if (res.ec == std::errc() && res.ptr == last) {
        out = Value(i);
        return true;
      }
    }
    double d = 0.0;
    auto res = std::from_chars(first, last, d);
    if (res.ec != std::errc() || res.ptr != last)
      return fail("invalid number");
    out = Value(d);
    return true;
  }

  bool parse_hex4(std::uint32_t &cp) {
    if (pos_ + 4 > text_.size())
      return fail("truncated unicode escape");
    cp = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = text_[pos_++];
      cp <<= 4;
      if (c >= '0' && c <= '9')
        cp |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        cp |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        cp |= static_cast<std::uint32_t>(c - 'A' + 10);
      else
        return fail("invalid unicode escape");
    }
    return true;
  }

  bool parse_string(std::string &out) {
    ++pos_; // opening quote
    while (pos_ < text_.size()) {
      const char c = text_[pos_++];
      if (c == '"')
        return true;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= text_.size())
        break;
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp))
          return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t low = 0;
          if (!consume("\\u") || !parse_hex4(low) || low < 0xDC00 ||
              low > 0xDFFF)
            return fail("unpaired surrogate");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parse_array(Value &out, int depth) {
    ++pos_;
    Value::Array items;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      out = Value(std::move(items));
      return true;
    }
    while (true) {
      Value item;
      if (!parse_value(item, depth + 1))
        return false;
      items.push_back(std::move(item));
      skip_ws();
      if (pos_ >= text_.size())
        return fail("unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        out = Value(std::move(items));
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool parse_object(Value &out, int depth) {
    ++pos_;
    Value::Object fields;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      out = Value(std::move(fields));
      return true;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"')
        return fail("expected field name");
      std::string name;
      if (!parse_string(name))
        return false;
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':')
        return fail("expected ':'");
      ++pos_;
      Value item;
      if (!parse_value(item, depth + 1))
        return false;
      fields.emplace_back(std::move(name), std::move(item));
      skip_ws();
      if (pos_ >= text_.size())
        return fail("unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        out = Value(std::move(fields));
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  std::string_view text_;
  std::size_t pos_{0};
  std::string error_;
};

} // namespace

const Value *Value::find(std::string_view field) const {
  if (!is_object())
    return nullptr;
  for (const auto &[name, item] : as_object()) {
    if (name == field)
      return &item;
  }
  return nullptr;
}

const Value *Value::at(std::size_t index) const {
  if (!is_array() || index >= as_array().size())
    return nullptr;
  return &as_array()[index];
}

const char *kind_name(Value::Kind kind) {
  switch (kind) {
  case Value::Kind::null:
    return "null";
  case Value::Kind::boolean:
    return "bool";
  case Value::Kind::integer:
    return "int";
  case Value::Kind::real:
    return "double";
  case Value::Kind::string:
    return "string";
  case Value::Kind::array:
    return "array";
  case Value::Kind::object:
    return "object";
  }
  return "unknown";
}

std::string render(const Value &v) {
  if (v.is_string())
    return v.as_string();
  return encode_json(v);
}

std::string encode_json(const Value &v) {
  std::string out;
  append_json(out, v);
  return out;
}

bool decode_json(std::string_view text, Value &out, std::string *err) {
  JsonReader reader(text);
  Value parsed;
  if (!reader.parse(parsed)) {
    if (err)
      *err = reader.error();
    return false;
  }
  out = std::move(parsed);
  return true;
}

} // namespace cachify
