#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cachify {

struct RespReply {
  enum class Type { simple, error, integer, bulk, null, array };

  Type type{Type::null};
  std::string str;       // simple, error, bulk
  std::int64_t integer{0};
  std::vector<RespReply> elements;

  bool is_null() const { return type == Type::null; }
  bool is_error() const { return type == Type::error; }
  bool is_ok() const { return type == Type::simple && str == "OK"; }
};

// Incremental RESP2 reply reader for the client side of a connection.
class RespReplyParser {
public:
  void feed(const std::string &data);
  void feed(const char *data, std::size_t n);
  std::optional<RespReply> next_reply();
  // Set once the stream contained something that is not RESP.
  bool malformed() const { return malformed_; }
  void reset();

private:
  bool parse(std::size_t &pos, RespReply &out, int depth);
  bool read_line(std::size_t &pos, std::string &line) const;

  std::string buffer_;
  bool malformed_{false};
};

// Command as a RESP array of bulk strings.
std::string encode_command(const std::vector<std::string> &args);

} // namespace cachify
