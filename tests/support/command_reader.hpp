#pragma once

#include "cachify/resp.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cachify::testing {

// Server side of the wire: splits a client stream into commands. A command
// is a RESP array of bulk strings; anything else is a protocol error after
// which the stream cannot be resynchronized.
class CommandReader {
public:
  enum class Status { ready, need_more, protocol_error };

  void feed(const char *data, std::size_t n) { replies_.feed(data, n); }
  void feed(const std::string &data) { replies_.feed(data); }

  Status next(std::vector<std::string> &args);

private:
  RespReplyParser replies_;
  bool broken_{false};
};

// Replies the test server writes back.
namespace reply {

std::string status(const std::string &text);
// `text` is sent as is, e.g. "ERR syntax error" or "NOAUTH ...".
std::string error(const std::string &text);
std::string integer(std::int64_t v);
std::string bulk(const std::string &s);
std::string nil();

} // namespace reply

} // namespace cachify::testing
