#include "cachify/resp.hpp"

#include <charconv>

namespace cachify {
namespace {

constexpr std::int64_t kMaxBulkLen = 512LL * 1024 * 1024;
constexpr std::int64_t kMaxArrayLen = 1 << 20;
constexpr int kMaxDepth = 16;

bool parse_int(const std::string &s, std::int64_t &out) {
  if (s.empty())
    return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

} // namespace

void RespReplyParser::feed(const std::string &data) { buffer_ += data; }

void RespReplyParser::feed(const char *data, std::size_t n) {
  buffer_.append(data, n);
}

void RespReplyParser::reset() {
  buffer_.clear();
  malformed_ = false;
}

bool RespReplyParser::read_line(std::size_t &pos, std::string &line) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return false;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return true;
}

// Returns false when more input is needed or the stream is malformed; the
// two cases are told apart by malformed_.
bool RespReplyParser::parse(std::size_t &pos, RespReply &out, int depth) {
  if (pos >= buffer_.size())
    return false;
  if (depth > kMaxDepth) {
    malformed_ = true;
    return false;
  }
  const char marker = buffer_[pos];
  std::size_t cur = pos + 1;
  std::string line;
  if (!read_line(cur, line))
    return false;

  switch (marker) {
  case '+':
    out.type = RespReply::Type::simple;
    out.str = std::move(line);
    break;
  case '-':
    out.type = RespReply::Type::error;
    out.str = std::move(line);
    break;
  case ':':
    out.type = RespReply::Type::integer;
    if (!parse_int(line, out.integer)) {
      malformed_ = true;
      return false;
    }
    break;
  case '$': {
    std::int64_t len = 0;
    if (!parse_int(line, len) || len < -1 || len > kMaxBulkLen) {
      malformed_ = true;
      return false;
    }
    if (len == -1) {
      out.type = RespReply::Type::null;
      break;
    }
    const auto n = static_cast<std::size_t>(len);
    if (cur + n + 2 > buffer_.size())
      return false;
    if (buffer_.compare(cur + n, 2, "\r\n") != 0) {
      malformed_ = true;
      return false;
    }
    out.type = RespReply::Type::bulk;
    out.str = buffer_.substr(cur, n);
    cur += n + 2;
    break;
  }
  case '*': {
    std::int64_t count = 0;
    if (!parse_int(line, count) || count < -1 || count > kMaxArrayLen) {
      malformed_ = true;
      return false;
    }
    if (count == -1) {
      out.type = RespReply::Type::null;
      break;
    }
    out.type = RespReply::Type::array;
    out.elements.clear();
    for (std::int64_t i = 0; i < count; ++i) {
      RespReply child;
      if (!parse(cur, child, depth + 1))
        return false;
      out.elements.push_back(std::move(child));
    }
    break;
  }
  default:
    malformed_ = true;
    return false;
  }
  pos = cur;
  return true;
}

std::optional<RespReply> RespReplyParser::next_reply() {
  if (malformed_)
    return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  if (!parse(pos, reply, 0))
    return std::nullopt;
  buffer_.erase(0, pos);
  return reply;
}

std::string encode_command(const std::vector<std::string> &args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto &a : args) {
    out += '$';
    out += std::to_string(a.size());
    out += "\r\n";
    out += a;
    out += "\r\n";
  }
  return out;
}

} // namespace cachify
