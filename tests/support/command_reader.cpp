#include "support/command_reader.hpp"

namespace cachify::testing {

CommandReader::Status CommandReader::next(std::vector<std::string> &args) {
  if (broken_)
    return Status::protocol_error;
  auto r = replies_.next_reply();
  if (!r) {
    broken_ = replies_.malformed();
    return broken_ ? Status::protocol_error : Status::need_more;
  }
  if (r->type != RespReply::Type::array || r->elements.empty()) {
    broken_ = true;
    return Status::protocol_error;
  }
  args.clear();
  for (auto &e : r->elements) {
    if (e.type != RespReply::Type::bulk) {
      broken_ = true;
      return Status::protocol_error;
    }
    args.push_back(std::move(e.str));
  }
  return Status::ready;
}

namespace reply {

std::string status(const std::string &text) { return "+" + text + "\r\n"; }

std::string error(const std::string &text) { return "-" + text + "\r\n"; }

std::string integer(std::int64_t v) {
  return ":" + std::to_string(v) + "\r\n";
}

std::string bulk(const std::string &s) {
  return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}

std::string nil() { return "$-1\r\n"; }

} // namespace reply

} // namespace cachify::testing
