#include "cachify/resp.hpp"
#include "support/command_reader.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace cachify;
using namespace cachify::testing;

TEST_CASE("Reply parser waits for a complete reply", "[resp]") {
  RespReplyParser p;
  p.feed("$5\r\nhel");
  CHECK_FALSE(p.next_reply().has_value());
  p.feed("lo\r");
  CHECK_FALSE(p.next_reply().has_value());
  p.feed("\n+OK\r\n");

  auto first = p.next_reply();
  REQUIRE(first.has_value());
  CHECK(first->type == RespReply::Type::bulk);
  CHECK(first->str == "hello");

  auto second = p.next_reply();
  REQUIRE(second.has_value());
  CHECK(second->is_ok());
  CHECK_FALSE(p.next_reply().has_value());
  CHECK_FALSE(p.malformed());
}

TEST_CASE("Reply parser decodes every reply type", "[resp]") {
  RespReplyParser p;
  p.feed(":-12\r\n$-1\r\n*-1\r\n-WRONGTYPE bad key\r\n$0\r\n\r\n");

  auto integer = p.next_reply();
  REQUIRE(integer);
  CHECK(integer->type == RespReply::Type::integer);
  CHECK(integer->integer == -12);

  auto null_bulk = p.next_reply();
  REQUIRE(null_bulk);
  CHECK(null_bulk->is_null());

  auto null_array = p.next_reply();
  REQUIRE(null_array);
  CHECK(null_array->is_null());

  auto err = p.next_reply();
  REQUIRE(err);
  CHECK(err->is_error());
  CHECK(err->str == "WRONGTYPE bad key");

  auto empty = p.next_reply();
  REQUIRE(empty);
  CHECK(empty->type == RespReply::Type::bulk);
  CHECK(empty->str.empty());
}

TEST_CASE("Reply parser reads nested arrays split across feeds", "[resp]") {
  RespReplyParser p;
  const std::string wire = "*2\r\n:1\r\n*2\r\n$1\r\na\r\n$-1\r\n";
  for (char c : wire) {
    CHECK_FALSE(p.next_reply().has_value());
    p.feed(&c, 1);
  }
  auto r = p.next_reply();
  REQUIRE(r);
  REQUIRE(r->type == RespReply::Type::array);
  REQUIRE(r->elements.size() == 2);
  CHECK(r->elements[0].integer == 1);
  REQUIRE(r->elements[1].elements.size() == 2);
  CHECK(r->elements[1].elements[0].str == "a");
  CHECK(r->elements[1].elements[1].is_null());
}

TEST_CASE("Reply parser flags streams that are not RESP", "[resp]") {
  RespReplyParser bad_marker;
  bad_marker.feed("HTTP/1.1 200 OK\r\n");
  CHECK_FALSE(bad_marker.next_reply().has_value());
  CHECK(bad_marker.malformed());

  RespReplyParser bad_len;
  bad_len.feed("$abc\r\n");
  CHECK_FALSE(bad_len.next_reply().has_value());
  CHECK(bad_len.malformed());

  RespReplyParser bad_terminator;
  bad_terminator.feed("$2\r\nokXX");
  CHECK_FALSE(bad_terminator.next_reply().has_value());
  CHECK(bad_terminator.malformed());

  bad_terminator.reset();
  CHECK_FALSE(bad_terminator.malformed());
  bad_terminator.feed("+PONG\r\n");
  auto r = bad_terminator.next_reply();
  REQUIRE(r);
  CHECK(r->str == "PONG");
}

TEST_CASE("Command reader handles partial feeds", "[resp]") {
  CommandReader r;
  std::vector<std::string> args;
  r.feed("*2\r\n$3\r\nGET\r\n$4\r\nus");
  CHECK(r.next(args) == CommandReader::Status::need_more);
  r.feed("er\r\n*1\r\n$4\r\nPING\r\n");
  REQUIRE(r.next(args) == CommandReader::Status::ready);
  CHECK(args == std::vector<std::string>{"GET", "user"});
  REQUIRE(r.next(args) == CommandReader::Status::ready);
  CHECK(args == std::vector<std::string>{"PING"});
  CHECK(r.next(args) == CommandReader::Status::need_more);
}

TEST_CASE("Command reader rejects anything but arrays of bulk strings",
          "[resp]") {
  std::vector<std::string> args;

  SECTION("inline command") {
    CommandReader r;
    r.feed("PING\r\n");
    CHECK(r.next(args) == CommandReader::Status::protocol_error);
  }
  SECTION("integer element") {
    CommandReader r;
    r.feed("*2\r\n$3\r\nDEL\r\n:1\r\n");
    CHECK(r.next(args) == CommandReader::Status::protocol_error);
  }
  SECTION("empty array") {
    CommandReader r;
    r.feed("*0\r\n");
    CHECK(r.next(args) == CommandReader::Status::protocol_error);
  }
  SECTION("the stream stays broken") {
    CommandReader r;
    r.feed("+OK\r\n");
    CHECK(r.next(args) == CommandReader::Status::protocol_error);
    r.feed("*1\r\n$4\r\nPING\r\n");
    CHECK(r.next(args) == CommandReader::Status::protocol_error);
  }
}

TEST_CASE("Encoded commands read back into their arguments", "[resp]") {
  const std::vector<std::string> args{"SET", "k", "v\r\nwith crlf", "PX",
                                      "1500"};
  const std::string wire = encode_command(args);
  CHECK(wire.rfind("*5\r\n$3\r\nSET\r\n", 0) == 0);
  CommandReader r;
  r.feed(wire);
  std::vector<std::string> decoded;
  REQUIRE(r.next(decoded) == CommandReader::Status::ready);
  CHECK(decoded == args);
}

TEST_CASE("Server replies are readable by the client parser", "[resp]") {
  RespReplyParser p;
  p.feed(reply::status("OK") + reply::error("ERR boom") + reply::integer(3) +
         reply::bulk("abc") + reply::nil());
  CHECK(p.next_reply()->is_ok());
  auto err = p.next_reply();
  REQUIRE(err);
  CHECK(err->is_error());
  CHECK(err->str == "ERR boom");
  CHECK(p.next_reply()->integer == 3);
  CHECK(p.next_reply()->str == "abc");
  CHECK(p.next_reply()->is_null());
}
