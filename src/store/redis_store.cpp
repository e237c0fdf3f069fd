#include "cachify/redis_store.hpp"

#include "cachify/errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace cachify {

const char *const kReleaseScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) else return 0 end";

namespace {

bool parse_uint(const std::string &s, std::uint64_t max, std::uint64_t &out) {
  if (s.empty())
    return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size() && out <= max;
}

bool percent_decode(const std::string &in, std::string &out) {
  out.clear();
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out.push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size())
      return false;
    unsigned value = 0;
    auto res = std::from_chars(in.data() + i + 1, in.data() + i + 3, value, 16);
    if (res.ec != std::errc() || res.ptr != in.data() + i + 3)
      return false;
    out.push_back(static_cast<char>(value));
    i += 2;
  }
  return true;
}

void set_timeout(int fd, int opt, Duration d) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(d.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((d.count() % 1000) * 1000);
  setsockopt(fd, SOL_SOCKET, opt, &tv, sizeof(tv));
}

std::string ms_arg(Duration d) { return std::to_string(d.count()); }

} // namespace

bool parse_redis_url(const std::string &url, RedisConfig &out,
                     std::string *err) {
  auto fail = [&](const std::string &why) {
    if (err)
      *err = why;
    return false;
  };

  const std::string scheme = "redis://";
  if (url.compare(0, scheme.size(), scheme) != 0)
    return fail("unsupported url scheme, expected redis://");

  RedisConfig cfg = out;
  std::string rest = url.substr(scheme.size());
  if (rest.find('?') != std::string::npos)
    return fail("url query parameters are not supported");

  std::string path;
  if (auto slash = rest.find('/'); slash != std::string::npos) {
    path = rest.substr(slash + 1);
    rest = rest.substr(0, slash);
  }

  if (auto at = rest.rfind('@'); at != std::string::npos) {
    const std::string userinfo = rest.substr(0, at);
    rest = rest.substr(at + 1);
    std::string user = userinfo;
    std::string pass;
    if (auto colon = userinfo.find(':'); colon != std::string::npos) {
      user = userinfo.substr(0, colon);
      pass = userinfo.substr(colon + 1);
    }
    if (!percent_decode(user, cfg.username) ||
        !percent_decode(pass, cfg.password))
      return fail("bad percent-encoding in url credentials");
  }

  std::string host = rest;
  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string::npos)
      return fail("unterminated IPv6 address");
    host = rest.substr(1, close - 1);
    const std::string tail = rest.substr(close + 1);
    if (!tail.empty()) {
      std::uint64_t port = 0;
      if (tail.front() != ':' || !parse_uint(tail.substr(1), 65535, port) ||
          port == 0)
        return fail("invalid port");
      cfg.port = static_cast<std::uint16_t>(port);
    }
  } else if (auto colon = rest.rfind(':'); colon != std::string::npos) {
    host = rest.substr(0, colon);
    std::uint64_t port = 0;
    if (!parse_uint(rest.substr(colon + 1), 65535, port) || port == 0)
      return fail("invalid port");
    cfg.port = static_cast<std::uint16_t>(port);
  }
  if (host.empty())
    return fail("missing host");
  cfg.host = host;

  if (!path.empty()) {
    std::uint64_t db = 0;
    if (!parse_uint(path, 1u << 16, db))
      return fail("invalid database number '" + path + "'");
    cfg.db = static_cast<std::uint32_t>(db);
  }

  out = std::move(cfg);
  return true;
}

RedisConnection::RedisConnection(const RedisConfig &cfg)
    : endpoint_(cfg.host + ":" + std::to_string(cfg.port)) {
  connect_socket(cfg);
  set_timeout(fd_, SO_RCVTIMEO, cfg.io_timeout);
  set_timeout(fd_, SO_SNDTIMEO, cfg.io_timeout);

  if (!cfg.password.empty()) {
    std::vector<std::string> auth{"AUTH"};
    if (!cfg.username.empty())
      auth.push_back(cfg.username);
    auth.push_back(cfg.password);
    auto r = command(auth);
    if (r.is_error())
      fail("AUTH rejected: " + r.str);
  }
  if (cfg.db > 0) {
    auto r = command({"SELECT", std::to_string(cfg.db)});
    if (r.is_error())
      fail("SELECT rejected: " + r.str);
  }
}

RedisConnection::~RedisConnection() { close(); }

void RedisConnection::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void RedisConnection::fail(const std::string &what) {
  close();
  throw StoreUnavailableError("redis " + endpoint_ + ": " + what);
}

void RedisConnection::connect_socket(const RedisConfig &cfg) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  addrinfo *res = nullptr;
  const std::string port = std::to_string(cfg.port);
  const int rc = getaddrinfo(cfg.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0 || !res)
    fail(std::string("resolve failed: ") + gai_strerror(rc));

  std::string last_error = "no addresses";
  for (auto *rp = res; rp; rp = rp->ai_next) {
    int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    const int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int r = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (r != 0 && errno == EINPROGRESS) {
      pollfd p{fd, POLLOUT, 0};
      r = ::poll(&p, 1, static_cast<int>(cfg.connect_timeout.count()));
      if (r == 1) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        r = so_error == 0 ? 0 : -1;
        if (so_error != 0)
          last_error = std::strerror(so_error);
      } else {
        last_error = r == 0 ? "connect timed out" : std::strerror(errno);
        r = -1;
      }
    } else if (r != 0) {
      last_error = std::strerror(errno);
    }
    if (r == 0) {
      fcntl(fd, F_SETFL, flags);
      int one = 1;
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      fd_ = fd;
      break;
    }
    ::close(fd);
  }
  freeaddrinfo(res);
  if (fd_ < 0)
    fail("connect failed: " + last_error);
}

void RedisConnection::send_all(const std::string &payload) {
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const auto n = ::send(fd_, payload.data() + sent, payload.size() - sent,
                          MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      fail(std::string("send failed: ") +
           (n == 0 ? "connection closed" : std::strerror(errno)));
    sent += static_cast<std::size_t>(n);
  }
}

RespReply RedisConnection::read_reply() {
  char buf[16 * 1024];
  while (true) {
    if (auto reply = parser_.next_reply())
      return std::move(*reply);
    if (parser_.malformed())
      fail("malformed reply");
    const auto n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR)
      continue;
    if (n == 0)
      fail("connection closed by peer");
    if (n < 0)
      fail(errno == EAGAIN || errno == EWOULDBLOCK
               ? std::string("read timed out")
               : std::string("recv failed: ") + std::strerror(errno));
    parser_.feed(buf, static_cast<std::size_t>(n));
  }
}

RespReply RedisConnection::command(const std::vector<std::string> &args) {
  if (fd_ < 0)
    fail("connection is closed");
  send_all(encode_command(args));
  return read_reply();
}

RedisStore::RedisStore(RedisConfig cfg) : cfg_(std::move(cfg)) {}

RedisStore::~RedisStore() = default;

std::unique_ptr<RedisConnection> RedisStore::checkout() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return conn;
    }
  }
  return std::make_unique<RedisConnection>(cfg_);
}

void RedisStore::checkin(std::unique_ptr<RedisConnection> conn) {
  if (conn->broken())
    return;
  std::lock_guard<std::mutex> lk(mu_);
  if (idle_.size() < cfg_.max_idle_connections)
    idle_.push_back(std::move(conn));
}

RespReply RedisStore::run(const std::vector<std::string> &args) {
  auto conn = checkout();
  RespReply reply = conn->command(args);
  checkin(std::move(conn));
  if (reply.is_error())
    throw StoreUnavailableError("redis " + args.front() + " failed: " +
                                reply.str);
  return reply;
}

std::optional<std::string> RedisStore::get(const std::string &key) {
  auto r = run({"GET", key});
  if (r.is_null())
    return std::nullopt;
  if (r.type != RespReply::Type::bulk)
    throw StoreUnavailableError("redis GET: unexpected reply type");
  return std::move(r.str);
}

void RedisStore::set(const std::string &key, const std::string &value,
                     Duration ttl) {
  std::vector<std::string> args{"SET", key, value};
  if (ttl.count() > 0) {
    args.emplace_back("PX");
    args.push_back(ms_arg(ttl));
  }
  auto r = run(args);
  if (!r.is_ok())
    throw StoreUnavailableError("redis SET: unexpected reply");
}

void RedisStore::del(const std::string &key) { run({"DEL", key}); }

bool RedisStore::exists(const std::string &key) {
  auto r = run({"EXISTS", key});
  if (r.type != RespReply::Type::integer)
    throw StoreUnavailableError("redis EXISTS: unexpected reply type");
  return r.integer > 0;
}

std::optional<Token> RedisStore::try_acquire(const std::string &key,
                                             Duration ttl) {
  Token token = make_token();
  std::vector<std::string> args{"SET", key, token, "NX"};
  if (ttl.count() > 0) {
    args.emplace_back("PX");
    args.push_back(ms_arg(ttl));
  }
  auto r = run(args);
  if (r.is_null())
    return std::nullopt;
  if (!r.is_ok())
    throw StoreUnavailableError("redis SET NX: unexpected reply");
  return token;
}

bool RedisStore::release(const std::string &key, const Token &token) {
  auto r = run({"EVAL", kReleaseScript, "1", key, token});
  if (r.type != RespReply::Type::integer)
    throw StoreUnavailableError("redis EVAL: unexpected reply type");
  return r.integer == 1;
}

bool RedisStore::ping() {
  auto r = run({"PING"});
  return r.type == RespReply::Type::simple && r.str == "PONG";
}

} // namespace cachify
