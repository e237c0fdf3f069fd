#pragma once

#include "cachify/resp.hpp"
#include "cachify/store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cachify {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::uint32_t db{0};
  std::string username; // empty = default user
  std::string password; // empty = no AUTH
  Duration connect_timeout{std::chrono::seconds(2)};
  Duration io_timeout{std::chrono::seconds(2)};
  std::size_t max_idle_connections{4};
};

// Accepts redis://[[user]:password@]host[:port][/db].
bool parse_redis_url(const std::string &url, RedisConfig &out,
                     std::string *err = nullptr);

// One blocking TCP connection speaking RESP2.
class RedisConnection {
public:
  explicit RedisConnection(const RedisConfig &cfg);
  ~RedisConnection();

  RedisConnection(const RedisConnection &) = delete;
  RedisConnection &operator=(const RedisConnection &) = delete;

  // Error replies are returned, transport failures throw
  // StoreUnavailableError and leave the connection broken.
  RespReply command(const std::vector<std::string> &args);
  bool broken() const { return fd_ < 0; }
  void close();

private:
  void connect_socket(const RedisConfig &cfg);
  void send_all(const std::string &payload);
  RespReply read_reply();
  [[noreturn]] void fail(const std::string &what);

  int fd_{-1};
  std::string endpoint_;
  RespReplyParser parser_;
};

// Store backed by a Redis server (or anything speaking the same commands).
// Connections are opened lazily and pooled; a connection that failed is
// dropped and the next operation opens a fresh one.
class RedisStore : public Store {
public:
  explicit RedisStore(RedisConfig cfg);
  ~RedisStore() override;

  std::optional<std::string> get(const std::string &key) override;
  void set(const std::string &key, const std::string &value,
           Duration ttl) override;
  void del(const std::string &key) override;
  bool exists(const std::string &key) override;
  std::optional<Token> try_acquire(const std::string &key,
                                   Duration ttl) override;
  bool release(const std::string &key, const Token &token) override;

  bool ping();
  const RedisConfig &config() const { return cfg_; }

private:
  RespReply run(const std::vector<std::string> &args);
  std::unique_ptr<RedisConnection> checkout();
  void checkin(std::unique_ptr<RedisConnection> conn);

  RedisConfig cfg_;
  std::mutex mu_;
  std::vector<std::unique_ptr<RedisConnection>> idle_;
};

// Compare-and-delete used for lock release.
extern const char *const kReleaseScript;

} // namespace cachify
