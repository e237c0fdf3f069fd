#pragma once

#include "cachify/store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace cachify {

struct MemoryStoreConfig {
  std::size_t max_key_len{512};
  std::size_t max_value_size{8 * 1024 * 1024};
  std::size_t ttl_cleanup_per_tick{128};
};

struct MemoryStoreStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t acquisitions{0};
  std::uint64_t contentions{0};
};

// In-process Store. Expired keys are invisible immediately and physically
// removed by tick(), a bounded number per call.
class MemoryStore : public Store {
public:
  using TimeSource = std::function<TimePoint()>;

  explicit MemoryStore(MemoryStoreConfig cfg = {}, TimeSource now = {});

  std::optional<std::string> get(const std::string &key) override;
  void set(const std::string &key, const std::string &value,
           Duration ttl) override;
  void del(const std::string &key) override;
  bool exists(const std::string &key) override;
  std::optional<Token> try_acquire(const std::string &key,
                                   Duration ttl) override;
  bool release(const std::string &key, const Token &token) override;

  // Remaining ttl; nullopt for a missing key or one without expiry.
  std::optional<Duration> ttl(const std::string &key);

  void tick();
  void clear();

  MemoryStoreStats stats() const;
  std::size_t size() const;
  std::size_t expiration_backlog() const;

private:
  struct Entry {
    std::string value;
    std::optional<TimePoint> deadline;
  };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  void check_key(const std::string &key) const;
  bool live(const std::string &key, TimePoint now);
  void put_locked(const std::string &key, std::string value, Duration ttl,
                  TimePoint now);
  void erase_locked(const std::string &key);
  void tick_locked(TimePoint now);

  MemoryStoreConfig cfg_;
  TimeSource now_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<std::string, std::uint64_t> expiry_generation_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  MemoryStoreStats stats_;
  std::uint64_t seq_{0};
  std::size_t expiration_backlog_{0};
};

} // namespace cachify
