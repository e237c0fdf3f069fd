#include "cachify/memory_store.hpp"

#include "cachify/errors.hpp"

#include <stdexcept>
#include <utility>

namespace cachify {

MemoryStore::MemoryStore(MemoryStoreConfig cfg, TimeSource now)
    : cfg_(std::move(cfg)), now_(std::move(now)) {
  if (!now_)
    now_ = [] { return Clock::now(); };
}

void MemoryStore::check_key(const std::string &key) const {
  if (key.empty() || key.size() > cfg_.max_key_len)
    throw std::invalid_argument("invalid key length: " +
                                std::to_string(key.size()));
}

bool MemoryStore::live(const std::string &key, TimePoint now) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  if (it->second.deadline.has_value() && *it->second.deadline <= now) {
    erase_locked(key);
    ++stats_.expirations;
    return false;
  }
  return true;
}

void MemoryStore::put_locked(const std::string &key, std::string value,
                             Duration ttl, TimePoint now) {
  Entry e;
  e.value = std::move(value);
  if (ttl.count() > 0)
    e.deadline = now + ttl;
  entries_[key] = std::move(e);

  const auto gen = ++seq_;
  expiry_generation_[key] = gen;
  if (entries_[key].deadline.has_value())
    expiry_heap_.push({*entries_[key].deadline, key, gen});
}

void MemoryStore::erase_locked(const std::string &key) {
  entries_.erase(key);
  // Heap nodes pushed for the erased value no longer match any generation.
  expiry_generation_.erase(key);
}

void MemoryStore::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const auto &top = expiry_heap_.top();
    if (top.deadline > now)
      break;
    auto node = top;
    expiry_heap_.pop();
    auto gen_it = expiry_generation_.find(node.key);
    if (gen_it == expiry_generation_.end() || gen_it->second != node.generation)
      continue;
    if (entries_.contains(node.key)) {
      entries_.erase(node.key);
      ++stats_.expirations;
    }
    expiry_generation_.erase(gen_it);
    ++cleaned;
  }
  expiration_backlog_ = expiry_heap_.size();
}

std::optional<std::string> MemoryStore::get(const std::string &key) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  tick_locked(now);
  if (!live(key, now)) {
    ++stats_.misses;
    return std::nullopt;
  }
  ++stats_.hits;
  return entries_[key].value;
}

void MemoryStore::set(const std::string &key, const std::string &value,
                      Duration ttl) {
  check_key(key);
  if (value.size() > cfg_.max_value_size)
    throw StoreUnavailableError("value too large: " +
                                std::to_string(value.size()) + " bytes");
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  tick_locked(now);
  put_locked(key, value, ttl, now);
}

void MemoryStore::del(const std::string &key) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  tick_locked(now_());
  if (entries_.contains(key))
    erase_locked(key);
}

bool MemoryStore::exists(const std::string &key) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  tick_locked(now);
  return live(key, now);
}

std::optional<Token> MemoryStore::try_acquire(const std::string &key,
                                              Duration ttl) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  tick_locked(now);
  if (live(key, now)) {
    ++stats_.contentions;
    return std::nullopt;
  }
  Token token = make_token();
  put_locked(key, token, ttl, now);
  ++stats_.acquisitions;
  return token;
}

bool MemoryStore::release(const std::string &key, const Token &token) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  tick_locked(now);
  if (!live(key, now) || entries_[key].value != token)
    return false;
  erase_locked(key);
  return true;
}

std::optional<Duration> MemoryStore::ttl(const std::string &key) {
  check_key(key);
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = now_();
  if (!live(key, now) || !entries_[key].deadline.has_value())
    return std::nullopt;
  return std::chrono::duration_cast<Duration>(*entries_[key].deadline - now);
}

void MemoryStore::tick() {
  std::lock_guard<std::mutex> lk(mu_);
  tick_locked(now_());
}

void MemoryStore::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
  expiry_generation_.clear();
  expiry_heap_ = {};
  expiration_backlog_ = 0;
}

MemoryStoreStats MemoryStore::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

std::size_t MemoryStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

std::size_t MemoryStore::expiration_backlog() const {
  std::lock_guard<std::mutex> lk(mu_);
  return expiration_backlog_;
}

} // namespace cachify
