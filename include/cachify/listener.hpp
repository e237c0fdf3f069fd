#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace cachify {

// Observer of decorator outcomes. Callbacks may arrive from any thread,
// including worker threads finishing a release.
class Listener {
public:
  virtual ~Listener() = default;

  virtual void on_hit(const std::string &) {}
  virtual void on_miss(const std::string &) {}
  // `op` names the store operation that failed ("get", "set", ...).
  virtual void on_store_error(const std::string &, const std::string &,
                              const std::string &) {}
  virtual void on_lock_acquired(const std::string &) {}
  virtual void on_lock_contended(const std::string &) {}
  // released == false: the lock had already expired or changed hands.
  virtual void on_lock_released(const std::string &, bool) {}
};

// One line per event.
class LoggingListener : public Listener {
public:
  explicit LoggingListener(std::string prefix = "cachify",
                           std::ostream &os = std::cerr)
      : prefix_(std::move(prefix)), os_(os) {}

  void on_hit(const std::string &key) override { line("HIT " + key); }
  void on_miss(const std::string &key) override { line("MISS " + key); }
  void on_store_error(const std::string &key, const std::string &op,
                      const std::string &what) override {
    line("STORE_ERROR " + op + " " + key + ": " + what);
  }
  void on_lock_acquired(const std::string &key) override {
    line("LOCK " + key);
  }
  void on_lock_contended(const std::string &key) override {
    line("CONTENDED " + key);
  }
  void on_lock_released(const std::string &key, bool released) override {
    line((released ? "UNLOCK " : "UNLOCK_LOST ") + key);
  }

private:
  void line(const std::string &msg) {
    std::lock_guard<std::mutex> lk(mu_);
    os_ << "[" << prefix_ << "] " << msg << "\n";
  }

  std::string prefix_;
  std::ostream &os_;
  std::mutex mu_;
};

class StatsListener : public Listener {
public:
  void on_hit(const std::string &) override { ++hits_; }
  void on_miss(const std::string &) override { ++misses_; }
  void on_store_error(const std::string &, const std::string &,
                      const std::string &) override {
    ++store_errors_;
  }
  void on_lock_acquired(const std::string &) override { ++acquired_; }
  void on_lock_contended(const std::string &) override { ++contended_; }
  void on_lock_released(const std::string &, bool released) override {
    if (released)
      ++released_;
    else
      ++lost_;
  }

  std::uint64_t hits() const { return hits_; }
  std::uint64_t misses() const { return misses_; }
  std::uint64_t store_errors() const { return store_errors_; }
  std::uint64_t locks_acquired() const { return acquired_; }
  std::uint64_t locks_contended() const { return contended_; }
  std::uint64_t locks_released() const { return released_; }
  std::uint64_t locks_lost() const { return lost_; }

  double hit_rate() const {
    const auto total = hits_ + misses_;
    return total == 0 ? 0.0 : static_cast<double>(hits_) / total;
  }

private:
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> store_errors_{0};
  std::atomic<std::uint64_t> acquired_{0};
  std::atomic<std::uint64_t> contended_{0};
  std::atomic<std::uint64_t> released_{0};
  std::atomic<std::uint64_t> lost_{0};
};

} // namespace cachify
