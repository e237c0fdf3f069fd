#pragma once

#include "cachify/async_store.hpp"
#include "cachify/config.hpp"
#include "cachify/event_loop.hpp"
#include "cachify/listener.hpp"
#include "cachify/store.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cachify {

// Process-lifetime handle the decorators are bound to. Decorators may be
// created before init(); calling one before init() or after teardown()
// throws NotInitializedError.
class Context {
public:
  explicit Context(Config cfg = {});

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  // `async_store` and `loop` are only needed by coroutine decorators.
  void init(std::shared_ptr<Store> store,
            std::shared_ptr<AsyncStore> async_store = nullptr,
            EventLoop *loop = nullptr);
  void teardown();
  bool initialized() const;

  std::shared_ptr<Store> store() const;
  std::shared_ptr<AsyncStore> async_store() const;
  EventLoop &loop() const;

  const Config &config() const { return cfg_; }
  std::string full_key(const std::string &key) const {
    return cfg_.key_prefix + key;
  }

  void add_listener(std::shared_ptr<Listener> listener);

  void notify_hit(const std::string &key) const;
  void notify_miss(const std::string &key) const;
  void notify_store_error(const std::string &key, const std::string &op,
                          const std::string &what) const;
  void notify_lock_acquired(const std::string &key) const;
  void notify_lock_contended(const std::string &key) const;
  void notify_lock_released(const std::string &key, bool released) const;

private:
  std::vector<std::shared_ptr<Listener>> listeners() const;
  // A listener that throws is reported on stderr and does not stop the
  // others or the operation that raised the event.
  template <typename Fn> void each_listener(Fn &&fn) const;

  const Config cfg_;
  mutable std::shared_mutex mu_;
  std::shared_ptr<Store> store_;
  std::shared_ptr<AsyncStore> async_store_;
  EventLoop *loop_{nullptr};
  std::vector<std::shared_ptr<Listener>> listeners_;
};

} // namespace cachify
