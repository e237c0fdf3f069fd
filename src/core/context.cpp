#include "cachify/context.hpp"

#include "cachify/errors.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace cachify {

Context::Context(Config cfg) : cfg_(std::move(cfg)) {}

void Context::init(std::shared_ptr<Store> store,
                   std::shared_ptr<AsyncStore> async_store, EventLoop *loop) {
  if (!store)
    throw std::invalid_argument("Context::init needs a store");
  std::unique_lock<std::shared_mutex> lk(mu_);
  store_ = std::move(store);
  async_store_ = std::move(async_store);
  loop_ = loop;
}

void Context::teardown() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  store_.reset();
  async_store_.reset();
  loop_ = nullptr;
}

bool Context::initialized() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return store_ != nullptr;
}

std::shared_ptr<Store> Context::store() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!store_)
    throw NotInitializedError("store used before Context::init()");
  return store_;
}

std::shared_ptr<AsyncStore> Context::async_store() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!store_)
    throw NotInitializedError("store used before Context::init()");
  if (!async_store_)
    throw NotInitializedError("Context was initialized without an async store");
  return async_store_;
}

EventLoop &Context::loop() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!loop_)
    throw NotInitializedError("Context was initialized without an event loop");
  return *loop_;
}

void Context::add_listener(std::shared_ptr<Listener> listener) {
  if (!listener)
    return;
  std::unique_lock<std::shared_mutex> lk(mu_);
  listeners_.push_back(std::move(listener));
}

std::vector<std::shared_ptr<Listener>> Context::listeners() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return listeners_;
}

template <typename Fn> void Context::each_listener(Fn &&fn) const {
  for (const auto &l : listeners()) {
    try {
      fn(*l);
    } catch (const std::exception &e) {
      std::cerr << "[cachify] listener error: " << e.what() << std::endl;
    }
  }
}

void Context::notify_hit(const std::string &key) const {
  each_listener([&](Listener &l) { l.on_hit(key); });
}

void Context::notify_miss(const std::string &key) const {
  each_listener([&](Listener &l) { l.on_miss(key); });
}

void Context::notify_store_error(const std::string &key, const std::string &op,
                                 const std::string &what) const {
  each_listener([&](Listener &l) { l.on_store_error(key, op, what); });
}

void Context::notify_lock_acquired(const std::string &key) const {
  each_listener([&](Listener &l) { l.on_lock_acquired(key); });
}

void Context::notify_lock_contended(const std::string &key) const {
  each_listener([&](Listener &l) { l.on_lock_contended(key); });
}

void Context::notify_lock_released(const std::string &key,
                                   bool released) const {
  each_listener([&](Listener &l) { l.on_lock_released(key, released); });
}

} // namespace cachify
