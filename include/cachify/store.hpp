#pragma once

#include "cachify/types.hpp"

#include <optional>
#include <string>

namespace cachify {

// Blocking client of a shared key-value store. A miss or a contended lock is
// an ordinary return value; every backend failure is a
// StoreUnavailableError.
class Store {
public:
  virtual ~Store() = default;

  virtual std::optional<std::string> get(const std::string &key) = 0;
  // A zero ttl stores the value without expiry.
  virtual void set(const std::string &key, const std::string &value,
                   Duration ttl) = 0;
  virtual void del(const std::string &key) = 0;
  virtual bool exists(const std::string &key) = 0;

  // Atomic set-if-absent with expiry. Returns the holder token, or nullopt
  // if another holder has the key.
  virtual std::optional<Token> try_acquire(const std::string &key,
                                           Duration ttl) = 0;
  // Deletes the key only while it still carries `token`.
  virtual bool release(const std::string &key, const Token &token) = 0;
};

// Random 128-bit hex token identifying one lock holder.
Token make_token();

} // namespace cachify
