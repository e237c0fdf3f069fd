#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cachify {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Template and call arguments do not fit together. Always a caller bug.
class KeyResolutionError : public Error {
public:
  using Error::Error;
};

// The store could not be reached or answered with an error reply.
class StoreUnavailableError : public Error {
public:
  using Error::Error;
};

class LockContentionError : public Error {
public:
  explicit LockContentionError(std::string key)
      : Error("lock is held: " + key), key_(std::move(key)) {}
  const std::string &key() const { return key_; }

private:
  std::string key_;
};

// A decorator ran before Context::init() or after Context::teardown().
class NotInitializedError : public Error {
public:
  using Error::Error;
};

} // namespace cachify
