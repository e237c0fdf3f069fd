#pragma once

#include "cachify/types.hpp"

#include <chrono>
#include <string>

namespace cachify {

struct Config {
  std::string key_prefix{"cachify:"};
  Duration default_cache_ttl{0}; // 0 = no expiry
  Duration default_lock_ttl{std::chrono::seconds(30)};
  CacheStoreErrorPolicy cache_on_store_error{
      CacheStoreErrorPolicy::call_through};
  LockStoreErrorPolicy lock_on_store_error{LockStoreErrorPolicy::propagate};
  std::string redis_url{"redis://127.0.0.1:6379/0"};
};

// Reads a flat JSON object. Missing keys keep the values already in `cfg`;
// on any error `cfg` is left untouched.
bool load_config(const std::string &path, Config &cfg,
                 std::string *err = nullptr);

const char *policy_name(CacheStoreErrorPolicy p);
const char *policy_name(LockStoreErrorPolicy p);
bool parse_policy(const std::string &name, CacheStoreErrorPolicy &out);
bool parse_policy(const std::string &name, LockStoreErrorPolicy &out);

} // namespace cachify
