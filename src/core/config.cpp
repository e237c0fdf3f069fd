#include "cachify/config.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

namespace cachify {
namespace {

// Returns 1 if found, 0 if absent, -1 if present with the wrong shape.
int extract_u64(const std::string &text, const std::string &key,
                std::uint64_t &out) {
  std::regex present("\"" + key + "\"\\s*:");
  if (!std::regex_search(text, present))
    return 0;
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)\\s*[,}]");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return -1;
  const std::string digits = m[1].str();
  auto res =
      std::from_chars(digits.data(), digits.data() + digits.size(), out);
  return res.ec == std::errc() ? 1 : -1;
}

int extract_string(const std::string &text, const std::string &key,
                   std::string &out) {
  std::regex present("\"" + key + "\"\\s*:");
  if (!std::regex_search(text, present))
    return 0;
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return -1;
  out = m[1].str();
  return 1;
}

} // namespace

const char *policy_name(CacheStoreErrorPolicy p) {
  return p == CacheStoreErrorPolicy::call_through ? "call_through"
                                                  : "propagate";
}

const char *policy_name(LockStoreErrorPolicy p) {
  return p == LockStoreErrorPolicy::propagate ? "propagate" : "contended";
}

bool parse_policy(const std::string &name, CacheStoreErrorPolicy &out) {
  if (name == "call_through")
    out = CacheStoreErrorPolicy::call_through;
  else if (name == "propagate")
    out = CacheStoreErrorPolicy::propagate;
  else
    return false;
  return true;
}

bool parse_policy(const std::string &name, LockStoreErrorPolicy &out) {
  if (name == "propagate")
    out = LockStoreErrorPolicy::propagate;
  else if (name == "contended")
    out = LockStoreErrorPolicy::contended;
  else
    return false;
  return true;
}

bool load_config(const std::string &path, Config &cfg, std::string *err) {
  auto fail = [&](const std::string &why) {
    if (err)
      *err = why;
    return false;
  };

  std::ifstream in(path);
  if (!in.is_open())
    return fail("config file not found: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos)
    return fail("invalid schema: expected a JSON object");

  Config next = cfg;
  std::uint64_t u = 0;
  std::string s;

  switch (extract_string(text, "key_prefix", s)) {
  case 1:
    next.key_prefix = s;
    break;
  case -1:
    return fail("key_prefix must be a string");
  }

  switch (extract_u64(text, "default_cache_ttl_ms", u)) {
  case 1:
    next.default_cache_ttl = Duration(static_cast<Duration::rep>(u));
    break;
  case -1:
    return fail("default_cache_ttl_ms must be a non-negative integer");
  }

  switch (extract_u64(text, "default_lock_ttl_ms", u)) {
  case 1:
    if (u == 0)
      return fail("default_lock_ttl_ms must be positive");
    next.default_lock_ttl = Duration(static_cast<Duration::rep>(u));
    break;
  case -1:
    return fail("default_lock_ttl_ms must be a positive integer");
  }

  switch (extract_string(text, "cache_on_store_error", s)) {
  case 1:
    if (!parse_policy(s, next.cache_on_store_error))
      return fail("unknown cache_on_store_error '" + s + "'");
    break;
  case -1:
    return fail("cache_on_store_error must be a string");
  }

  switch (extract_string(text, "lock_on_store_error", s)) {
  case 1:
    if (!parse_policy(s, next.lock_on_store_error))
      return fail("unknown lock_on_store_error '" + s + "'");
    break;
  case -1:
    return fail("lock_on_store_error must be a string");
  }

  switch (extract_string(text, "redis_url", s)) {
  case 1:
    next.redis_url = s;
    break;
  case -1:
    return fail("redis_url must be a string");
  }

  cfg = std::move(next);
  return true;
}

} // namespace cachify
