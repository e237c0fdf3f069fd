#pragma once

#include <chrono>
#include <string>

namespace cachify {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using Token = std::string;

enum class CacheStoreErrorPolicy {
  call_through, // store failure is a miss, a failed write is dropped
  propagate,
};

enum class LockStoreErrorPolicy {
  propagate,
  contended, // apply the contention policy as if another holder had the lock
};

} // namespace cachify
