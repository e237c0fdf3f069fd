#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cachify {

// Fixed set of threads running blocking store round trips. Jobs must not
// throw; shutdown() drains the queue before joining.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t num_threads = 4);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  // Throws std::runtime_error after shutdown().
  void submit(std::function<void()> job);
  void shutdown();

  std::size_t num_threads() const { return workers_.size(); }

private:
  void worker_loop();

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool running_{true};
  std::vector<std::thread> workers_;
};

} // namespace cachify
