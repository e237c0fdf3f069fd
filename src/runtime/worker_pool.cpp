#include "cachify/worker_pool.hpp"

#include <stdexcept>
#include <utility>

namespace cachify {

WorkerPool::WorkerPool(std::size_t num_threads) {
  if (num_threads == 0)
    num_threads = 1;
  workers_.reserve(num_threads);
  for (std::size_t i = 0; i < num_threads; ++i)
    workers_.emplace_back(&WorkerPool::worker_loop, this);
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_)
      throw std::runtime_error("WorkerPool is shut down");
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
}

void WorkerPool::worker_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return !running_ || !jobs_.empty(); });
      if (jobs_.empty())
        return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
  }
}

} // namespace cachify
