#include "stocknest/JobPool.h"

#include <algorithm>

namespace stocknest {

JobPool::JobPool(int thread_count) {
  thread_count = std::max(1, thread_count);
  workers_.reserve(static_cast<std::size_t>(thread_count));
  for (int i = 0; i < thread_count; ++i) {
    workers_.emplace_back(&JobPool::WorkerLoop, this);
  }
}

JobPool::~JobPool() {
  Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::size_t JobPool::pending() const {
  boost::unique_lock<boost::mutex> lock(mutex_);
  return jobs_.size();
}

void JobPool::Shutdown() {
  {
    boost::unique_lock<boost::mutex> lock(mutex_);
    stopping_ = true;
  }
  condition_.notify_all();
}

void JobPool::Push(std::function<void()> job) {
  {
    boost::unique_lock<boost::mutex> lock(mutex_);
    if (stopping_) {
      throw std::runtime_error("JobPool no longer accepts jobs");
    }
    jobs_.push(std::move(job));
  }
  condition_.notify_one();
}

void JobPool::WorkerLoop() {
  while (true) {
    std::function<void()> job;
    {
      boost::unique_lock<boost::mutex> lock(mutex_);
      condition_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
    }
    job();
  }
}

}  // namespace stocknest
