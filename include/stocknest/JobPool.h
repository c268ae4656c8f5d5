#pragma once

#include <boost/thread.hpp>
#include <boost/thread/future.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <queue>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace stocknest {

// Fixed set of worker threads draining a FIFO of nesting jobs.
class JobPool {
 public:
  explicit JobPool(int thread_count = 1);
  ~JobPool();

  JobPool(const JobPool&) = delete;
  JobPool& operator=(const JobPool&) = delete;

  template <typename Function>
  auto Submit(Function&& job)
      -> boost::future<std::invoke_result_t<Function>>;

  int thread_count() const { return static_cast<int>(workers_.size()); }
  std::size_t pending() const;

  // Stops accepting jobs. Jobs already queued still run, so every future
  // handed out before the call becomes ready; the destructor then joins.
  void Shutdown();

 private:
  void Push(std::function<void()> job);
  void WorkerLoop();

  mutable boost::mutex mutex_;
  boost::condition_variable condition_;
  bool stopping_ {false};
  std::queue<std::function<void()>> jobs_;
  std::vector<boost::thread> workers_;
};

template <typename Function>
auto JobPool::Submit(Function&& job)
    -> boost::future<std::invoke_result_t<Function>> {
  using ResultType = std::invoke_result_t<Function>;

  auto task = std::make_shared<boost::packaged_task<ResultType()>>(
      std::forward<Function>(job));
  boost::future<ResultType> future = task->get_future();
  Push([task]() { (*task)(); });
  return future;
}

}  // namespace stocknest
