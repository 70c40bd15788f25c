#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace devinspect {
namespace inspect {

/// Fixed-size pool of worker threads draining a FIFO task queue.
/// Exceptions thrown by a task are delivered through its future.
class WorkerPool {
public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename F>
  std::future<std::invoke_result_t<F>> submit(F &&task) {
    using R = std::invoke_result_t<F>;
    auto packaged =
        std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
    std::future<R> future = packaged->get_future();
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (!running_)
        throw std::runtime_error("WorkerPool is stopped");
      queue_.emplace_back([packaged]() { (*packaged)(); });
    }
    cv_.notify_one();
    return future;
  }

  /// Finish queued tasks and join the workers. Safe to call multiple times.
  void stop();

  size_t size() const { return workers_.size(); }

private:
  void worker_loop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool running_{true};
  std::vector<std::thread> workers_;
};

} // namespace inspect
} // namespace devinspect
