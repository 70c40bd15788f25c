#include "device-inspector/inspect/WorkerPool.hpp"

namespace devinspect {
namespace inspect {

WorkerPool::WorkerPool(size_t threads) {
  if (threads == 0)
    threads = 1;
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&WorkerPool::worker_loop, this);
  }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!running_)
      return;
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
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      cv_.wait(lk, [this]() { return !queue_.empty() || !running_; });
      if (!running_ && queue_.empty())
        break;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    // packaged_task stores any exception in the future
    task();
  }
}

} // namespace inspect
} // namespace devinspect
