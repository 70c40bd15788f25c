#pragma once
#include "device-inspector/Clock.hpp"

#include <mutex>
#include <vector>

namespace devinspect {
namespace test {

/// Clock whose time only moves when sleep_for() is called
class FakeClock : public Clock {
public:
  time_point now() const override {
    std::lock_guard lock(mutex_);
    return start_ + elapsed_;
  }

  void sleep_for(std::chrono::milliseconds duration) override {
    std::lock_guard lock(mutex_);
    elapsed_ += duration;
    sleeps_.push_back(duration);
  }

  void advance(std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    elapsed_ += duration;
  }

  std::vector<std::chrono::milliseconds> sleeps() const {
    std::lock_guard lock(mutex_);
    return sleeps_;
  }

  std::chrono::milliseconds elapsed() const {
    std::lock_guard lock(mutex_);
    return elapsed_;
  }

  time_point start() const { return start_; }

private:
  mutable std::mutex mutex_;
  const time_point start_{std::chrono::hours(1)};
  std::chrono::milliseconds elapsed_{0};
  std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace test
} // namespace devinspect
