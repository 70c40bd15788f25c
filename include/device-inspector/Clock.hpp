#pragma once

#include <chrono>

namespace devinspect {

/// Time source and settling sleeps, injected so retry spacing and settling
/// delays can be driven by a fake clock in tests.
class Clock {
public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SteadyClock : public Clock {
public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
  void sleep_for(std::chrono::milliseconds duration) override;
};

} // namespace devinspect
