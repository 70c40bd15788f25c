#include "device-inspector/Clock.hpp"

#include <thread>

namespace devinspect {

void SteadyClock::sleep_for(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

} // namespace devinspect
