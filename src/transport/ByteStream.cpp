#include "device-inspector/transport/ByteStream.hpp"

namespace devinspect {
namespace transport {

ReadResult read_until(ByteStream &stream, const Clock &clock,
                      std::chrono::milliseconds timeout,
                      const std::function<bool(const std::string &)> &done) {
  ReadResult result;
  auto deadline = clock.now() + timeout;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock.now());
    if (remaining.count() <= 0)
      break;
    std::string chunk = stream.read_some(remaining);
    if (chunk.empty())
      break;
    result.data += chunk;
    if (done(result.data)) {
      result.matched = true;
      break;
    }
  }
  return result;
}

ReadResult read_until(ByteStream &stream, const Clock &clock,
                      std::chrono::milliseconds timeout,
                      const std::string &needle) {
  return read_until(stream, clock, timeout, [&needle](const std::string &buf) {
    return buf.find(needle) != std::string::npos;
  });
}

std::string drain(ByteStream &stream, std::chrono::milliseconds quiet) {
  std::string out;
  while (true) {
    std::string chunk = stream.read_some(quiet);
    if (chunk.empty())
      break;
    out += chunk;
  }
  return out;
}

} // namespace transport
} // namespace devinspect
