#pragma once
#include "device-inspector/Clock.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace devinspect {
namespace transport {

/// Bidirectional byte stream to a device shell.
/// Implementations throw StreamClosedError when the peer closes the stream
/// or an I/O error occurs.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  /// Write all bytes
  virtual void write(const std::string &data) = 0;

  /// Block up to `timeout` for data. An empty result means the timeout
  /// elapsed without any data.
  virtual std::string read_some(std::chrono::milliseconds timeout) = 0;

  /// Release the underlying connection. Safe to call more than once.
  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

struct ReadResult {
  std::string data;
  bool matched{false};
};

/// Read until `done(accumulated)` holds or `timeout` elapses.
ReadResult read_until(ByteStream &stream, const Clock &clock,
                      std::chrono::milliseconds timeout,
                      const std::function<bool(const std::string &)> &done);

/// Read until `needle` appears in the accumulated output
ReadResult read_until(ByteStream &stream, const Clock &clock,
                      std::chrono::milliseconds timeout,
                      const std::string &needle);

/// Read and return whatever arrives until the stream stays quiet for
/// `quiet`.
std::string drain(ByteStream &stream, std::chrono::milliseconds quiet);

} // namespace transport
} // namespace devinspect
