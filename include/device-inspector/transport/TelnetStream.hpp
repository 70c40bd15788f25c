#pragma once
#include "device-inspector/transport/ByteStream.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace devinspect {
namespace transport {

/// Telnet client stream over a TCP socket. Option negotiation is refused
/// (DO/DONT are answered with WONT, WILL/WONT with DONT), subnegotiation is
/// skipped and only data bytes reach the caller.
class TelnetStream : public ByteStream {
public:
  /// Connect with a bounded wait. Throws TimeoutError or ConnectionFailure.
  static std::unique_ptr<TelnetStream>
  connect(const std::string &host, int port,
          std::chrono::milliseconds timeout);

  /// Adopt an already connected socket
  explicit TelnetStream(int fd);
  ~TelnetStream() override;

  TelnetStream(const TelnetStream &) = delete;
  TelnetStream &operator=(const TelnetStream &) = delete;

  void write(const std::string &data) override;
  std::string read_some(std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  /// Strip Telnet commands from raw socket bytes, queueing negotiation
  /// replies. Partial commands carry over to the next call.
  std::string filter(const std::string &raw);

  /// Negotiation replies produced by filter() and not yet sent
  const std::string &pending_replies() const { return replies_; }

private:
  enum class IacState { DATA, IAC, OPTION, SUB, SUB_IAC };

  void send_all(const std::string &bytes);
  void flush_replies();

  int fd_;
  IacState state_{IacState::DATA};
  uint8_t verb_{0};
  std::string replies_;
};

} // namespace transport
} // namespace devinspect
