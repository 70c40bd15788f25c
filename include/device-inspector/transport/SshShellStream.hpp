#pragma once
#include "device-inspector/transport/ByteStream.hpp"
#include "device-inspector/types.hpp"

#include <libssh/libssh.h>
#include <memory>

namespace devinspect {
namespace transport {

/// Interactive shell channel (pty + shell) on an authenticated libssh
/// session
class SshShellStream : public ByteStream {
public:
  /// Connect, authenticate and open the shell channel.
  /// Throws AuthenticationError, TimeoutError or ConnectionFailure.
  static std::unique_ptr<SshShellStream>
  open(const DeviceDescriptor &descriptor);

  ~SshShellStream() override;

  SshShellStream(const SshShellStream &) = delete;
  SshShellStream &operator=(const SshShellStream &) = delete;

  void write(const std::string &data) override;
  std::string read_some(std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return channel_ != nullptr; }

private:
  SshShellStream(ssh_session session, ssh_channel channel);

  ssh_session session_;
  ssh_channel channel_;
};

} // namespace transport
} // namespace devinspect
