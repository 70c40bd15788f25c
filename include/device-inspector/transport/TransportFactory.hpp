#pragma once
#include "device-inspector/transport/ByteStream.hpp"
#include "device-inspector/types.hpp"

#include <memory>

namespace devinspect {
namespace transport {

/// Opens device byte streams. Called concurrently from worker threads.
class TransportFactory {
public:
  virtual ~TransportFactory() = default;

  /// Raw Telnet stream, not yet logged in
  virtual std::unique_ptr<ByteStream>
  open_telnet(const DeviceDescriptor &descriptor) = 0;

  /// Authenticated SSH shell stream
  virtual std::unique_ptr<ByteStream>
  open_ssh_shell(const DeviceDescriptor &descriptor) = 0;
};

/// Real network transports: TelnetStream and SshShellStream
class NetworkTransportFactory : public TransportFactory {
public:
  NetworkTransportFactory();
  ~NetworkTransportFactory() override;

  std::unique_ptr<ByteStream>
  open_telnet(const DeviceDescriptor &descriptor) override;
  std::unique_ptr<ByteStream>
  open_ssh_shell(const DeviceDescriptor &descriptor) override;
};

} // namespace transport
} // namespace devinspect
