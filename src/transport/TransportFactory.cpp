#include "device-inspector/transport/TransportFactory.hpp"
#include "device-inspector/transport/SshShellStream.hpp"
#include "device-inspector/transport/TelnetStream.hpp"

#include <libssh/libssh.h>

namespace devinspect {
namespace transport {

// libssh must be initialized before sessions are created from several threads
NetworkTransportFactory::NetworkTransportFactory() { ssh_init(); }

NetworkTransportFactory::~NetworkTransportFactory() { ssh_finalize(); }

std::unique_ptr<ByteStream>
NetworkTransportFactory::open_telnet(const DeviceDescriptor &descriptor) {
  return TelnetStream::connect(descriptor.host, descriptor.port,
                               std::chrono::seconds(descriptor.timeout_seconds));
}

std::unique_ptr<ByteStream>
NetworkTransportFactory::open_ssh_shell(const DeviceDescriptor &descriptor) {
  return SshShellStream::open(descriptor);
}

} // namespace transport
} // namespace devinspect
