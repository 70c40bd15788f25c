#pragma once
#include "device-inspector/VendorRegistry.hpp"

#include <chrono>
#include <string>

namespace devinspect {
namespace session {

/// Authenticated device shell. Owned by exactly one inspection task.
///
/// Methods throw CommandError on send/read failures. close() never throws
/// and may be called more than once.
class Session {
public:
  virtual ~Session() = default;

  virtual void send_command(const std::string &command) = 0;

  /// Read the output of the last command up to the next device prompt
  virtual std::string read_until_prompt() = 0;

  /// Best-effort device host name, "unknown device" if it cannot be found
  virtual std::string discover_device_name() = 0;

  virtual void close() = 0;

  virtual const VendorProfile &profile() const = 0;
  virtual SessionMode mode() const = 0;
};

} // namespace session
} // namespace devinspect
