#pragma once
#include "device-inspector/Clock.hpp"
#include "device-inspector/Logger.hpp"
#include "device-inspector/session/Session.hpp"
#include "device-inspector/transport/ByteStream.hpp"

#include <memory>

namespace devinspect {
namespace session {

/// Session on a legacy Telnet device after TelnetLoginMachine reached READY.
/// Commands are written raw and output is read up to the ready sentinel.
class RawTelnetSession : public Session {
public:
  static constexpr std::chrono::milliseconds COMMAND_SETTLE{300};
  static constexpr std::chrono::milliseconds READ_TIMEOUT{30000};
  static constexpr std::chrono::milliseconds NAME_SETTLE{500};
  static constexpr std::chrono::milliseconds NAME_TIMEOUT{10000};

  RawTelnetSession(std::unique_ptr<transport::ByteStream> stream,
                   const VendorProfile &profile, std::string host,
                   std::string base_prompt, Clock &clock,
                   InspectionLogger &logger);
  ~RawTelnetSession() override;

  void send_command(const std::string &command) override;

  /// Output up to the prompt line. On READ_TIMEOUT the partial output is
  /// returned and a warning is logged.
  std::string read_until_prompt() override;

  std::string discover_device_name() override;
  void close() override;

  const VendorProfile &profile() const override { return profile_; }
  SessionMode mode() const override { return SessionMode::LEGACY_TELNET; }

  /// Device name from legacy prompt output ("<name>"), empty if absent
  static std::string extract_device_name(const std::string &output);

private:
  bool at_prompt(const std::string &buffer) const;

  std::unique_ptr<transport::ByteStream> stream_;
  const VendorProfile &profile_;
  std::string host_;
  std::string base_prompt_;
  Clock &clock_;
  InspectionLogger &logger_;
};

} // namespace session
} // namespace devinspect
