#include "device-inspector/session/SessionConnector.hpp"
#include "device-inspector/errors.hpp"
#include "device-inspector/session/ManagedSession.hpp"
#include "device-inspector/session/RawTelnetSession.hpp"
#include "device-inspector/session/TelnetLoginMachine.hpp"

namespace devinspect {
namespace session {

const char *to_string(ConnectionErrorKind kind) {
  switch (kind) {
  case ConnectionErrorKind::AUTHENTICATION:
    return "authentication";
  case ConnectionErrorKind::TIMEOUT:
    return "timeout";
  case ConnectionErrorKind::GENERIC:
    return "generic";
  }
  return "generic";
}

SessionConnector::SessionConnector(const VendorRegistry &registry,
                                   transport::TransportFactory &transports,
                                   Clock &clock, InspectionLogger &logger,
                                   RetryPolicy policy)
    : registry_(registry), transports_(transports), clock_(clock),
      logger_(logger), policy_(policy) {}

ConnectResult SessionConnector::connect(const DeviceDescriptor &descriptor) {
  const std::string &host = descriptor.host;
  const VendorProfile *profile = registry_.find(descriptor.vendor_profile);
  if (!profile) {
    INSPECT_LOG_ERROR(logger_, host, "CONNECT", "Unknown vendor profile '{}'",
                      descriptor.vendor_profile);
    return ConnectionError{ConnectionErrorKind::GENERIC,
                           "Unknown vendor profile: " +
                               descriptor.vendor_profile,
                           0};
  }

  ConnectionError last;
  for (int attempt_no = 1; attempt_no <= policy_.max_attempts; ++attempt_no) {
    INSPECT_LOG_INFO(logger_, host, "CONNECT",
                     "Connecting as {} on port {} (attempt {}/{})",
                     profile->device_type(descriptor.login_protocol),
                     descriptor.port, attempt_no, policy_.max_attempts);
    try {
      auto session = attempt(descriptor, *profile);
      INSPECT_LOG_INFO(logger_, host, "CONNECT", "Connected");
      return ConnectResult(std::move(session));
    } catch (const AuthenticationError &e) {
      last = {ConnectionErrorKind::AUTHENTICATION, e.what(), attempt_no};
      INSPECT_LOG_ERROR(logger_, host, "CONNECT",
                        "Authentication failed: {} (attempt {})", e.what(),
                        attempt_no);
    } catch (const TimeoutError &e) {
      last = {ConnectionErrorKind::TIMEOUT, e.what(), attempt_no};
      INSPECT_LOG_ERROR(logger_, host, "CONNECT",
                        "Connection timed out: {} (attempt {})", e.what(),
                        attempt_no);
    } catch (const std::exception &e) {
      last = {ConnectionErrorKind::GENERIC, e.what(), attempt_no};
      INSPECT_LOG_ERROR(logger_, host, "CONNECT",
                        "Connection failed: {} (attempt {})", e.what(),
                        attempt_no);
    }

    if (attempt_no < policy_.max_attempts) {
      clock_.sleep_for(policy_.interval);
    }
  }

  INSPECT_LOG_ERROR(logger_, host, "CONNECT",
                    "Giving up after {} attempts", policy_.max_attempts);
  return ConnectResult(std::move(last));
}

std::unique_ptr<Session>
SessionConnector::attempt(const DeviceDescriptor &descriptor,
                          const VendorProfile &profile) {
  if (profile.session_mode(descriptor.login_protocol) ==
      SessionMode::LEGACY_TELNET) {
    return open_legacy(descriptor, profile);
  }
  return open_managed(descriptor, profile);
}

std::unique_ptr<Session>
SessionConnector::open_legacy(const DeviceDescriptor &descriptor,
                              const VendorProfile &profile) {
  auto stream = transports_.open_telnet(descriptor);

  TelnetLoginMachine machine(*stream, profile, clock_, logger_);
  machine.run(descriptor);

  return std::make_unique<RawTelnetSession>(std::move(stream), profile,
                                            descriptor.host,
                                            machine.base_prompt(), clock_,
                                            logger_);
}

std::unique_ptr<Session>
SessionConnector::open_managed(const DeviceDescriptor &descriptor,
                               const VendorProfile &profile) {
  auto stream = descriptor.login_protocol == LoginProtocol::SSH
                    ? transports_.open_ssh_shell(descriptor)
                    : transports_.open_telnet(descriptor);

  auto session = std::make_unique<ManagedSession>(std::move(stream), profile,
                                                  descriptor, clock_, logger_);
  session->establish();
  elevate(*session, descriptor, profile);
  return session;
}

void SessionConnector::elevate(ManagedSession &session,
                               const DeviceDescriptor &descriptor,
                               const VendorProfile &profile) {
  const std::string &prompt = session.prompt();
  if (prompt.empty() || prompt.back() != '>' ||
      !descriptor.has_privilege_secret()) {
    return;
  }
  if (profile.enable_command.empty()) {
    INSPECT_LOG_DEBUG(logger_, descriptor.host, "ENABLE",
                      "Vendor {} has no enable command, staying in user mode",
                      profile.tag);
    return;
  }

  if (profile.enable_without_secret_first) {
    try {
      if (session.try_enable(std::nullopt)) {
        INSPECT_LOG_INFO(logger_, descriptor.host, "ENABLE",
                         "Privileged mode entered without password");
        return;
      }
      INSPECT_LOG_DEBUG(logger_, descriptor.host, "ENABLE",
                        "Enable without password refused, retrying with "
                        "secret");
    } catch (const InspectionError &e) {
      INSPECT_LOG_DEBUG(logger_, descriptor.host, "ENABLE",
                        "Enable without password failed ({}), retrying with "
                        "secret",
                        e.what());
    }
  }

  if (!session.try_enable(descriptor.privilege_secret)) {
    throw ConnectionFailure("Failed to enter privileged mode on " +
                            descriptor.host);
  }
  INSPECT_LOG_INFO(logger_, descriptor.host, "ENABLE",
                   "Privileged mode entered with password");
}

} // namespace session
} // namespace devinspect
