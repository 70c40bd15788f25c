#pragma once
#include "device-inspector/Clock.hpp"
#include "device-inspector/Logger.hpp"
#include "device-inspector/VendorRegistry.hpp"
#include "device-inspector/export.h"
#include "device-inspector/session/Session.hpp"
#include "device-inspector/transport/TransportFactory.hpp"
#include "device-inspector/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace devinspect {
namespace session {

class ManagedSession;

enum class ConnectionErrorKind { AUTHENTICATION, TIMEOUT, GENERIC };

const char *to_string(ConnectionErrorKind kind);

/// Terminal connection failure after all attempts
struct ConnectionError {
  ConnectionErrorKind kind{ConnectionErrorKind::GENERIC};
  std::string message;
  int attempts{0};
};

/// Either an established session or the last connection error
class ConnectResult {
public:
  ConnectResult(std::unique_ptr<Session> session)
      : value_(std::move(session)) {}
  ConnectResult(ConnectionError error) : value_(std::move(error)) {}

  bool ok() const {
    return std::holds_alternative<std::unique_ptr<Session>>(value_);
  }

  /// Move the session out. Only valid when ok().
  std::unique_ptr<Session> take_session() {
    return std::move(std::get<std::unique_ptr<Session>>(value_));
  }

  /// Only valid when !ok()
  const ConnectionError &error() const {
    return std::get<ConnectionError>(value_);
  }

private:
  std::variant<std::unique_ptr<Session>, ConnectionError> value_;
};

struct RetryPolicy {
  int max_attempts{5};
  std::chrono::milliseconds interval{500};
};

/// Establishes authenticated sessions with bounded retries.
///
/// Legacy Telnet vendors go through TelnetLoginMachine and get a
/// RawTelnetSession; everything else gets a ManagedSession, elevated to
/// privileged mode when the device starts in user mode and a secret is set.
/// Safe to share between worker threads.
class DEVICE_INSPECTOR_API SessionConnector {
public:
  SessionConnector(const VendorRegistry &registry,
                   transport::TransportFactory &transports, Clock &clock,
                   InspectionLogger &logger, RetryPolicy policy = RetryPolicy());

  /// Never throws for per-device failures
  ConnectResult connect(const DeviceDescriptor &descriptor);

  const RetryPolicy &policy() const { return policy_; }

private:
  std::unique_ptr<Session> attempt(const DeviceDescriptor &descriptor,
                                   const VendorProfile &profile);
  std::unique_ptr<Session> open_legacy(const DeviceDescriptor &descriptor,
                                       const VendorProfile &profile);
  std::unique_ptr<Session> open_managed(const DeviceDescriptor &descriptor,
                                        const VendorProfile &profile);
  void elevate(ManagedSession &session, const DeviceDescriptor &descriptor,
               const VendorProfile &profile);

  const VendorRegistry &registry_;
  transport::TransportFactory &transports_;
  Clock &clock_;
  InspectionLogger &logger_;
  RetryPolicy policy_;
};

} // namespace session
} // namespace devinspect
