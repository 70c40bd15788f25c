#pragma once

#include <stdexcept>
#include <string>

namespace devinspect {

/// Base of every failure raised while inspecting a single device
class InspectionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Any connection-establishment failure that is neither an authentication
/// rejection nor a timeout
class ConnectionFailure : public InspectionError {
public:
  using InspectionError::InspectionError;
};

/// Credentials rejected by the device
class AuthenticationError : public ConnectionFailure {
public:
  using ConnectionFailure::ConnectionFailure;
};

/// No response within the configured bound
class TimeoutError : public ConnectionFailure {
public:
  using ConnectionFailure::ConnectionFailure;
};

/// Send/read failure on an established session
class CommandError : public InspectionError {
public:
  using InspectionError::InspectionError;
};

/// Peer closed the byte stream
class StreamClosedError : public InspectionError {
public:
  using InspectionError::InspectionError;
};

/// Filesystem failure while persisting a report or error artifact
class ReportWriteError : public InspectionError {
public:
  using InspectionError::InspectionError;
};

/// Run-level failure raised before any device task is dispatched
class DispatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Unreadable or malformed configuration (vendor table file)
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace devinspect
