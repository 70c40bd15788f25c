#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devinspect {

enum class LoginProtocol { SSH, TELNET };

/// "ssh" / "telnet", as written in reports and inventory files
std::string to_string(LoginProtocol protocol);

/// Parses "ssh"/"telnet" (case-insensitive)
std::optional<LoginProtocol> parse_login_protocol(const std::string &text);

/// Default port for a login protocol: 22 for SSH, 23 for Telnet
int default_port(LoginProtocol protocol);

/// Fully resolved connection and command specification for one device.
/// Built by the inventory loader and read-only afterwards.
struct DeviceDescriptor {
  std::string host;
  int port{22};
  std::optional<std::string> username;
  std::string password;
  std::optional<std::string> privilege_secret;
  std::string vendor_profile; // tag in the VendorRegistry
  LoginProtocol login_protocol{LoginProtocol::SSH};
  int timeout_seconds{30};
  std::vector<std::string> commands;

  bool has_privilege_secret() const {
    return privilege_secret.has_value() && !privilege_secret->empty();
  }
};

struct CommandResult {
  std::string command;
  std::string sanitized_output;
};

/// Terminal artifact of one device's inspection
struct InspectionOutcome {
  std::string host;
  std::string device_name;
  bool success{false};
  std::filesystem::path report_path; // set on success
  std::filesystem::path error_path;  // set on failure (empty if unwritable)
  std::string error_message;
};

} // namespace devinspect
