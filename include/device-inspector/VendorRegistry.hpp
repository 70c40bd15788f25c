#pragma once
#include "device-inspector/export.h"
#include "device-inspector/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace devinspect {

/// Prompt conventions of a legacy Telnet login
struct LegacyTelnetPrompts {
  std::string login{"Login: "};
  std::string password{"Password: "};
  std::string secondary{"Secondary Password: "};
  std::string auth_failure{"Authentication failed"};
  char ready_sentinel{'>'};
};

enum class SessionMode { MANAGED, LEGACY_TELNET };

/// Command-set semantics and prompt conventions of one vendor family
struct VendorProfile {
  std::string tag;
  std::string display_name;
  std::vector<std::string> aliases;

  std::string ssh_device_type;
  std::string telnet_device_type;
  bool legacy_telnet{false};

  std::string pagination_disable;
  std::string more_pattern; // regex

  std::string enable_command;
  bool enable_without_secret_first{false};

  std::string sysname_command;
  std::string sysname_pattern; // regex, first capture group is the name

  LegacyTelnetPrompts telnet_prompts;

  SessionMode session_mode(LoginProtocol protocol) const;

  /// Session-library device type identifier, e.g. "cisco_ios_telnet"
  std::string device_type(LoginProtocol protocol) const;
};

/// Immutable vendor table. Built once at startup with VendorRegistry::Builder
/// and passed by const reference afterwards.
class DEVICE_INSPECTOR_API VendorRegistry {
public:
  class Builder {
  public:
    /// Start from the builtin vendor table
    Builder &add_builtin_profiles();

    /// Add a profile, replacing any profile with the same tag
    Builder &add(VendorProfile profile);

    /// Add or override profiles from a YAML vendor file. Fields missing from
    /// an override keep the value of the profile it replaces.
    /// Throws ConfigError.
    Builder &load_yaml(const std::string &path);

    VendorRegistry build() const;

  private:
    std::map<std::string, VendorProfile> profiles_;
  };

  /// The builtin table
  static VendorRegistry builtin();

  /// Look up by tag or alias
  const VendorProfile *find(const std::string &tag_or_alias) const;

  bool contains(const std::string &tag_or_alias) const {
    return find(tag_or_alias) != nullptr;
  }

  /// Tags in sorted order
  std::vector<std::string> tags() const;

  size_t size() const { return profiles_.size(); }

private:
  explicit VendorRegistry(std::map<std::string, VendorProfile> profiles);

  std::map<std::string, VendorProfile> profiles_;
  std::map<std::string, std::string> aliases_; // alias -> tag
};

} // namespace devinspect
