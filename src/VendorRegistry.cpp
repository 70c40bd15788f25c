#include "device-inspector/VendorRegistry.hpp"
#include "device-inspector/config/YamlJson.hpp"
#include "device-inspector/errors.hpp"

#include <regex>
#include <utility>

using json = nlohmann::json;

namespace devinspect {

SessionMode VendorProfile::session_mode(LoginProtocol protocol) const {
  if (protocol == LoginProtocol::TELNET && legacy_telnet)
    return SessionMode::LEGACY_TELNET;
  return SessionMode::MANAGED;
}

std::string VendorProfile::device_type(LoginProtocol protocol) const {
  if (protocol == LoginProtocol::SSH)
    return ssh_device_type;
  if (legacy_telnet)
    return ssh_device_type + "_telnet";
  return telnet_device_type;
}

static std::vector<VendorProfile> builtin_profiles() {
  std::vector<VendorProfile> out;

  VendorProfile huawei;
  huawei.tag = "huawei";
  huawei.display_name = "华为";
  huawei.aliases = {"华为"};
  huawei.ssh_device_type = "huawei";
  huawei.telnet_device_type = "huawei_telnet";
  huawei.pagination_disable = "screen-length 0 temporary";
  huawei.more_pattern = R"(  ---- More ----)";
  out.push_back(huawei);

  VendorProfile cisco;
  cisco.tag = "cisco_ios";
  cisco.display_name = "思科";
  cisco.aliases = {"思科"};
  cisco.ssh_device_type = "cisco_ios";
  cisco.telnet_device_type = "cisco_ios_telnet";
  cisco.pagination_disable = "terminal length 0";
  cisco.more_pattern = R"( ?--More-- ?)";
  cisco.enable_command = "enable";
  cisco.enable_without_secret_first = true;
  out.push_back(cisco);

  VendorProfile comware;
  comware.tag = "hp_comware";
  comware.display_name = "华三";
  comware.aliases = {"华三"};
  comware.ssh_device_type = "hp_comware";
  comware.telnet_device_type = "hp_comware_telnet";
  comware.pagination_disable = "screen-length disable";
  comware.more_pattern = R"(  ---- More ----)";
  comware.sysname_command = "display current-configuration | include sysname";
  comware.sysname_pattern = R"(sysname (\S+))";
  out.push_back(comware);

  VendorProfile ruijie;
  ruijie.tag = "ruijie_os";
  ruijie.display_name = "锐捷";
  ruijie.aliases = {"锐捷"};
  ruijie.ssh_device_type = "ruijie_os";
  ruijie.telnet_device_type = "ruijie_os_telnet";
  ruijie.pagination_disable = "terminal length 0";
  ruijie.more_pattern = R"( ?--More-- ?)";
  ruijie.enable_command = "enable";
  out.push_back(ruijie);

  VendorProfile zte;
  zte.tag = "zte_zxros";
  zte.display_name = "中兴";
  zte.aliases = {"中兴"};
  zte.ssh_device_type = "zte_zxros";
  zte.telnet_device_type = "zte_zxros_telnet";
  zte.pagination_disable = "terminal length 0";
  zte.more_pattern = R"( ?--More-- ?)";
  zte.enable_command = "enable";
  out.push_back(zte);

  VendorProfile dptech;
  dptech.tag = "dptech_os";
  dptech.display_name = "迪普";
  dptech.aliases = {"迪普"};
  dptech.ssh_device_type = "dptech_os";
  dptech.telnet_device_type = "dptech_os_telnet";
  dptech.legacy_telnet = true;
  dptech.pagination_disable = "terminal line 0";
  dptech.more_pattern = R"(--More\(CTRL\+C break\)--)";
  out.push_back(dptech);

  VendorProfile generic;
  generic.tag = "generic";
  generic.display_name = "通用";
  generic.aliases = {"managed-generic", "通用"};
  generic.ssh_device_type = "autodetect";
  generic.telnet_device_type = "autodetect_telnet";
  generic.more_pattern = R"( ?--More-- ?)";
  out.push_back(generic);

  return out;
}

VendorRegistry::Builder &VendorRegistry::Builder::add_builtin_profiles() {
  for (auto &profile : builtin_profiles()) {
    add(std::move(profile));
  }
  return *this;
}

VendorRegistry::Builder &VendorRegistry::Builder::add(VendorProfile profile) {
  std::string tag = profile.tag;
  profiles_[tag] = std::move(profile);
  return *this;
}

static void apply_string(const json &j, const char *key, std::string &out) {
  if (!j.contains(key) || j[key].is_null())
    return;
  auto text = config::scalar_text(j[key]);
  if (!text) {
    throw ConfigError(std::string("Vendor field '") + key +
                      "' must be a scalar");
  }
  out = *text;
}

static void apply_bool(const json &j, const char *key, bool &out) {
  if (!j.contains(key) || j[key].is_null())
    return;
  if (!j[key].is_boolean()) {
    throw ConfigError(std::string("Vendor field '") + key +
                      "' must be true or false");
  }
  out = j[key].get<bool>();
}

VendorRegistry::Builder &
VendorRegistry::Builder::load_yaml(const std::string &path) {
  json doc;
  try {
    doc = config::load_yaml_file(path);
  } catch (const std::exception &ex) {
    throw ConfigError("Failed to load vendor file " + path + ": " +
                      ex.what());
  }

  if (!doc.is_object() || !doc.contains("vendors") ||
      !doc["vendors"].is_array()) {
    throw ConfigError("Vendor file " + path +
                      " must contain a 'vendors' sequence");
  }

  for (size_t i = 0; i < doc["vendors"].size(); ++i) {
    const json &entry = doc["vendors"][i];
    if (!entry.is_object()) {
      throw ConfigError("Vendor entry " + std::to_string(i) +
                        " must be a map");
    }
    std::string tag;
    apply_string(entry, "tag", tag);
    if (tag.empty()) {
      throw ConfigError("Vendor entry " + std::to_string(i) +
                        " is missing 'tag'");
    }

    VendorProfile profile;
    auto existing = profiles_.find(tag);
    if (existing != profiles_.end()) {
      profile = existing->second;
    } else {
      profile.tag = tag;
      profile.ssh_device_type = tag;
      profile.telnet_device_type = tag + "_telnet";
    }

    apply_string(entry, "display_name", profile.display_name);
    apply_string(entry, "ssh_device_type", profile.ssh_device_type);
    apply_string(entry, "telnet_device_type", profile.telnet_device_type);
    apply_bool(entry, "legacy_telnet", profile.legacy_telnet);
    apply_string(entry, "pagination_disable", profile.pagination_disable);
    apply_string(entry, "more_pattern", profile.more_pattern);
    apply_string(entry, "enable_command", profile.enable_command);
    apply_bool(entry, "enable_without_secret_first",
               profile.enable_without_secret_first);
    apply_string(entry, "sysname_command", profile.sysname_command);
    apply_string(entry, "sysname_pattern", profile.sysname_pattern);

    if (entry.contains("aliases")) {
      if (!entry["aliases"].is_array()) {
        throw ConfigError("Vendor '" + tag + "': aliases must be a sequence");
      }
      profile.aliases.clear();
      for (const auto &alias : entry["aliases"]) {
        auto text = config::scalar_text(alias);
        if (text)
          profile.aliases.push_back(*text);
      }
    }

    if (entry.contains("telnet_prompts") &&
        entry["telnet_prompts"].is_object()) {
      const json &prompts = entry["telnet_prompts"];
      auto &p = profile.telnet_prompts;
      apply_string(prompts, "login", p.login);
      apply_string(prompts, "password", p.password);
      apply_string(prompts, "secondary", p.secondary);
      apply_string(prompts, "auth_failure", p.auth_failure);
      std::string sentinel(1, p.ready_sentinel);
      apply_string(prompts, "ready_sentinel", sentinel);
      if (sentinel.size() != 1) {
        throw ConfigError("Vendor '" + tag +
                          "': ready_sentinel must be one character");
      }
      p.ready_sentinel = sentinel[0];
    }

    for (const auto *pattern : {&profile.more_pattern,
                                &profile.sysname_pattern}) {
      if (pattern->empty())
        continue;
      try {
        std::regex check(*pattern);
      } catch (const std::regex_error &ex) {
        throw ConfigError("Vendor '" + tag + "': invalid pattern '" +
                          *pattern + "': " + ex.what());
      }
    }

    add(std::move(profile));
  }
  return *this;
}

VendorRegistry VendorRegistry::Builder::build() const {
  return VendorRegistry(profiles_);
}

VendorRegistry VendorRegistry::builtin() {
  return Builder().add_builtin_profiles().build();
}

VendorRegistry::VendorRegistry(std::map<std::string, VendorProfile> profiles)
    : profiles_(std::move(profiles)) {
  for (const auto &[tag, profile] : profiles_) {
    for (const auto &alias : profile.aliases) {
      aliases_[alias] = tag;
    }
  }
}

const VendorProfile *
VendorRegistry::find(const std::string &tag_or_alias) const {
  auto it = profiles_.find(tag_or_alias);
  if (it != profiles_.end())
    return &it->second;
  auto alias = aliases_.find(tag_or_alias);
  if (alias == aliases_.end())
    return nullptr;
  it = profiles_.find(alias->second);
  return it == profiles_.end() ? nullptr : &it->second;
}

std::vector<std::string> VendorRegistry::tags() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto &[tag, _] : profiles_) {
    names.push_back(tag);
  }
  return names;
}

} // namespace devinspect
