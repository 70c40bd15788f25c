#include "device-inspector/config/InventoryLoader.hpp"
#include "device-inspector/config/YamlJson.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>

using json = nlohmann::json;

namespace devinspect {
namespace config {

namespace {
const char *const MASK = "******";

std::string trim(const std::string &text) {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

// Field of the entry, falling back to the defaults section
const json *lookup(const json &entry, const json &defaults, const char *key) {
  if (entry.contains(key) && !entry[key].is_null())
    return &entry[key];
  if (defaults.is_object() && defaults.contains(key) &&
      !defaults[key].is_null())
    return &defaults[key];
  return nullptr;
}

std::optional<std::string> text_field(const json &entry, const json &defaults,
                                      const char *key) {
  const json *value = lookup(entry, defaults, key);
  if (!value)
    return std::nullopt;
  auto text = scalar_text(*value);
  if (!text)
    return std::nullopt;
  std::string trimmed = trim(*text);
  if (trimmed.empty())
    return std::nullopt;
  return trimmed;
}

std::optional<int> int_field(const json &value) {
  if (value.is_number_integer())
    return value.get<int>();
  auto text = scalar_text(value);
  if (!text)
    return std::nullopt;
  std::string t = trim(*text);
  if (t.empty())
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(t.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX)
    return std::nullopt;
  return static_cast<int>(parsed);
}

bool flag_field(const json &value) {
  if (value.is_boolean())
    return value.get<bool>();
  auto text = scalar_text(value);
  if (!text)
    return false;
  std::string t = lower(trim(*text));
  return t == "是" || t == "yes" || t == "true" || t == "y" || t == "1";
}
} // namespace

InventoryLoader::InventoryLoader(const VendorRegistry &registry,
                                 InspectionLogger &logger)
    : registry_(registry), logger_(logger) {}

std::vector<std::string> InventoryLoader::split_commands(const std::string &text) {
  std::vector<std::string> commands;
  std::string current;
  auto flush = [&]() {
    std::string cmd = trim(current);
    if (!cmd.empty())
      commands.push_back(cmd);
    current.clear();
  };
  for (char c : text) {
    if (c == ';' || c == ',' || c == '\n' || c == '|') {
      flush();
    } else {
      current += c;
    }
  }
  flush();
  return commands;
}

std::vector<std::string> InventoryLoader::parse_commands(const json &value) {
  std::vector<std::string> commands;
  if (value.is_array()) {
    for (const auto &item : value) {
      auto text = scalar_text(item);
      if (!text)
        continue;
      std::string cmd = trim(*text);
      if (!cmd.empty())
        commands.push_back(cmd);
    }
    return commands;
  }
  auto text = scalar_text(value);
  if (text)
    commands = split_commands(*text);
  return commands;
}

std::vector<DeviceDescriptor>
InventoryLoader::load_file(const std::string &path) const {
  json doc;
  try {
    doc = load_yaml_file(path);
  } catch (const std::exception &e) {
    INSPECT_LOG_ERROR(logger_, "*", "INVENTORY",
                      "Failed to load inventory {}: {}", path, e.what());
    return {};
  }
  auto devices = load_json(doc);
  INSPECT_LOG_INFO(logger_, "*", "INVENTORY", "Loaded {} devices from {}",
                   devices.size(), path);
  return devices;
}

InventoryLoader::CommandSets
InventoryLoader::load_command_sets(const json &doc) const {
  CommandSets sets;
  if (!doc.contains("command_sets"))
    return sets;
  const json &section = doc["command_sets"];
  if (!section.is_object()) {
    INSPECT_LOG_WARN(logger_, "*", "INVENTORY",
                     "'command_sets' must be a map, ignoring it");
    return sets;
  }

  for (const auto &[brand, value] : section.items()) {
    const VendorProfile *profile = registry_.find(brand);
    if (!profile) {
      INSPECT_LOG_WARN(logger_, "*", "INVENTORY",
                       "Command set for unknown vendor '{}' ignored", brand);
      continue;
    }
    auto commands = parse_commands(value);
    if (commands.empty()) {
      INSPECT_LOG_WARN(logger_, "*", "INVENTORY",
                       "Command set for '{}' is empty", brand);
      continue;
    }
    auto &target = sets[profile->tag];
    target.insert(target.end(), commands.begin(), commands.end());
  }
  return sets;
}

std::vector<DeviceDescriptor> InventoryLoader::load_json(const json &doc) const {
  std::vector<DeviceDescriptor> devices;
  if (!doc.is_object() || !doc.contains("devices") ||
      !doc["devices"].is_array()) {
    INSPECT_LOG_ERROR(logger_, "*", "INVENTORY",
                      "Inventory must contain a 'devices' sequence");
    return devices;
  }

  const json defaults =
      doc.contains("defaults") && doc["defaults"].is_object()
          ? doc["defaults"]
          : json::object();
  const CommandSets command_sets = load_command_sets(doc);

  const json &entries = doc["devices"];
  for (size_t i = 0; i < entries.size(); ++i) {
    DeviceDescriptor descriptor;
    if (parse_device(entries[i], i, defaults, command_sets, descriptor)) {
      devices.push_back(std::move(descriptor));
    }
  }
  return devices;
}

bool InventoryLoader::parse_device(const json &entry, size_t index,
                                   const json &defaults,
                                   const CommandSets &command_sets,
                                   DeviceDescriptor &out) const {
  if (!entry.is_object()) {
    INSPECT_LOG_WARN(logger_, "*", "INVENTORY",
                     "Device entry {} is not a map, skipped", index);
    return false;
  }

  auto host = text_field(entry, json::object(), "host");
  auto vendor = text_field(entry, defaults, "vendor");
  auto password = text_field(entry, defaults, "password");

  std::vector<std::string> missing;
  if (!host)
    missing.push_back("host");
  if (!vendor)
    missing.push_back("vendor");
  if (!password)
    missing.push_back("password");
  if (!missing.empty()) {
    INSPECT_LOG_WARN(logger_, "*", "INVENTORY",
                     "Device entry {} is missing fields: {}", index,
                     fmt::join(missing, ", "));
    return false;
  }

  const VendorProfile *profile = registry_.find(*vendor);
  if (!profile) {
    INSPECT_LOG_WARN(logger_, *host, "INVENTORY",
                     "Device entry {} has unknown vendor '{}', skipped", index,
                     *vendor);
    return false;
  }

  out.host = *host;
  out.vendor_profile = profile->tag;
  out.password = *password;
  out.username = text_field(entry, defaults, "username");
  out.privilege_secret = text_field(entry, defaults, "secret");

  out.login_protocol = LoginProtocol::SSH;
  if (auto protocol_text = text_field(entry, defaults, "protocol")) {
    auto protocol = parse_login_protocol(*protocol_text);
    if (protocol) {
      out.login_protocol = *protocol;
    } else {
      INSPECT_LOG_WARN(logger_, out.host, "INVENTORY",
                       "Device entry {} has invalid protocol '{}', using ssh",
                       index, *protocol_text);
    }
  }

  out.port = default_port(out.login_protocol);
  if (const json *port = lookup(entry, json::object(), "port")) {
    auto parsed = int_field(*port);
    if (parsed && *parsed > 0 && *parsed < 65536) {
      out.port = *parsed;
    } else {
      INSPECT_LOG_WARN(logger_, out.host, "INVENTORY",
                       "Device entry {} has invalid port '{}', using {}",
                       index, port->dump(), out.port);
    }
  }

  out.timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
  if (const json *timeout = lookup(entry, defaults, "timeout")) {
    auto parsed = int_field(*timeout);
    if (parsed && *parsed > 0) {
      out.timeout_seconds = *parsed;
    } else {
      INSPECT_LOG_WARN(logger_, out.host, "INVENTORY",
                       "Device entry {} has invalid timeout '{}', using {}",
                       index, timeout->dump(), DEFAULT_TIMEOUT_SECONDS);
    }
  }

  out.commands.clear();
  const json *load_set = lookup(entry, defaults, "load_command_set");
  if (load_set && flag_field(*load_set)) {
    auto it = command_sets.find(profile->tag);
    if (it != command_sets.end()) {
      out.commands = it->second;
    }
  }
  if (entry.contains("commands")) {
    auto extra = parse_commands(entry["commands"]);
    out.commands.insert(out.commands.end(), extra.begin(), extra.end());
  }

  INSPECT_LOG_INFO(logger_, out.host, "INVENTORY",
                   "Vendor {} over {}, {} commands", profile->tag,
                   to_string(out.login_protocol), out.commands.size());
  return true;
}

json descriptor_to_json(const DeviceDescriptor &descriptor) {
  json j;
  j["host"] = descriptor.host;
  j["port"] = descriptor.port;
  j["vendor"] = descriptor.vendor_profile;
  j["protocol"] = to_string(descriptor.login_protocol);
  j["username"] = descriptor.username ? json(*descriptor.username) : json();
  j["password"] = MASK;
  j["secret"] = descriptor.has_privilege_secret() ? json(MASK) : json();
  j["timeout"] = descriptor.timeout_seconds;
  j["commands"] = descriptor.commands;
  return j;
}

} // namespace config
} // namespace devinspect
