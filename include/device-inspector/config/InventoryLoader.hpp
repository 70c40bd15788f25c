#pragma once
#include "device-inspector/Logger.hpp"
#include "device-inspector/VendorRegistry.hpp"
#include "device-inspector/export.h"
#include "device-inspector/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace devinspect {
namespace config {

/// Builds DeviceDescriptors from a YAML inventory with `defaults`,
/// `command_sets` and `devices` sections.
///
/// Invalid entries are skipped with a warning naming the entry index;
/// invalid protocol, port and timeout values fall back to defaults. A file
/// that cannot be read yields an empty inventory and an error log.
class DEVICE_INSPECTOR_API InventoryLoader {
public:
  static constexpr int DEFAULT_TIMEOUT_SECONDS = 30;

  InventoryLoader(const VendorRegistry &registry, InspectionLogger &logger);

  std::vector<DeviceDescriptor> load_file(const std::string &path) const;
  std::vector<DeviceDescriptor> load_json(const nlohmann::json &doc) const;

  /// Commands from a sequence or a string delimited by any of ; , | or
  /// newline. Entries are trimmed and empty ones dropped.
  static std::vector<std::string> parse_commands(const nlohmann::json &value);
  static std::vector<std::string> split_commands(const std::string &text);

private:
  using CommandSets = std::map<std::string, std::vector<std::string>>;

  CommandSets load_command_sets(const nlohmann::json &doc) const;
  bool parse_device(const nlohmann::json &entry, size_t index,
                    const nlohmann::json &defaults,
                    const CommandSets &command_sets,
                    DeviceDescriptor &out) const;

  const VendorRegistry &registry_;
  InspectionLogger &logger_;
};

/// JSON view of a descriptor with password and secret masked
nlohmann::json descriptor_to_json(const DeviceDescriptor &descriptor);

} // namespace config
} // namespace devinspect
