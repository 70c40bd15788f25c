#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace devinspect {
namespace config {

/// Convert a YAML document to JSON. Quoted scalars stay strings; plain
/// scalars become integers, floats or booleans only when the conversion is
/// lossless, so values such as "007" survive as text.
nlohmann::json yaml_to_json(const YAML::Node &node);

/// Load a YAML file and convert it. Throws YAML::Exception on I/O or parse
/// errors.
nlohmann::json load_yaml_file(const std::string &path);

/// Text form of a scalar JSON value; nullopt for null, arrays and objects.
std::optional<std::string> scalar_text(const nlohmann::json &value);

} // namespace config
} // namespace devinspect
