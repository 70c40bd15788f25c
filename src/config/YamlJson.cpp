#include "device-inspector/config/YamlJson.hpp"

#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>

namespace devinspect {
namespace config {

static std::optional<int64_t> lossless_integer(const std::string &text) {
  if (text.empty())
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size())
    return std::nullopt;
  if (std::to_string(value) != text)
    return std::nullopt;
  return static_cast<int64_t>(value);
}

static std::optional<double> lossless_float(const std::string &text) {
  if (text.find_first_of("0123456789") == std::string::npos)
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size())
    return std::nullopt;
  if (fmt::format("{}", value) != text)
    return std::nullopt;
  return value;
}

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (!node.IsDefined() || node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    const std::string &text = node.Scalar();
    // "!" marks a quoted scalar
    if (node.Tag() == "!")
      return text;
    if (auto i = lossless_integer(text))
      return *i;
    if (text == "true")
      return true;
    if (text == "false")
      return false;
    if (auto d = lossless_float(text))
      return *d;
    return text;
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

nlohmann::json load_yaml_file(const std::string &path) {
  return yaml_to_json(YAML::LoadFile(path));
}

std::optional<std::string> scalar_text(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_boolean())
    return value.get<bool>() ? std::string("true") : std::string("false");
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_number_float())
    return fmt::format("{}", value.get<double>());
  return std::nullopt;
}

} // namespace config
} // namespace devinspect
