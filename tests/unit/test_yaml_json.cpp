#include "device-inspector/config/YamlJson.hpp"

#include <gtest/gtest.h>

using namespace devinspect::config;

TEST(YamlJson, ScalarsConvertedLosslessly) {
  auto j = yaml_to_json(YAML::Load(R"(
port: 23
timeout: 2.5
enabled: true
password: 007
secret: yes
quoted: "42"
host: 10.0.0.1
)"));

  EXPECT_TRUE(j["port"].is_number_integer());
  EXPECT_EQ(j["port"].get<int>(), 23);
  EXPECT_DOUBLE_EQ(j["timeout"].get<double>(), 2.5);
  EXPECT_EQ(j["enabled"], true);
  EXPECT_EQ(j["password"], "007");
  EXPECT_EQ(j["secret"], "yes");
  EXPECT_EQ(j["quoted"], "42");
  EXPECT_EQ(j["host"], "10.0.0.1");
}

TEST(YamlJson, SequencesAndMaps) {
  auto j = yaml_to_json(YAML::Load(R"(
commands: [display version, display clock]
nested:
  key: ~
)"));

  ASSERT_TRUE(j["commands"].is_array());
  EXPECT_EQ(j["commands"][1], "display clock");
  EXPECT_TRUE(j["nested"]["key"].is_null());
}

TEST(YamlJson, ScalarText) {
  EXPECT_EQ(scalar_text(nlohmann::json("abc")), "abc");
  EXPECT_EQ(scalar_text(nlohmann::json(23)), "23");
  EXPECT_EQ(scalar_text(nlohmann::json(false)), "false");
  EXPECT_FALSE(scalar_text(nlohmann::json()).has_value());
  EXPECT_FALSE(scalar_text(nlohmann::json::array()).has_value());
}

TEST(YamlJson, MissingFileThrows) {
  EXPECT_THROW(load_yaml_file("/nonexistent/inventory.yaml"), YAML::Exception);
}
