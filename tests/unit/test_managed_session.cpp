#include "FakeDevice.hpp"
#include "TestFixtures.hpp"
#include "device-inspector/errors.hpp"
#include "device-inspector/session/ManagedSession.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace devinspect;
using namespace devinspect::session;
using namespace devinspect::test;

class ManagedSessionTest : public InspectorTest {
protected:
  std::unique_ptr<ManagedSession>
  open(std::unique_ptr<transport::ByteStream> stream,
       const DeviceDescriptor &descriptor) {
    return std::make_unique<ManagedSession>(
        std::move(stream), *registry_.find(descriptor.vendor_profile),
        descriptor, clock_, log_.logger());
  }
};

TEST_F(ManagedSessionTest, ExtractDeviceName) {
  EXPECT_EQ(ManagedSession::extract_device_name("router1>"), "router1");
  EXPECT_EQ(ManagedSession::extract_device_name("router1#"), "router1");
  EXPECT_EQ(ManagedSession::extract_device_name("<HUAWEI>"), "HUAWEI");
  EXPECT_EQ(ManagedSession::extract_device_name("[H3C]"), "H3C");
  EXPECT_EQ(ManagedSession::extract_device_name(""), "");
}

TEST_F(ManagedSessionTest, Establish_DetectsPromptAndDisablesPaging) {
  auto descriptor = make_device("10.0.0.1", "huawei");
  auto device = std::make_unique<FakeDevice>("<HUAWEI>");
  FakeDevice *raw = device.get();
  auto session = open(std::move(device), descriptor);

  session->establish();

  EXPECT_EQ(session->prompt(), "<HUAWEI>");
  EXPECT_EQ(session->base_prompt(), "<HUAWEI");
  EXPECT_FALSE(session->check_enable_mode());
  const auto &lines = raw->lines_received();
  EXPECT_NE(std::find(lines.begin(), lines.end(), "screen-length 0 temporary"),
            lines.end());
  EXPECT_EQ(session->discover_device_name(), "HUAWEI");
}

TEST_F(ManagedSessionTest, SendAndRead_ReturnsOutputUpToPrompt) {
  auto descriptor = make_device("10.0.0.1", "generic");
  auto device = std::make_unique<FakeDevice>("router1>");
  device->set_response("show version", "Cisco IOS 15.1");
  auto session = open(std::move(device), descriptor);
  session->establish();

  session->send_command("show version");
  EXPECT_EQ(session->read_until_prompt(),
            "show version\nCisco IOS 15.1\nrouter1>");
}

TEST_F(ManagedSessionTest, ComwareSysnamePreferred) {
  auto descriptor = make_device("10.0.0.2", "hp_comware");
  auto device = std::make_unique<FakeDevice>("<H3C>");
  device->set_response("display current-configuration | include sysname",
                       " sysname Core-SW-01");
  auto session = open(std::move(device), descriptor);
  session->establish();

  EXPECT_EQ(session->discover_device_name(), "Core-SW-01");
}

TEST_F(ManagedSessionTest, ComwareSysnameFailure_KeepsPromptName) {
  auto descriptor = make_device("10.0.0.3", "hp_comware");
  auto device = std::make_unique<FakeDevice>("<H3C>");
  device->set_failure("display current-configuration | include sysname");
  auto session = open(std::move(device), descriptor);
  session->establish();

  EXPECT_EQ(session->discover_device_name(), "H3C");
  EXPECT_NE(log_.text().find("sysname query failed"), std::string::npos);
}

TEST_F(ManagedSessionTest, UnparsablePrompt_FallsBackToUnknownDevice) {
  auto descriptor = make_device("10.0.0.4", "generic");
  auto stream = std::make_unique<ScriptedStream>(
      std::vector<std::string>{"", "\r\n>"});
  auto session = open(std::move(stream), descriptor);
  session->establish();

  EXPECT_EQ(session->discover_device_name(), "unknown device");
}

TEST_F(ManagedSessionTest, PaginationBannerAnsweredWithSpace) {
  auto descriptor = make_device("10.0.0.5", "generic");
  auto stream = std::make_unique<ScriptedStream>(std::vector<std::string>{
      "", "\r\nrouter1>", "line1\n --More-- ", "line2\nrouter1>"});
  ScriptedStream *raw = stream.get();
  auto session = open(std::move(stream), descriptor);
  session->establish();

  session->send_command("show run");
  std::string output = session->read_until_prompt();

  EXPECT_EQ(output, "line1\n --More-- line2\nrouter1>");
  EXPECT_EQ(raw->writes().back(), " ");
}

TEST_F(ManagedSessionTest, ReadTimeout_RaisesCommandError) {
  auto descriptor = make_device("10.0.0.6", "generic");
  auto stream = std::make_unique<ScriptedStream>(
      std::vector<std::string>{"", "\r\nrouter1>", "partial output"});
  auto session = open(std::move(stream), descriptor);
  session->establish();

  session->send_command("show tech");
  EXPECT_THROW(session->read_until_prompt(), CommandError);
}

TEST_F(ManagedSessionTest, StreamClosed_RaisesCommandError) {
  auto descriptor = make_device("10.0.0.7", "generic");
  auto device = std::make_unique<FakeDevice>("router1>");
  device->set_failure("reload");
  auto session = open(std::move(device), descriptor);
  session->establish();

  session->send_command("reload");
  EXPECT_THROW(session->read_until_prompt(), CommandError);
}

TEST_F(ManagedSessionTest, NoPrompt_RaisesTimeoutError) {
  auto descriptor = make_device("10.0.0.8", "generic");
  auto stream = std::make_unique<ScriptedStream>(
      std::vector<std::string>{"", "banner without prompt"});
  auto session = open(std::move(stream), descriptor);

  EXPECT_THROW(session->establish(), TimeoutError);
}

TEST_F(ManagedSessionTest, TelnetLogin_SendsCredentials) {
  auto descriptor = make_device("10.0.0.9", "generic");
  descriptor.login_protocol = LoginProtocol::TELNET;
  auto device = std::make_unique<FakeDevice>("router1>");
  device->set_login("admin", "s3cret");
  FakeDevice *raw = device.get();
  auto session = open(std::move(device), descriptor);

  session->establish();

  ASSERT_GE(raw->lines_received().size(), 2u);
  EXPECT_EQ(raw->lines_received()[0], "admin");
  EXPECT_EQ(raw->lines_received()[1], "s3cret");
  EXPECT_EQ(session->prompt(), "router1>");
}

TEST_F(ManagedSessionTest, TelnetLogin_RejectedPassword) {
  auto descriptor = make_device("10.0.0.10", "generic");
  descriptor.login_protocol = LoginProtocol::TELNET;
  auto device = std::make_unique<FakeDevice>("router1>");
  device->set_login("admin", "different");
  auto session = open(std::move(device), descriptor);

  EXPECT_THROW(session->establish(), AuthenticationError);
}

TEST_F(ManagedSessionTest, TelnetUsesCrLf) {
  auto descriptor = make_device("10.0.0.11", "generic");
  descriptor.login_protocol = LoginProtocol::TELNET;
  auto stream = std::make_unique<ScriptedStream>(
      std::vector<std::string>{"router1>", "", "\r\nrouter1>"});
  ScriptedStream *raw = stream.get();
  auto session = open(std::move(stream), descriptor);

  session->establish();

  ASSERT_FALSE(raw->writes().empty());
  EXPECT_EQ(raw->writes().front(), "\r\n");
}

TEST_F(ManagedSessionTest, CloseIsIdempotent) {
  auto descriptor = make_device("10.0.0.12", "generic");
  auto device = std::make_unique<FakeDevice>("router1>");
  FakeDevice *raw = device.get();
  auto session = open(std::move(device), descriptor);
  session->establish();

  session->close();
  session->close();
  EXPECT_FALSE(raw->is_open());
}

TEST_F(ManagedSessionTest, TryEnable_RepeatedPasswordPromptReturnsFalse) {
  auto descriptor = make_device("10.0.0.13", "cisco_ios");
  auto device = std::make_unique<FakeDevice>("router1>");
  device->set_enable("en-pass", "router1#");
  device->set_enable_tries(3);
  FakeDevice *raw = device.get();
  auto session = open(std::move(device), descriptor);
  session->establish();

  EXPECT_FALSE(session->try_enable(std::nullopt));
  EXPECT_EQ(session->prompt(), "router1>");

  // One empty answer per password prompt, three in total
  const auto &lines = raw->lines_received();
  auto enable = std::find(lines.begin(), lines.end(), "enable");
  ASSERT_NE(enable, lines.end());
  EXPECT_EQ(std::count(enable + 1, lines.end(), ""), 3);

  EXPECT_TRUE(session->try_enable(std::string("en-pass")));
  EXPECT_EQ(session->prompt(), "router1#");
}

TEST_F(ManagedSessionTest, TelnetLogin_BannerMentioningAccessDenied) {
  auto descriptor = make_device("10.0.0.14", "generic");
  descriptor.login_protocol = LoginProtocol::TELNET;
  auto stream = std::make_unique<ScriptedStream>(std::vector<std::string>{
      "Unauthorized use prohibited, access denied to intruders\r\n"
      "Username: ",
      "Password: ", "\r\nrouter1>", "", "\r\nrouter1>"});
  ScriptedStream *raw = stream.get();
  auto session = open(std::move(stream), descriptor);

  EXPECT_NO_THROW(session->establish());

  ASSERT_GE(raw->writes().size(), 2u);
  EXPECT_EQ(raw->writes()[0], "admin\r\n");
  EXPECT_EQ(raw->writes()[1], "s3cret\r\n");
  EXPECT_EQ(session->prompt(), "router1>");
}
