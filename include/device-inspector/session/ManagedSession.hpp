#pragma once
#include "device-inspector/Clock.hpp"
#include "device-inspector/Logger.hpp"
#include "device-inspector/session/Session.hpp"
#include "device-inspector/transport/ByteStream.hpp"
#include "device-inspector/types.hpp"

#include <memory>
#include <optional>
#include <regex>

namespace devinspect {
namespace session {

/// Vendor-profile-driven session over an SSH shell or a Telnet stream.
///
/// establish() performs the Telnet login when needed, detects the prompt,
/// derives the base prompt and disables pagination. Privilege elevation is
/// left to the caller (SessionConnector).
class ManagedSession : public Session {
public:
  static constexpr std::chrono::milliseconds PROMPT_TIMEOUT{10000};
  static constexpr std::chrono::milliseconds SYSNAME_TIMEOUT{10000};
  static constexpr std::chrono::milliseconds SETTLE_QUIET{300};
  static constexpr int MAX_LOGIN_ROUNDS = 6;
  /// Password prompts answered per enable command before giving up
  static constexpr int MAX_ENABLE_PROMPTS = 4;

  ManagedSession(std::unique_ptr<transport::ByteStream> stream,
                 const VendorProfile &profile,
                 const DeviceDescriptor &descriptor, Clock &clock,
                 InspectionLogger &logger);
  ~ManagedSession() override;

  /// Throws AuthenticationError, TimeoutError or ConnectionFailure
  void establish();

  /// Send a line break and return the prompt line the device answers with
  const std::string &find_prompt();

  const std::string &prompt() const { return prompt_; }
  const std::string &base_prompt() const { return base_prompt_; }

  /// Prompt ends with '#'
  bool check_enable_mode() const;

  /// Send the vendor enable command, answering a password prompt with
  /// `secret` (an empty line when absent). A repeated password prompt means
  /// the secret was refused: remaining tries are answered with empty lines
  /// until the prompt returns, and false is returned. Otherwise returns
  /// check_enable_mode().
  bool try_enable(const std::optional<std::string> &secret);

  void send_command(const std::string &command) override;

  /// Read up to the prompt, bounded by the descriptor timeout
  std::string read_until_prompt() override;
  std::string read_until_prompt(std::chrono::milliseconds timeout);

  std::string discover_device_name() override;
  void close() override;

  const VendorProfile &profile() const override { return profile_; }
  SessionMode mode() const override { return SessionMode::MANAGED; }

  /// Leading prompt token up to '>', '#' or ']', without '<'/'[' decoration
  static std::string extract_device_name(const std::string &prompt);

private:
  enum class LoginCue { NONE, USERNAME, PASSWORD, FAILURE, PROMPT };

  void telnet_login();
  LoginCue classify_login_output(const std::string &buffer,
                                 bool credentials_sent) const;
  void disable_paging();
  bool at_prompt(const std::string &buffer) const;
  void set_prompt(const std::string &line);

  std::unique_ptr<transport::ByteStream> stream_;
  const VendorProfile &profile_;
  const DeviceDescriptor &descriptor_;
  Clock &clock_;
  InspectionLogger &logger_;

  std::string newline_;
  std::string prompt_;
  std::string base_prompt_;
  std::string prompt_name_; // base prompt without '<'/'[' decoration

  bool has_more_pattern_{false};
  std::regex more_regex_;
};

} // namespace session
} // namespace devinspect
