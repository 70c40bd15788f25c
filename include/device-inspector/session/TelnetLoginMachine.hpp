#pragma once
#include "device-inspector/Clock.hpp"
#include "device-inspector/Logger.hpp"
#include "device-inspector/VendorRegistry.hpp"
#include "device-inspector/transport/ByteStream.hpp"
#include "device-inspector/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace devinspect {
namespace session {

enum class TelnetLoginState {
  AWAIT_LOGIN_PROMPT,
  SEND_USERNAME,
  AWAIT_PASSWORD_PROMPT,
  SEND_PASSWORD,
  AWAIT_SECONDARY_PROMPT,
  SEND_SECONDARY,
  AWAIT_READY_PROMPT,
  READY,
  AUTH_FAILED
};

const char *to_string(TelnetLoginState state);

/// Drives a raw Telnet stream through the legacy login dialogue:
///
///   Login: -> username, Password: -> password,
///   [Secondary Password: -> secret], then wait for the ready sentinel.
///
/// Every wait is bounded by PROMPT_TIMEOUT. After READY the prompt is
/// normalized and the vendor pagination-disable command is sent.
class TelnetLoginMachine {
public:
  static constexpr std::chrono::milliseconds PROMPT_TIMEOUT{5000};
  static constexpr std::chrono::milliseconds PAGING_SETTLE{500};

  TelnetLoginMachine(transport::ByteStream &stream,
                     const VendorProfile &profile, Clock &clock,
                     InspectionLogger &logger);

  /// Run the login to READY.
  /// Throws TimeoutError when a prompt does not arrive, AuthenticationError
  /// when the device reports an authentication failure.
  void run(const DeviceDescriptor &descriptor);

  TelnetLoginState state() const { return state_; }
  const std::vector<TelnetLoginState> &history() const { return history_; }

  /// Ready prompt as one clean token, e.g. "<DPTech>"
  const std::string &prompt() const { return prompt_; }

  /// Prompt without the trailing sentinel, e.g. "<DPTech"
  const std::string &base_prompt() const { return base_prompt_; }

private:
  void transition(TelnetLoginState next);
  std::string await(const std::string &needle, bool watch_auth_failure);
  void send_line(const std::string &text);
  void normalize_prompt(const std::string &ready_output);
  void disable_paging();

  transport::ByteStream &stream_;
  const VendorProfile &profile_;
  Clock &clock_;
  InspectionLogger &logger_;

  std::string host_;
  TelnetLoginState state_{TelnetLoginState::AWAIT_LOGIN_PROMPT};
  std::vector<TelnetLoginState> history_;
  std::string pending_; // bytes received after the last consumed prompt
  std::string prompt_;
  std::string base_prompt_;
};

} // namespace session
} // namespace devinspect
