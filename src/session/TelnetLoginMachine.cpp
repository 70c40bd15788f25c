#include "device-inspector/session/TelnetLoginMachine.hpp"
#include "device-inspector/errors.hpp"

#include <algorithm>

namespace devinspect {
namespace session {

namespace {
constexpr std::chrono::milliseconds DRAIN_QUIET{200};
}

const char *to_string(TelnetLoginState state) {
  switch (state) {
  case TelnetLoginState::AWAIT_LOGIN_PROMPT:
    return "AWAIT_LOGIN_PROMPT";
  case TelnetLoginState::SEND_USERNAME:
    return "SEND_USERNAME";
  case TelnetLoginState::AWAIT_PASSWORD_PROMPT:
    return "AWAIT_PASSWORD_PROMPT";
  case TelnetLoginState::SEND_PASSWORD:
    return "SEND_PASSWORD";
  case TelnetLoginState::AWAIT_SECONDARY_PROMPT:
    return "AWAIT_SECONDARY_PROMPT";
  case TelnetLoginState::SEND_SECONDARY:
    return "SEND_SECONDARY";
  case TelnetLoginState::AWAIT_READY_PROMPT:
    return "AWAIT_READY_PROMPT";
  case TelnetLoginState::READY:
    return "READY";
  case TelnetLoginState::AUTH_FAILED:
    return "AUTH_FAILED";
  }
  return "UNKNOWN";
}

TelnetLoginMachine::TelnetLoginMachine(transport::ByteStream &stream,
                                       const VendorProfile &profile,
                                       Clock &clock, InspectionLogger &logger)
    : stream_(stream), profile_(profile), clock_(clock), logger_(logger) {}

void TelnetLoginMachine::run(const DeviceDescriptor &descriptor) {
  const auto &prompts = profile_.telnet_prompts;
  host_ = descriptor.host;
  history_.clear();
  pending_.clear();
  prompt_.clear();
  base_prompt_.clear();

  transition(TelnetLoginState::AWAIT_LOGIN_PROMPT);
  await(prompts.login, false);

  transition(TelnetLoginState::SEND_USERNAME);
  send_line(descriptor.username.value_or(""));

  transition(TelnetLoginState::AWAIT_PASSWORD_PROMPT);
  await(prompts.password, false);

  transition(TelnetLoginState::SEND_PASSWORD);
  send_line(descriptor.password);

  if (descriptor.has_privilege_secret()) {
    transition(TelnetLoginState::AWAIT_SECONDARY_PROMPT);
    await(prompts.secondary, true);

    transition(TelnetLoginState::SEND_SECONDARY);
    send_line(*descriptor.privilege_secret);
  }

  transition(TelnetLoginState::AWAIT_READY_PROMPT);
  std::string ready_output =
      await(std::string(1, prompts.ready_sentinel), true);

  transition(TelnetLoginState::READY);
  normalize_prompt(ready_output);
  INSPECT_LOG_INFO(logger_, host_, "LOGIN", "Legacy Telnet login ready at {}",
                   prompt_);

  disable_paging();
}

void TelnetLoginMachine::transition(TelnetLoginState next) {
  state_ = next;
  history_.push_back(next);
  INSPECT_LOG_TRACE(logger_, host_, "LOGIN", "State -> {}", to_string(next));
}

std::string TelnetLoginMachine::await(const std::string &needle,
                                      bool watch_auth_failure) {
  const std::string &failure = profile_.telnet_prompts.auth_failure;
  auto satisfied = [&](const std::string &buf) {
    if (buf.find(needle) != std::string::npos)
      return true;
    return watch_auth_failure && !failure.empty() &&
           buf.find(failure) != std::string::npos;
  };

  std::string buffer;
  buffer.swap(pending_);
  if (!satisfied(buffer)) {
    auto result = transport::read_until(
        stream_, clock_, PROMPT_TIMEOUT,
        [&](const std::string &data) { return satisfied(buffer + data); });
    buffer += result.data;
    if (!result.matched) {
      INSPECT_LOG_DEBUG(logger_, host_, "LOGIN",
                        "No '{}' within {} ms in state {}", needle,
                        PROMPT_TIMEOUT.count(), to_string(state_));
      throw TimeoutError("Timed out waiting for '" + needle + "' from " +
                         host_);
    }
  }

  if (watch_auth_failure && !failure.empty() &&
      buffer.find(failure) != std::string::npos) {
    transition(TelnetLoginState::AUTH_FAILED);
    throw AuthenticationError("Authentication failed on " + host_);
  }

  size_t end = buffer.find(needle) + needle.size();
  pending_ = buffer.substr(end);
  return buffer.substr(0, end);
}

void TelnetLoginMachine::send_line(const std::string &text) {
  stream_.write(text + "\r\n");
}

void TelnetLoginMachine::normalize_prompt(const std::string &ready_output) {
  const char sentinel = profile_.telnet_prompts.ready_sentinel;
  size_t end = ready_output.rfind(sentinel);
  size_t start = ready_output.find_last_of("\r\n", end);
  start = (start == std::string::npos) ? 0 : start + 1;

  std::string line = ready_output.substr(start, end - start + 1);
  line.erase(std::remove_if(line.begin(), line.end(),
                            [](char c) { return c == '\r' || c == '\n'; }),
             line.end());
  size_t first = line.find_first_not_of(" \t");
  prompt_ = (first == std::string::npos) ? std::string(1, sentinel)
                                         : line.substr(first);

  base_prompt_ = prompt_.substr(0, prompt_.size() - 1);
  size_t last = base_prompt_.find_last_not_of(" \t");
  base_prompt_ =
      (last == std::string::npos) ? std::string() : base_prompt_.substr(0, last + 1);
}

void TelnetLoginMachine::disable_paging() {
  if (profile_.pagination_disable.empty())
    return;

  INSPECT_LOG_DEBUG(logger_, host_, "LOGIN", "Disabling pagination: {}",
                    profile_.pagination_disable);
  send_line(profile_.pagination_disable);
  clock_.sleep_for(PAGING_SETTLE);
  std::string echo = transport::drain(stream_, DRAIN_QUIET);
  INSPECT_LOG_TRACE(logger_, host_, "LOGIN", "Discarded {} bytes of echo",
                    echo.size());
  pending_.clear();
}

} // namespace session
} // namespace devinspect
