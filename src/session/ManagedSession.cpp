#include "device-inspector/session/ManagedSession.hpp"
#include "device-inspector/errors.hpp"

#include <fmt/format.h>

namespace devinspect {
namespace session {

namespace {
const char *const PROMPT_TERMINATORS = ">#]";

std::string last_line(const std::string &buffer) {
  size_t end = buffer.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return "";
  size_t start = buffer.find_last_of("\r\n", end);
  start = (start == std::string::npos) ? 0 : start + 1;
  std::string line = buffer.substr(start, end - start + 1);
  size_t first = line.find_first_not_of(" \t");
  return first == std::string::npos ? "" : line.substr(first);
}

bool ends_with_terminator(const std::string &line) {
  return !line.empty() &&
         std::string(PROMPT_TERMINATORS).find(line.back()) != std::string::npos;
}

std::string strip_decoration(const std::string &text) {
  if (!text.empty() && (text.front() == '<' || text.front() == '['))
    return text.substr(1);
  return text;
}
} // namespace

ManagedSession::ManagedSession(std::unique_ptr<transport::ByteStream> stream,
                               const VendorProfile &profile,
                               const DeviceDescriptor &descriptor,
                               Clock &clock, InspectionLogger &logger)
    : stream_(std::move(stream)), profile_(profile), descriptor_(descriptor),
      clock_(clock), logger_(logger),
      newline_(descriptor.login_protocol == LoginProtocol::TELNET ? "\r\n"
                                                                  : "\n") {
  if (!profile_.more_pattern.empty()) {
    more_regex_ = std::regex(profile_.more_pattern);
    has_more_pattern_ = true;
  }
}

ManagedSession::~ManagedSession() { close(); }

void ManagedSession::establish() {
  if (descriptor_.login_protocol == LoginProtocol::TELNET) {
    telnet_login();
  }

  std::string banner = transport::drain(*stream_, SETTLE_QUIET);
  INSPECT_LOG_TRACE(logger_, descriptor_.host, "CONNECT",
                    "Discarded {} bytes of login banner", banner.size());

  find_prompt();
  INSPECT_LOG_DEBUG(logger_, descriptor_.host, "CONNECT",
                    "Prompt '{}', base prompt '{}'", prompt_, base_prompt_);
  disable_paging();
}

ManagedSession::LoginCue
ManagedSession::classify_login_output(const std::string &buffer,
                                      bool credentials_sent) const {
  static const std::regex failure_regex(
      "(authentication failed|login incorrect|login invalid|access denied)",
      std::regex::icase);
  static const std::regex password_regex(R"(pass(word)?\s*:\s*$)",
                                         std::regex::icase);
  static const std::regex username_regex(R"((user ?name|login)\s*:\s*$)",
                                         std::regex::icase);

  // Banners may mention denied access; only a reply to credentials counts
  if (credentials_sent && std::regex_search(buffer, failure_regex))
    return LoginCue::FAILURE;
  if (std::regex_search(buffer, password_regex))
    return LoginCue::PASSWORD;
  if (std::regex_search(buffer, username_regex))
    return LoginCue::USERNAME;
  if (ends_with_terminator(last_line(buffer)))
    return LoginCue::PROMPT;
  return LoginCue::NONE;
}

void ManagedSession::telnet_login() {
  const auto timeout = std::chrono::milliseconds(
      std::chrono::seconds(descriptor_.timeout_seconds));
  bool sent_username = false;
  bool sent_password = false;

  for (int round = 0; round < MAX_LOGIN_ROUNDS; ++round) {
    const bool credentials_sent = sent_username || sent_password;
    auto result = transport::read_until(
        *stream_, clock_, timeout,
        [this, credentials_sent](const std::string &buf) {
          return classify_login_output(buf, credentials_sent) !=
                 LoginCue::NONE;
        });
    if (!result.matched) {
      throw TimeoutError("Telnet login to " + descriptor_.host +
                         " timed out");
    }

    switch (classify_login_output(result.data, credentials_sent)) {
    case LoginCue::FAILURE:
      throw AuthenticationError("Telnet login rejected by " +
                                descriptor_.host);
    case LoginCue::PASSWORD:
      if (sent_password) {
        throw AuthenticationError("Password rejected by " + descriptor_.host);
      }
      stream_->write(descriptor_.password + newline_);
      sent_password = true;
      break;
    case LoginCue::USERNAME:
      if (sent_password) {
        throw AuthenticationError("Credentials rejected by " +
                                  descriptor_.host);
      }
      stream_->write(descriptor_.username.value_or("") + newline_);
      sent_username = true;
      break;
    case LoginCue::PROMPT:
      INSPECT_LOG_DEBUG(logger_, descriptor_.host, "CONNECT",
                        "Telnet login complete (username sent: {})",
                        sent_username);
      return;
    case LoginCue::NONE:
      break;
    }
  }
  throw ConnectionFailure("Telnet login to " + descriptor_.host +
                          " did not reach a shell prompt");
}

const std::string &ManagedSession::find_prompt() {
  stream_->write(newline_);
  auto result = transport::read_until(
      *stream_, clock_, PROMPT_TIMEOUT, [](const std::string &buf) {
        return ends_with_terminator(last_line(buf));
      });
  if (!result.matched) {
    throw TimeoutError("No shell prompt detected on " + descriptor_.host);
  }
  set_prompt(last_line(result.data));
  return prompt_;
}

void ManagedSession::set_prompt(const std::string &line) {
  prompt_ = line;
  base_prompt_ = line.substr(0, line.size() - 1);
  size_t last = base_prompt_.find_last_not_of(" \t");
  base_prompt_ = last == std::string::npos ? "" : base_prompt_.substr(0, last + 1);
  prompt_name_ = strip_decoration(base_prompt_);
}

bool ManagedSession::at_prompt(const std::string &buffer) const {
  std::string line = last_line(buffer);
  if (!ends_with_terminator(line))
    return false;
  return strip_decoration(line).compare(0, prompt_name_.size(),
                                        prompt_name_) == 0;
}

void ManagedSession::disable_paging() {
  if (profile_.pagination_disable.empty())
    return;
  send_command(profile_.pagination_disable);
  read_until_prompt(PROMPT_TIMEOUT);
  INSPECT_LOG_DEBUG(logger_, descriptor_.host, "CONNECT",
                    "Pagination disabled with '{}'",
                    profile_.pagination_disable);
}

bool ManagedSession::check_enable_mode() const {
  return !prompt_.empty() && prompt_.back() == '#';
}

bool ManagedSession::try_enable(const std::optional<std::string> &secret) {
  static const std::regex password_regex(R"(pass(word)?\s*:\s*$)",
                                         std::regex::icase);
  const auto timeout = std::chrono::milliseconds(
      std::chrono::seconds(descriptor_.timeout_seconds));

  stream_->write(profile_.enable_command + newline_);
  auto result = transport::read_until(
      *stream_, clock_, timeout, [this](const std::string &buf) {
        return std::regex_search(buf, password_regex) || at_prompt(buf);
      });
  if (!result.matched) {
    throw TimeoutError("No response to '" + profile_.enable_command +
                       "' from " + descriptor_.host);
  }

  std::string output = result.data;
  bool refused = false;
  if (std::regex_search(output, password_regex)) {
    stream_->write(secret.value_or("") + newline_);
    for (int prompts = 1;; ++prompts) {
      result = transport::read_until(
          *stream_, clock_, timeout, [this](const std::string &buf) {
            return std::regex_search(buf, password_regex) || at_prompt(buf);
          });
      if (!result.matched) {
        throw TimeoutError("No prompt after enable password on " +
                           descriptor_.host);
      }
      if (at_prompt(result.data)) {
        output = result.data;
        break;
      }
      if (prompts >= MAX_ENABLE_PROMPTS) {
        throw ConnectionFailure("Enable password prompt keeps repeating on " +
                                descriptor_.host);
      }
      // Asked again: the secret was refused, run out the remaining tries
      refused = true;
      stream_->write(newline_);
    }
  }

  set_prompt(last_line(output));
  if (refused) {
    INSPECT_LOG_DEBUG(logger_, descriptor_.host, "ENABLE",
                      "Enable password refused");
    return false;
  }
  return check_enable_mode();
}

void ManagedSession::send_command(const std::string &command) {
  try {
    stream_->write(command + newline_);
  } catch (const StreamClosedError &e) {
    throw CommandError("Failed to send '" + command + "': " + e.what());
  }
}

std::string ManagedSession::read_until_prompt() {
  return read_until_prompt(std::chrono::seconds(descriptor_.timeout_seconds));
}

std::string
ManagedSession::read_until_prompt(std::chrono::milliseconds timeout) {
  std::string buffer;
  size_t scanned = 0;
  auto deadline = clock_.now() + timeout;

  try {
    while (true) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - clock_.now());
      if (remaining.count() <= 0)
        break;
      std::string chunk = stream_->read_some(remaining);
      if (chunk.empty())
        break;
      buffer += chunk;

      // Page through output if the device still paginates
      if (has_more_pattern_ &&
          std::regex_search(buffer.cbegin() +
                                static_cast<std::string::difference_type>(scanned),
                            buffer.cend(), more_regex_)) {
        stream_->write(" ");
        scanned = buffer.size();
        continue;
      }
      if (at_prompt(buffer))
        return buffer;
    }
  } catch (const StreamClosedError &e) {
    throw CommandError(std::string("Read failed: ") + e.what());
  }

  throw CommandError(fmt::format("Prompt '{}' not seen within {} ms",
                                 base_prompt_, timeout.count()));
}

std::string ManagedSession::extract_device_name(const std::string &prompt) {
  static const std::regex name_regex(R"(^\s*[<\[]?([^\s>#\]]+)[>#\]])");
  std::smatch match;
  if (std::regex_search(prompt, match, name_regex))
    return match[1].str();
  return "";
}

std::string ManagedSession::discover_device_name() {
  std::string name = extract_device_name(prompt_);

  if (!profile_.sysname_command.empty()) {
    try {
      send_command(profile_.sysname_command);
      std::string output = read_until_prompt(SYSNAME_TIMEOUT);
      std::smatch match;
      std::regex sysname_regex(profile_.sysname_pattern);
      if (std::regex_search(output, match, sysname_regex)) {
        name = match[1].str();
      }
    } catch (const InspectionError &e) {
      INSPECT_LOG_WARN(logger_, descriptor_.host, "NAME",
                       "sysname query failed, keeping prompt name: {}",
                       e.what());
    }
  }

  if (name.empty()) {
    INSPECT_LOG_WARN(logger_, descriptor_.host, "NAME",
                     "No device name in prompt '{}', using fallback", prompt_);
    return "unknown device";
  }
  return name;
}

void ManagedSession::close() {
  if (stream_ && stream_->is_open()) {
    stream_->close();
    INSPECT_LOG_DEBUG(logger_, descriptor_.host, "CLOSE", "Session closed");
  }
}

} // namespace session
} // namespace devinspect
