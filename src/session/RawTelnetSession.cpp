#include "device-inspector/session/RawTelnetSession.hpp"
#include "device-inspector/errors.hpp"

#include <regex>

namespace devinspect {
namespace session {

RawTelnetSession::RawTelnetSession(
    std::unique_ptr<transport::ByteStream> stream, const VendorProfile &profile,
    std::string host, std::string base_prompt, Clock &clock,
    InspectionLogger &logger)
    : stream_(std::move(stream)), profile_(profile), host_(std::move(host)),
      base_prompt_(std::move(base_prompt)), clock_(clock), logger_(logger) {}

RawTelnetSession::~RawTelnetSession() { close(); }

void RawTelnetSession::send_command(const std::string &command) {
  try {
    stream_->write(command + "\r\n");
  } catch (const StreamClosedError &e) {
    throw CommandError("Failed to send '" + command + "': " + e.what());
  }
  clock_.sleep_for(COMMAND_SETTLE);
}

bool RawTelnetSession::at_prompt(const std::string &buffer) const {
  const char sentinel = profile_.telnet_prompts.ready_sentinel;
  size_t end = buffer.find_last_not_of(" \t\r\n");
  if (end == std::string::npos || buffer[end] != sentinel)
    return false;
  if (base_prompt_.empty())
    return true;

  size_t start = buffer.find_last_of("\r\n", end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return buffer.compare(start, base_prompt_.size(), base_prompt_) == 0;
}

std::string RawTelnetSession::read_until_prompt() {
  transport::ReadResult result;
  try {
    result = transport::read_until(
        *stream_, clock_, READ_TIMEOUT,
        [this](const std::string &buf) { return at_prompt(buf); });
  } catch (const StreamClosedError &e) {
    throw CommandError(std::string("Read failed: ") + e.what());
  }

  if (!result.matched) {
    INSPECT_LOG_WARN(logger_, host_, "COMMAND",
                     "Prompt not seen within {} ms, keeping {} bytes",
                     READ_TIMEOUT.count(), result.data.size());
  }
  return result.data;
}

std::string RawTelnetSession::extract_device_name(const std::string &output) {
  static const std::regex name_regex(R"(<\s*(\S+?)\s*>)");
  std::smatch match;
  if (std::regex_search(output, match, name_regex))
    return match[1].str();
  return "";
}

std::string RawTelnetSession::discover_device_name() {
  std::string output;
  try {
    stream_->write("\r\n");
    clock_.sleep_for(NAME_SETTLE);
    output = transport::read_until(
                 *stream_, clock_, NAME_TIMEOUT,
                 std::string(1, profile_.telnet_prompts.ready_sentinel))
                 .data;
  } catch (const StreamClosedError &e) {
    throw CommandError(std::string("Device name query failed: ") + e.what());
  }

  std::string name = extract_device_name(output);
  if (name.empty()) {
    INSPECT_LOG_WARN(logger_, host_, "NAME",
                     "No <name> prompt in output, using fallback");
    return "unknown device";
  }
  return name;
}

void RawTelnetSession::close() {
  if (stream_ && stream_->is_open()) {
    stream_->close();
    INSPECT_LOG_DEBUG(logger_, host_, "CLOSE", "Telnet stream closed");
  }
}

} // namespace session
} // namespace devinspect
