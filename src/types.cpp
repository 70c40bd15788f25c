#include "device-inspector/types.hpp"

#include <algorithm>
#include <cctype>

namespace devinspect {

std::string to_string(LoginProtocol protocol) {
  return protocol == LoginProtocol::TELNET ? "telnet" : "ssh";
}

std::optional<LoginProtocol> parse_login_protocol(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "ssh")
    return LoginProtocol::SSH;
  if (lower == "telnet")
    return LoginProtocol::TELNET;
  return std::nullopt;
}

int default_port(LoginProtocol protocol) {
  return protocol == LoginProtocol::TELNET ? 23 : 22;
}

} // namespace devinspect
