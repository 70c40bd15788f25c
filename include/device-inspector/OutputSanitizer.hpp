#pragma once

#include <regex>
#include <string>

namespace devinspect {

/// Turns the raw bytes captured for one command into clean text.
///
/// Rules, applied in order and repeated until the text stops changing:
///   1. lossy UTF-8 decode (invalid sequences become U+FFFD)
///   2. pagination banners, with an optional trailing line break
///   3. backspaces and ANSI CSI escape sequences
///   4. leading echo of the issued command
///   5. trailing device prompt (name followed by '>', '#' or ']')
///   6. surrounding whitespace
/// Nothing else is removed, and sanitize(sanitize(x)) == sanitize(x).
class OutputSanitizer {
public:
  /// `more_pattern` is the vendor pagination banner regex; empty disables
  /// banner removal. Throws std::regex_error on an invalid pattern.
  explicit OutputSanitizer(const std::string &more_pattern = "");

  std::string sanitize(const std::string &raw, const std::string &command,
                       const std::string &device_name) const;

  std::string strip_pagination(const std::string &text) const;

  static std::string decode_lossy(const std::string &bytes);
  static std::string strip_control_sequences(const std::string &text);
  static std::string strip_command_echo(const std::string &text,
                                        const std::string &command);
  static std::string strip_trailing_prompt(const std::string &text,
                                           const std::string &device_name);
  static std::string trim(const std::string &text);

private:
  bool has_more_pattern_{false};
  std::regex more_regex_;
};

} // namespace devinspect
