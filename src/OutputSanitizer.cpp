#include "device-inspector/OutputSanitizer.hpp"

namespace devinspect {

namespace {
constexpr const char *REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD
constexpr const char *WHITESPACE = " \t\r\n\f\v";

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the valid UTF-8 sequence starting at `pos`, or 0 if invalid.
size_t utf8_sequence_length(const std::string &s, size_t pos) {
  unsigned char lead = static_cast<unsigned char>(s[pos]);
  size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF; // bounds of the first continuation byte
  if (lead < 0x80) {
    return 1;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0)
      lo = 0xA0;
    else if (lead == 0xED)
      hi = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0)
      lo = 0x90;
    else if (lead == 0xF4)
      hi = 0x8F;
  } else {
    return 0;
  }

  if (pos + len > s.size())
    return 0;
  unsigned char first = static_cast<unsigned char>(s[pos + 1]);
  if (first < lo || first > hi)
    return 0;
  for (size_t i = 2; i < len; ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[pos + i])))
      return 0;
  }
  return len;
}
} // namespace

OutputSanitizer::OutputSanitizer(const std::string &more_pattern) {
  if (!more_pattern.empty()) {
    more_regex_ = std::regex("(?:" + more_pattern + ")\\r?\\n?");
    has_more_pattern_ = true;
  }
}

std::string OutputSanitizer::sanitize(const std::string &raw,
                                      const std::string &command,
                                      const std::string &device_name) const {
  std::string current = raw;
  while (true) {
    std::string next = decode_lossy(current);
    next = strip_pagination(next);
    next = strip_control_sequences(next);
    next = strip_command_echo(next, command);
    next = strip_trailing_prompt(next, device_name);
    next = trim(next);
    if (next == current)
      return next;
    current = std::move(next);
  }
}

std::string OutputSanitizer::decode_lossy(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t pos = 0;
  while (pos < bytes.size()) {
    size_t len = utf8_sequence_length(bytes, pos);
    if (len == 0) {
      out += REPLACEMENT_CHAR;
      ++pos;
    } else {
      out.append(bytes, pos, len);
      pos += len;
    }
  }
  return out;
}

std::string OutputSanitizer::strip_pagination(const std::string &text) const {
  if (!has_more_pattern_)
    return text;
  return std::regex_replace(text, more_regex_, "");
}

std::string OutputSanitizer::strip_control_sequences(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\b') {
      ++i;
      continue;
    }
    if (c == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      // CSI: parameter bytes 0x30-0x3F, intermediates 0x20-0x2F, final
      // 0x40-0x7E
      size_t j = i + 2;
      while (j < text.size() && text[j] >= 0x30 && text[j] <= 0x3F)
        ++j;
      while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x2F)
        ++j;
      if (j < text.size() && text[j] >= 0x40 && text[j] <= 0x7E) {
        i = j + 1;
        continue;
      }
      // Unterminated sequence is kept as is
    }
    out += c;
    ++i;
  }
  return out;
}

std::string OutputSanitizer::strip_command_echo(const std::string &text,
                                                const std::string &command) {
  if (command.empty() || text.compare(0, command.size(), command) != 0)
    return text;

  size_t pos = command.size();
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t'))
    ++pos;
  if (pos == text.size())
    return std::string();
  if (text[pos] != '\r' && text[pos] != '\n')
    return text; // command text continues, this is not an echo
  while (pos < text.size() && (text[pos] == '\r' || text[pos] == '\n'))
    ++pos;
  return text.substr(pos);
}

std::string
OutputSanitizer::strip_trailing_prompt(const std::string &text,
                                       const std::string &device_name) {
  if (device_name.empty())
    return text;
  size_t last = text.find_last_not_of(WHITESPACE);
  if (last == std::string::npos)
    return text;

  char terminator = text[last];
  if (terminator != '>' && terminator != '#' && terminator != ']')
    return text;
  if (last < device_name.size())
    return text;

  size_t start = last - device_name.size();
  if (text.compare(start, device_name.size(), device_name) != 0)
    return text;

  char opener = start > 0 ? text[start - 1] : '\0';
  if (opener == '<' || opener == '[') {
    --start;
  }
  if (terminator == ']' && opener != '[')
    return text;

  // The prompt must occupy its own line
  if (start > 0 && text[start - 1] != '\n' && text[start - 1] != '\r')
    return text;
  return text.substr(0, start);
}

std::string OutputSanitizer::trim(const std::string &text) {
  size_t first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos)
    return std::string();
  size_t last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

} // namespace devinspect
