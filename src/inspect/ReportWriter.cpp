#include "device-inspector/inspect/ReportWriter.hpp"
#include "device-inspector/errors.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace devinspect {
namespace inspect {

namespace {
const std::string SEPARATOR = std::string(40, '#') + "\n";

void ensure_directory(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw ReportWriteError("Cannot create directory " + dir.string() + ": " +
                           ec.message());
  }
}

void write_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ReportWriteError("Cannot open " + path.string() + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw ReportWriteError("Failed writing " + path.string());
  }
}

// Picks `<stem><ext>`, or `<stem>-N<ext>` when taken, and writes it while
// holding a process-wide lock so two writers never get the same file
fs::path write_unique(const fs::path &dir, const std::string &stem,
                      const std::string &ext, const std::string &content) {
  static std::mutex mutex;
  std::lock_guard lock(mutex);
  ensure_directory(dir);
  fs::path path = dir / fs::u8path(stem + ext);
  for (int n = 2; fs::exists(path); ++n) {
    path = dir / fs::u8path(fmt::format("{}-{}{}", stem, n, ext));
  }
  write_file(path, content);
  return path;
}

// Error artifacts are a single line
std::string single_line(const std::string &message) {
  std::string out = message;
  for (auto &c : out) {
    if (c == '\r' || c == '\n')
      c = ' ';
  }
  return out;
}
} // namespace

ReportWriter::ReportWriter(fs::path result_dir)
    : result_dir_(std::move(result_dir)) {}

std::string ReportWriter::file_timestamp(std::time_t when) {
  return fmt::format("{:%Y%m%d-%H%M%S}", fmt::localtime(when));
}

std::string ReportWriter::report_timestamp(std::time_t when) {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(when));
}

std::string ReportWriter::sanitize_device_name(const std::string &device_name) {
  std::string out = device_name;
  for (auto &c : out) {
    switch (c) {
    case '\\':
    case '/':
    case '*':
    case '?':
    case ':':
    case '"':
    case '<':
    case '>':
    case '|':
      c = '_';
      break;
    default:
      break;
    }
  }
  return out;
}

std::string
ReportWriter::format_report(const std::string &host,
                            const std::string &device_name,
                            const std::string &inspection_time,
                            LoginProtocol protocol,
                            const std::vector<CommandResult> &results) {
  std::string out;
  out += "=== 设备巡检报告 ===\n";
  out += fmt::format("设备 IP: {}\n", host);
  out += fmt::format("设备名称: {}\n", device_name);
  out += fmt::format("巡检时间: {}\n", inspection_time);
  out += fmt::format("登录协议: {}\n", to_string(protocol));
  out += "=== 巡检命令输出 ===\n\n";
  for (const auto &result : results) {
    out += SEPARATOR;
    out += fmt::format("--- 命令: {} ---\n", result.command);
    out += result.sanitized_output + "\n\n";
  }
  out += SEPARATOR;
  return out;
}

fs::path ReportWriter::write_report(const std::string &host,
                                    const std::string &device_name,
                                    LoginProtocol protocol,
                                    const std::vector<CommandResult> &results,
                                    std::time_t when) const {
  fs::path device_dir =
      result_dir_ / fs::u8path(host + "__" + sanitize_device_name(device_name));

  return write_unique(device_dir, file_timestamp(when), ".txt",
                      format_report(host, device_name, report_timestamp(when),
                                    protocol, results));
}

fs::path ReportWriter::write_error(const std::string &host,
                                   const std::string &message,
                                   std::time_t when) const {
  fs::path error_dir = result_dir_ / "errors";

  // Same host twice within one second (duplicate inventory entries)
  return write_unique(error_dir, host + "_" + file_timestamp(when),
                      ".error.log", single_line(message));
}

} // namespace inspect
} // namespace devinspect
