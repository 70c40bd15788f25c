#pragma once
#include "device-inspector/types.hpp"

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace devinspect {
namespace inspect {

/// Persists per-device reports and one-line error artifacts under a result
/// directory:
///
///   <result_dir>/<host>__<device name>/<YYYYmmdd-HHMMSS>.txt
///   <result_dir>/errors/<host>_<YYYYmmdd-HHMMSS>.error.log
///
/// A file name already taken (same host within one second) gets a "-N"
/// suffix before the extension. Methods throw ReportWriteError on filesystem
/// failures.
class ReportWriter {
public:
  explicit ReportWriter(std::filesystem::path result_dir);

  std::filesystem::path write_report(const std::string &host,
                                     const std::string &device_name,
                                     LoginProtocol protocol,
                                     const std::vector<CommandResult> &results,
                                     std::time_t when) const;

  std::filesystem::path write_error(const std::string &host,
                                    const std::string &message,
                                    std::time_t when) const;

  const std::filesystem::path &result_dir() const { return result_dir_; }

  static std::string format_report(const std::string &host,
                                   const std::string &device_name,
                                   const std::string &inspection_time,
                                   LoginProtocol protocol,
                                   const std::vector<CommandResult> &results);

  /// Replace any of \ / * ? : " < > | with '_'
  static std::string sanitize_device_name(const std::string &device_name);

  static std::string file_timestamp(std::time_t when);   // 20240131-235959
  static std::string report_timestamp(std::time_t when); // 2024-01-31 23:59:59

private:
  std::filesystem::path result_dir_;
};

} // namespace inspect
} // namespace devinspect
