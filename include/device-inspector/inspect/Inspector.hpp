#pragma once
#include "device-inspector/Logger.hpp"
#include "device-inspector/export.h"
#include "device-inspector/session/SessionConnector.hpp"
#include "device-inspector/types.hpp"

#include <filesystem>

namespace devinspect {
namespace inspect {

/// Connection failure text written to error artifacts
extern const char *const CONNECT_FAILURE_TEXT;
/// Prefix of inspection failure messages
extern const char *const INSPECTION_FAILURE_PREFIX;

/// Runs one device end to end: connect, discover the device name, run the
/// commands in order, sanitize, write the report. The session is always
/// closed. The first failing command aborts the device.
class DEVICE_INSPECTOR_API Inspector {
public:
  Inspector(session::SessionConnector &connector, InspectionLogger &logger);
  virtual ~Inspector() = default;

  /// Never throws for device failures; they are reported in the outcome and
  /// an error artifact.
  virtual InspectionOutcome inspect(const DeviceDescriptor &descriptor,
                                    const std::filesystem::path &result_dir);

private:
  std::filesystem::path record_failure(const std::filesystem::path &result_dir,
                                       const std::string &host,
                                       const std::string &message,
                                       std::time_t when);

  session::SessionConnector &connector_;
  InspectionLogger &logger_;
};

} // namespace inspect
} // namespace devinspect
