#include "device-inspector/inspect/Inspector.hpp"
#include "device-inspector/OutputSanitizer.hpp"
#include "device-inspector/errors.hpp"
#include "device-inspector/inspect/ReportWriter.hpp"

#include <ctime>
#include <fmt/format.h>

namespace devinspect {
namespace inspect {

const char *const CONNECT_FAILURE_TEXT = "设备连接失败，无法获取设备名称。";
const char *const INSPECTION_FAILURE_PREFIX = "巡检过程中发生错误: ";

namespace {
// Closes the session on every exit path
class SessionCloser {
public:
  explicit SessionCloser(session::Session &session) : session_(session) {}
  ~SessionCloser() { session_.close(); }

  SessionCloser(const SessionCloser &) = delete;
  SessionCloser &operator=(const SessionCloser &) = delete;

private:
  session::Session &session_;
};
} // namespace

Inspector::Inspector(session::SessionConnector &connector,
                     InspectionLogger &logger)
    : connector_(connector), logger_(logger) {}

std::filesystem::path
Inspector::record_failure(const std::filesystem::path &result_dir,
                          const std::string &host, const std::string &message,
                          std::time_t when) {
  try {
    return ReportWriter(result_dir).write_error(host, message, when);
  } catch (const ReportWriteError &e) {
    INSPECT_LOG_ERROR(logger_, host, "REPORT",
                      "Failed to write error artifact: {}", e.what());
    return {};
  }
}

InspectionOutcome Inspector::inspect(const DeviceDescriptor &descriptor,
                                     const std::filesystem::path &result_dir) {
  const std::string &host = descriptor.host;
  const std::time_t started = std::time(nullptr);

  InspectionOutcome outcome;
  outcome.host = host;

  auto connected = connector_.connect(descriptor);
  if (!connected.ok()) {
    const auto &error = connected.error();
    outcome.error_message =
        fmt::format("{} ({}: {})", CONNECT_FAILURE_TEXT,
                    session::to_string(error.kind), error.message);
    outcome.error_path =
        record_failure(result_dir, host, outcome.error_message, started);
    INSPECT_LOG_ERROR(logger_, host, "INSPECT",
                      "Connection failed, skipping inspection");
    return outcome;
  }

  std::unique_ptr<session::Session> session = connected.take_session();
  SessionCloser closer(*session);

  try {
    outcome.device_name = session->discover_device_name();
    INSPECT_LOG_INFO(logger_, host, "INSPECT", "Device name: {}",
                     outcome.device_name);

    OutputSanitizer sanitizer(session->profile().more_pattern);
    std::vector<CommandResult> results;
    results.reserve(descriptor.commands.size());
    for (const auto &command : descriptor.commands) {
      INSPECT_LOG_DEBUG(logger_, host, "COMMAND", "Running '{}'", command);
      session->send_command(command);
      std::string raw = session->read_until_prompt();
      results.push_back(
          {command, sanitizer.sanitize(raw, command, outcome.device_name)});
    }

    outcome.report_path =
        ReportWriter(result_dir)
            .write_report(host, outcome.device_name,
                          descriptor.login_protocol, results, started);
    outcome.success = true;
    INSPECT_LOG_INFO(logger_, host, "INSPECT",
                     "Inspection complete, report saved to {}",
                     outcome.report_path.string());
  } catch (const std::exception &e) {
    outcome.error_message = std::string(INSPECTION_FAILURE_PREFIX) + e.what();
    outcome.error_path =
        record_failure(result_dir, host, outcome.error_message, started);
    INSPECT_LOG_ERROR(logger_, host, "INSPECT", "Inspection failed: {}",
                      e.what());
  }
  return outcome;
}

} // namespace inspect
} // namespace devinspect
