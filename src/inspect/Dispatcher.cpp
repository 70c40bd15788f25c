#include "device-inspector/inspect/Dispatcher.hpp"
#include "device-inspector/errors.hpp"
#include "device-inspector/inspect/ReportWriter.hpp"
#include "device-inspector/inspect/WorkerPool.hpp"

#include <algorithm>
#include <ctime>
#include <future>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace devinspect {
namespace inspect {

Dispatcher::Dispatcher(Inspector &inspector, InspectionLogger &logger,
                       size_t workers)
    : inspector_(inspector), logger_(logger),
      workers_(workers == 0 ? default_worker_count() : workers) {}

size_t Dispatcher::default_worker_count() {
  return std::max<size_t>(1, std::thread::hardware_concurrency());
}

void Dispatcher::run_all(const std::vector<DeviceDescriptor> &devices,
                         const fs::path &result_dir) {
  std::error_code ec;
  fs::create_directories(result_dir, ec);
  if (ec || !fs::is_directory(result_dir)) {
    throw DispatchError("Cannot create result directory '" +
                        result_dir.string() + "': " +
                        (ec ? ec.message() : "not a directory"));
  }

  INSPECT_LOG_INFO(logger_, "*", "DISPATCH",
                   "Inspecting {} devices with {} workers into {}",
                   devices.size(), workers_, result_dir.string());

  std::vector<std::future<InspectionOutcome>> futures;
  futures.reserve(devices.size());
  {
    WorkerPool pool(std::min(workers_, std::max<size_t>(1, devices.size())));
    for (const auto &device : devices) {
      futures.push_back(pool.submit([this, &device, &result_dir]() {
        return run_isolated(device, result_dir);
      }));
    }

    size_t succeeded = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
      InspectionOutcome outcome = futures[i].get();
      if (outcome.success) {
        ++succeeded;
        INSPECT_LOG_INFO(logger_, outcome.host, "DISPATCH", "Succeeded ({})",
                         outcome.device_name);
      } else {
        INSPECT_LOG_WARN(logger_, outcome.host, "DISPATCH", "Failed: {}",
                         outcome.error_message);
      }
      if (listener_)
        listener_(outcome);
    }

    INSPECT_LOG_INFO(logger_, "*", "DISPATCH",
                     "Run complete: {} succeeded, {} failed", succeeded,
                     futures.size() - succeeded);
  }
}

InspectionOutcome Dispatcher::run_isolated(const DeviceDescriptor &descriptor,
                                           const fs::path &result_dir) {
  try {
    return inspector_.inspect(descriptor, result_dir);
  } catch (const std::exception &e) {
    return escaped_failure(descriptor, result_dir, e.what());
  } catch (...) {
    // Recorded as this device's failure so the other outcomes still arrive
    return escaped_failure(descriptor, result_dir, "unknown exception");
  }
}

InspectionOutcome
Dispatcher::escaped_failure(const DeviceDescriptor &descriptor,
                            const fs::path &result_dir,
                            const std::string &message) {
  InspectionOutcome outcome;
  outcome.host = descriptor.host;
  outcome.error_message = std::string(INSPECTION_FAILURE_PREFIX) + message;
  INSPECT_LOG_ERROR(logger_, descriptor.host, "DISPATCH",
                    "Unexpected failure escaped inspection: {}", message);
  try {
    outcome.error_path = ReportWriter(result_dir).write_error(
        descriptor.host, outcome.error_message, std::time(nullptr));
  } catch (const ReportWriteError &write_error) {
    INSPECT_LOG_ERROR(logger_, descriptor.host, "REPORT",
                      "Failed to write error artifact: {}",
                      write_error.what());
  }
  return outcome;
}

} // namespace inspect
} // namespace devinspect
