#pragma once
#include "device-inspector/Logger.hpp"
#include "device-inspector/export.h"
#include "device-inspector/inspect/Inspector.hpp"
#include "device-inspector/types.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace devinspect {
namespace inspect {

/// Fans an inventory out over a WorkerPool, one task per device.
/// A failing device never affects the others.
class DEVICE_INSPECTOR_API Dispatcher {
public:
  using OutcomeListener = std::function<void(const InspectionOutcome &)>;

  /// `workers` == 0 sizes the pool to the hardware concurrency
  Dispatcher(Inspector &inspector, InspectionLogger &logger,
             size_t workers = 0);

  /// Called on the run_all() thread once per device, in submission order
  void set_outcome_listener(OutcomeListener listener) {
    listener_ = std::move(listener);
  }

  /// Creates `result_dir`, inspects every device and returns when all tasks
  /// have completed. Throws DispatchError if `result_dir` cannot be created;
  /// nothing is dispatched in that case.
  void run_all(const std::vector<DeviceDescriptor> &devices,
               const std::filesystem::path &result_dir);

  static size_t default_worker_count();

private:
  InspectionOutcome run_isolated(const DeviceDescriptor &descriptor,
                                 const std::filesystem::path &result_dir);
  InspectionOutcome escaped_failure(const DeviceDescriptor &descriptor,
                                    const std::filesystem::path &result_dir,
                                    const std::string &message);

  Inspector &inspector_;
  InspectionLogger &logger_;
  size_t workers_;
  OutcomeListener listener_;
};

} // namespace inspect
} // namespace devinspect
