#include "device-inspector/Logger.hpp"

namespace devinspect {

// Process-wide instance used by the CLI
InspectionLogger &InspectionLogger::instance() {
  static InspectionLogger logger;
  return logger;
}

} // namespace devinspect
