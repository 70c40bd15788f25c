#include "device-inspector/Clock.hpp"
#include "device-inspector/Logger.hpp"
#include "device-inspector/VendorRegistry.hpp"
#include "device-inspector/config/InventoryLoader.hpp"
#include "device-inspector/errors.hpp"
#include "device-inspector/inspect/Dispatcher.hpp"
#include "device-inspector/inspect/Inspector.hpp"
#include "device-inspector/session/SessionConnector.hpp"
#include "device-inspector/transport/TransportFactory.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace devinspect;

void print_usage() {
  std::cout << "Usage: device-inspector <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run <inventory.yaml>        Inspect every device in the "
               "inventory\n";
  std::cout << "  validate <inventory.yaml>   Print resolved devices as JSON\n";
  std::cout << "  vendors                     List vendor profiles\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --result-dir <dir>   Report directory (default: 巡检结果)\n";
  std::cout << "  --vendors <file>     YAML vendor overrides\n";
  std::cout << "  --log-level <level>  Log level (default: debug)\n";
  std::cout << "  --log-file <file>    Log file (default: "
               "network_inspection.log)\n";
  std::cout << "\nExamples:\n";
  std::cout << "  device-inspector validate devices.yaml\n";
  std::cout << "  device-inspector run devices.yaml --result-dir reports\n";
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "trace")
    return spdlog::level::trace;
  return spdlog::level::debug;
}

struct CliOptions {
  std::string inventory;
  std::string result_dir = "巡检结果";
  std::string vendors_file;
  std::string log_level = "debug";
  std::string log_file = "network_inspection.log";
};

// Returns false on an unknown option
bool parse_options(int argc, char **argv, CliOptions &opts) {
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--result-dir" && i + 1 < argc) {
      opts.result_dir = argv[++i];
    } else if (arg == "--vendors" && i + 1 < argc) {
      opts.vendors_file = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      opts.log_level = argv[++i];
    } else if (arg == "--log-file" && i + 1 < argc) {
      opts.log_file = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && opts.inventory.empty()) {
      opts.inventory = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    }
  }
  return true;
}

VendorRegistry build_registry(const CliOptions &opts) {
  VendorRegistry::Builder builder;
  builder.add_builtin_profiles();
  if (!opts.vendors_file.empty()) {
    builder.load_yaml(opts.vendors_file);
  }
  return builder.build();
}

int cmd_run(int argc, char **argv);
int cmd_validate(int argc, char **argv);
int cmd_vendors(int argc, char **argv);

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "run") {
    return cmd_run(argc - 2, argv + 2);
  } else if (command == "validate") {
    return cmd_validate(argc - 2, argv + 2);
  } else if (command == "vendors") {
    return cmd_vendors(argc - 2, argv + 2);
  } else if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }
}

int cmd_run(int argc, char **argv) {
  CliOptions opts;
  if (!parse_options(argc, argv, opts) || opts.inventory.empty()) {
    std::cerr << "Usage: device-inspector run <inventory.yaml> [options]\n";
    return 1;
  }

  auto &logger = InspectionLogger::instance();
  logger.init(opts.log_file, parse_log_level(opts.log_level));

  int exit_code = 0;
  try {
    VendorRegistry registry = build_registry(opts);

    config::InventoryLoader loader(registry, logger);
    std::vector<DeviceDescriptor> devices = loader.load_file(opts.inventory);
    if (devices.empty()) {
      std::cerr << "No valid devices found in " << opts.inventory << "\n";
      logger.shutdown();
      return 1;
    }

    SteadyClock clock;
    transport::NetworkTransportFactory transports;
    session::SessionConnector connector(registry, transports, clock, logger);
    inspect::Inspector inspector(connector, logger);
    inspect::Dispatcher dispatcher(inspector, logger);

    size_t succeeded = 0;
    size_t failed = 0;
    dispatcher.set_outcome_listener([&](const InspectionOutcome &outcome) {
      if (outcome.success) {
        ++succeeded;
        std::cout << "  OK    " << outcome.host << " (" << outcome.device_name
                  << ") -> " << outcome.report_path.string() << "\n";
      } else {
        ++failed;
        std::cout << "  FAIL  " << outcome.host << ": "
                  << outcome.error_message << "\n";
      }
    });

    std::cout << "Inspecting " << devices.size() << " devices...\n";
    dispatcher.run_all(devices, opts.result_dir);
    std::cout << "\nDone: " << succeeded << " succeeded, " << failed
              << " failed. Reports in " << opts.result_dir << "\n";
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    exit_code = 1;
  } catch (const DispatchError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    exit_code = 1;
  }

  logger.shutdown();
  return exit_code;
}

int cmd_validate(int argc, char **argv) {
  CliOptions opts;
  if (!parse_options(argc, argv, opts) || opts.inventory.empty()) {
    std::cerr
        << "Usage: device-inspector validate <inventory.yaml> [--vendors F]\n";
    return 1;
  }

  // Loader warnings go to the console only
  auto console = std::make_shared<spdlog::logger>(
      "validate", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  InspectionLogger logger(console);

  try {
    VendorRegistry registry = build_registry(opts);
    config::InventoryLoader loader(registry, logger);
    auto devices = loader.load_file(opts.inventory);

    nlohmann::json out = nlohmann::json::array();
    for (const auto &device : devices) {
      out.push_back(config::descriptor_to_json(device));
    }
    std::cout << out.dump(2) << "\n";
    return devices.empty() ? 1 : 0;
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_vendors(int argc, char **argv) {
  CliOptions opts;
  if (!parse_options(argc, argv, opts)) {
    std::cerr << "Usage: device-inspector vendors [--vendors F]\n";
    return 1;
  }

  try {
    VendorRegistry registry = build_registry(opts);
    std::cout << "Vendor profiles (" << registry.size() << "):\n";
    for (const auto &tag : registry.tags()) {
      const VendorProfile *profile = registry.find(tag);
      std::cout << "  " << tag;
      if (!profile->display_name.empty())
        std::cout << " [" << profile->display_name << "]";
      std::cout << "  ssh=" << profile->device_type(LoginProtocol::SSH)
                << " telnet=" << profile->device_type(LoginProtocol::TELNET);
      if (profile->legacy_telnet)
        std::cout << " (legacy telnet login)";
      std::cout << "\n";
    }
    return 0;
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }
}
