#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace devinspect {

/// Centralized logging with device host and inspection stage context.
///
/// The process-wide instance is initialized once by the CLI and shut down on
/// exit. Core classes receive a reference, so tests can hand them a logger
/// built on any spdlog sink.
class InspectionLogger {
public:
  static InspectionLogger &instance();

  InspectionLogger() = default;
  explicit InspectionLogger(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  InspectionLogger(const InspectionLogger &) = delete;
  InspectionLogger &operator=(const InspectionLogger &) = delete;

  // Initialize with file and console sinks
  void init(const std::string &log_file = "network_inspection.log",
            spdlog::level::level_enum level = spdlog::level::debug) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("inspection", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(spdlog::level::warn);

      if (!spdlog::get("inspection")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Flush pending records and drop the logger from the spdlog registry.
  // A later init() recreates the sinks.
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
      logger_->flush();
    }
    spdlog::drop("inspection");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &host, const std::string &stage,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, host, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &host, const std::string &stage,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, host, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &host, const std::string &stage,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, host, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &host, const std::string &stage,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, host, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &host, const std::string &stage,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, host, stage, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &host,
           const std::string &stage, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [host] [stage] message
    std::string prefix = fmt::format("[{}] [{}] ", host, stage);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define INSPECT_LOG_TRACE(logger, host, stage, ...)                            \
  (logger).trace(host, stage, __VA_ARGS__)
#define INSPECT_LOG_DEBUG(logger, host, stage, ...)                            \
  (logger).debug(host, stage, __VA_ARGS__)
#define INSPECT_LOG_INFO(logger, host, stage, ...)                             \
  (logger).info(host, stage, __VA_ARGS__)
#define INSPECT_LOG_WARN(logger, host, stage, ...)                             \
  (logger).warn(host, stage, __VA_ARGS__)
#define INSPECT_LOG_ERROR(logger, host, stage, ...)                            \
  (logger).error(host, stage, __VA_ARGS__)

} // namespace devinspect
