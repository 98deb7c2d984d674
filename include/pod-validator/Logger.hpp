#pragma once
#include "pod-validator/export.h"
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace podval {

/// Centralized logging with subject file and validation stage context.
/// Everything goes to stderr (and optionally a file); stdout carries only
/// diagnostics.
class POD_VALIDATOR_API ValidatorLogger {
public:
  static ValidatorLogger &instance();

  // Initialize with a console sink and an optional rotating file sink
  void init(spdlog::level::level_enum level = spdlog::level::warn,
            const std::string &log_file = "") {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1024 * 1024 * 5, 2); // 5MB, 2 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("pod-validator",
                                                 sinks.begin(), sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      // Don't register if already exists
      if (!spdlog::get("pod-validator")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Drop the logger from the spdlog registry so a later init() recreates
  // the sinks (tests switch log files between cases).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("pod-validator");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &subject, const std::string &stage,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, subject, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &subject, const std::string &stage,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, subject, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &subject, const std::string &stage,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, subject, stage, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &subject, const std::string &stage,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, subject, stage, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ValidatorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &subject,
           const std::string &stage, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [subject] [stage] message
    std::string prefix = fmt::format("[{}] [{}] ", subject, stage);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(subject, stage, ...)                                         \
  podval::ValidatorLogger::instance().trace(subject, stage, __VA_ARGS__)
#define LOG_DEBUG(subject, stage, ...)                                         \
  podval::ValidatorLogger::instance().debug(subject, stage, __VA_ARGS__)
#define LOG_INFO(subject, stage, ...)                                          \
  podval::ValidatorLogger::instance().info(subject, stage, __VA_ARGS__)
#define LOG_WARN(subject, stage, ...)                                          \
  podval::ValidatorLogger::instance().warn(subject, stage, __VA_ARGS__)

} // namespace podval
