#pragma once
#include "turn-coordinator/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace turncoord {

/// Centralized logging with component and event context
class TURN_COORDINATOR_API CoordinatorLogger {
public:
  static CoordinatorLogger &instance();

  /// Console sink at info plus a rotating file sink at trace. A second call
  /// only changes the level. If the file cannot be opened, logs go to the
  /// console alone.
  void init(const std::string &log_file = "turn_coordinator.log",
            spdlog::level::level_enum level = spdlog::level::info);

  // Drop the logger so a later init() recreates the sinks (used by tests).
  void shutdown();

  template <typename... Args>
  void trace(const std::string &component, const std::string &event,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, event, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &event,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, event, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &event,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, event, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &event,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, event, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &event,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, event, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  CoordinatorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &event, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [event] message
    std::string prefix = fmt::format("[{}] [{}] ", component, event);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Parse "trace", "debug", "info", "warn" or "error"; anything else is info
TURN_COORDINATOR_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, event, ...)                                       \
  turncoord::CoordinatorLogger::instance().trace(component, event, __VA_ARGS__)
#define LOG_DEBUG(component, event, ...)                                       \
  turncoord::CoordinatorLogger::instance().debug(component, event, __VA_ARGS__)
#define LOG_INFO(component, event, ...)                                        \
  turncoord::CoordinatorLogger::instance().info(component, event, __VA_ARGS__)
#define LOG_WARN(component, event, ...)                                        \
  turncoord::CoordinatorLogger::instance().warn(component, event, __VA_ARGS__)
#define LOG_ERROR(component, event, ...)                                       \
  turncoord::CoordinatorLogger::instance().error(component, event, __VA_ARGS__)

} // namespace turncoord
