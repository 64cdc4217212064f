#include "turn-coordinator/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace turncoord {

static const char *kLoggerName = "turn";

// DLL-safe singleton implementation
CoordinatorLogger &CoordinatorLogger::instance() {
  static CoordinatorLogger logger;
  return logger;
}

void CoordinatorLogger::init(const std::string &log_file,
                             spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);

  // If already initialized, just update level
  if (logger_) {
    logger_->set_level(level);
    logger_->flush_on(level);
    return;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_level(spdlog::level::info);
  std::vector<spdlog::sink_ptr> sinks{console_sink};

  try {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Cannot open log file {}, logging to console only: {}\n",
               log_file, ex.what());
  }

  logger_ =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger_->set_level(level);
  logger_->flush_on(level);

  spdlog::drop(kLoggerName);
  spdlog::register_logger(logger_);
}

void CoordinatorLogger::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  spdlog::drop(kLoggerName);
  logger_.reset();
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  return spdlog::level::info;
}

} // namespace turncoord
