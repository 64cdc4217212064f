#include "turn-coordinator/Logger.hpp"

#include <filesystem>
#include <gtest/gtest.h>

using namespace turncoord;

TEST(Logger, ParseLogLevel) {
  EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
  EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("bogus"), spdlog::level::info);
}

TEST(Logger, InitShutdownReinit) {
  auto &logger = CoordinatorLogger::instance();

  logger.init("logger_test.log", spdlog::level::debug);
  auto registered = spdlog::get("turn");
  ASSERT_NE(registered, nullptr);
  EXPECT_EQ(registered->sinks().size(), 2u);
  EXPECT_EQ(registered->level(), spdlog::level::debug);
  LOG_INFO("TEST", "INIT", "Logger initialized at {}", "debug");

  // Re-init only changes the level
  logger.init("other.log", spdlog::level::warn);
  EXPECT_EQ(spdlog::get("turn"), registered);
  EXPECT_EQ(registered->level(), spdlog::level::warn);

  logger.shutdown();
  EXPECT_EQ(spdlog::get("turn"), nullptr);
  // Logging without a logger is a no-op
  LOG_WARN("TEST", "DROPPED", "value={}", 42);

  logger.init("logger_test.log", spdlog::level::info);
  EXPECT_NE(spdlog::get("turn"), nullptr);
}

TEST(Logger, UnwritableLogFileFallsBackToConsole) {
  auto &logger = CoordinatorLogger::instance();
  logger.shutdown();

  // A directory cannot be opened as the log file
  auto dir = std::filesystem::temp_directory_path();
  logger.init(dir.string(), spdlog::level::info);

  auto registered = spdlog::get("turn");
  ASSERT_NE(registered, nullptr);
  EXPECT_EQ(registered->sinks().size(), 1u);
  LOG_INFO("TEST", "FALLBACK", "Console-only logging at {}", dir.string());

  logger.shutdown();
  logger.init("logger_test.log", spdlog::level::info);
}
