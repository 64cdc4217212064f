#include "TestFixtures.hpp"
#include "turn-coordinator/Logger.hpp"

#include <fstream>
#include <thread>

namespace turncoord {
namespace test {

bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

void CoordinatorTest::SetUp() {
  CoordinatorLogger::instance().init("test.log", spdlog::level::debug);
}

void CoordinatorTest::TearDown() {
  if (coordinator_) {
    coordinator_->shutdown();
  }
  coordinator_.reset();
}

bool CoordinatorTest::wait_for_waiters(size_t count,
                                       std::chrono::milliseconds timeout) {
  return wait_until(
      [this, count]() { return coordinator_->waiting_count() >= count; },
      timeout);
}

void ConfigFileTest::SetUp() {
  CoordinatorLogger::instance().init("test.log", spdlog::level::debug);

  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  temp_dir_ = std::filesystem::temp_directory_path() /
              (std::string("turn_coordinator_") + info->test_suite_name() +
               "_" + info->name());
  std::filesystem::create_directories(temp_dir_);
}

void ConfigFileTest::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(temp_dir_, ec);
}

std::string ConfigFileTest::write_config(const std::string &name,
                                         const std::string &contents) {
  auto path = temp_dir_ / name;
  std::ofstream ofs(path);
  ofs << contents;
  return path.string();
}

} // namespace test
} // namespace turncoord
