#include "../test_utils/TestFixtures.hpp"
#include "turn-coordinator/coordinator/TurnCoordinator.hpp"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace turncoord;
using namespace std::chrono_literals;

class RoundRobinStressTest : public test::CoordinatorTest {
protected:
  // Counts callers inside a granted turn and remembers the peak
  struct SectionProbe {
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    void enter() {
      int now = ++inside;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
    }
    void leave() { --inside; }
  };
};

TEST_F(RoundRobinStressTest, MutualExclusionUnderContention) {
  constexpr size_t kParticipants = 8;
  constexpr size_t kRounds = 200;
  coordinator_ = std::make_shared<TurnCoordinator>(kParticipants);

  SectionProbe probe;
  std::vector<uint64_t> served;
  served.reserve(kParticipants * kRounds);

  std::vector<std::thread> threads;
  for (size_t p = 0; p < kParticipants; p++) {
    threads.emplace_back([&, p]() {
      for (size_t r = 0; r < kRounds; r++) {
        auto result = coordinator_->take_turn(p, 5s, [&](uint64_t turn) {
          probe.enter();
          // Unsynchronized on purpose: only one turn may be in here
          served.push_back(turn);
          std::this_thread::yield();
          probe.leave();
        });
        ASSERT_EQ(result, TurnResult::Granted);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(probe.peak.load(), 1);
  ASSERT_EQ(served.size(), kParticipants * kRounds);
  for (size_t i = 0; i < served.size(); i++) {
    EXPECT_EQ(served[i], i);
  }
}

TEST_F(RoundRobinStressTest, SameIndexFromTwoThreads) {
  coordinator_ = std::make_shared<TurnCoordinator>(1);
  SectionProbe probe;
  std::atomic<int> granted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 2; t++) {
    threads.emplace_back([&]() {
      for (int r = 0; r < 500; r++) {
        auto result = coordinator_->take_turn(0, 5s, [&](uint64_t) {
          probe.enter();
          std::this_thread::yield();
          probe.leave();
        });
        if (result == TurnResult::Granted) {
          ++granted;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(probe.peak.load(), 1);
  EXPECT_EQ(granted.load(), 1000);
  EXPECT_EQ(coordinator_->current_turn(), 1000u);
}

TEST_F(RoundRobinStressTest, NoMissedWakeupsWithInjectedSpuriousWakes) {
  constexpr size_t kParticipants = 5;
  constexpr size_t kRounds = 100;
  coordinator_ = std::make_shared<TurnCoordinator>(kParticipants);

  std::atomic<bool> running{true};
  std::thread noise([&]() {
    while (running) {
      coordinator_->wake_waiters();
      std::this_thread::yield();
    }
  });

  std::mutex order_mutex;
  std::vector<size_t> order;
  std::vector<std::thread> threads;
  for (size_t p = 0; p < kParticipants; p++) {
    threads.emplace_back([&, p]() {
      for (size_t r = 0; r < kRounds; r++) {
        // No timeout: a lost wakeup would hang here
        auto result = coordinator_->take_turn(p, kNoTimeout, [&](uint64_t) {
          std::lock_guard lock(order_mutex);
          order.push_back(p);
        });
        ASSERT_EQ(result, TurnResult::Granted);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  running = false;
  noise.join();

  ASSERT_EQ(order.size(), kParticipants * kRounds);
  for (size_t i = 0; i < order.size(); i++) {
    EXPECT_EQ(order[i], i % kParticipants) << "at grant " << i;
  }
}

TEST_F(RoundRobinStressTest, LateArrivalsInReverseOrder) {
  constexpr size_t kParticipants = 6;
  coordinator_ = std::make_shared<TurnCoordinator>(kParticipants);

  std::mutex order_mutex;
  std::vector<size_t> order;
  std::vector<std::thread> threads;

  // Highest index arrives first; everyone must still be served in order
  for (size_t i = 0; i < kParticipants; i++) {
    size_t p = kParticipants - 1 - i;
    threads.emplace_back([&, p]() {
      for (int r = 0; r < 3; r++) {
        auto result = coordinator_->take_turn(p, kNoTimeout, [&](uint64_t) {
          std::lock_guard lock(order_mutex);
          order.push_back(p);
        });
        ASSERT_EQ(result, TurnResult::Granted);
      }
    });
    std::this_thread::sleep_for(5ms);
  }
  for (auto &t : threads) {
    t.join();
  }

  ASSERT_EQ(order.size(), kParticipants * 3);
  for (size_t i = 0; i < order.size(); i++) {
    EXPECT_EQ(order[i], i % kParticipants);
  }
}

TEST_F(RoundRobinStressTest, ShutdownMidRotation) {
  constexpr size_t kParticipants = 4;
  coordinator_ = std::make_shared<TurnCoordinator>(kParticipants);

  std::vector<std::atomic<int>> cancelled(kParticipants);
  std::vector<std::thread> threads;
  for (size_t p = 0; p < kParticipants; p++) {
    threads.emplace_back([&, p]() {
      while (true) {
        auto result = coordinator_->take_turn(p, 10ms);
        if (result == TurnResult::Cancelled) {
          ++cancelled[p];
          return;
        }
        ASSERT_NE(result, TurnResult::InvalidParticipant);
      }
    });
  }

  ASSERT_TRUE(test::wait_until(
      [&]() { return coordinator_->current_turn() >= 100; }));
  coordinator_->shutdown();
  for (auto &t : threads) {
    t.join();
  }

  for (size_t p = 0; p < kParticipants; p++) {
    EXPECT_EQ(cancelled[p].load(), 1);
  }
  auto final_turn = coordinator_->current_turn();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(coordinator_->current_turn(), final_turn);
}
