#pragma once
#include "turn-coordinator/export.h"
#include "turn-coordinator/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace turncoord {

/// Action run once per granted turn; receives the counter value being served
using TurnAction = std::function<void(uint64_t turn)>;

/// Grants each of N participants its turn in strict round-robin order.
///
/// All state lives behind one mutex and one condition variable. Waiters are
/// always woken with notify_all() and re-check their own predicate, so an
/// ineligible waiter never consumes a wakeup meant for the eligible one.
///
/// A participant that never calls take_turn() stalls the rotation for
/// everyone; fairness holds only among participants that keep polling.
class TURN_COORDINATOR_API TurnCoordinator {
public:
  /// Throws ConstructionError if participant_count is zero
  explicit TurnCoordinator(size_t participant_count,
                           ActionMode mode = ActionMode::Unlocked);
  ~TurnCoordinator();

  TurnCoordinator(const TurnCoordinator &) = delete;
  TurnCoordinator &operator=(const TurnCoordinator &) = delete;

  /// Wait for participant_index's turn and advance the counter by one
  TurnResult take_turn(size_t participant_index, Timeout timeout = kNoTimeout);

  /// Wait for participant_index's turn, run action, then advance the counter.
  /// In Unlocked mode the lock is released while action runs; the counter is
  /// advanced only after action returns. If action throws the turn is not
  /// advanced and the exception propagates. In LockHeld mode action must not
  /// call back into this coordinator.
  TurnResult take_turn(size_t participant_index, Timeout timeout,
                       const TurnAction &action);

  /// Cancel all blocked and future take_turn() calls. Idempotent.
  void shutdown();

  /// Broadcast on the condition without changing state
  void wake_waiters();

  /// Hand out the next unused participant index.
  /// Throws RegistrationError once every slot is taken.
  size_t register_participant();

  TurnState state() const;
  uint64_t current_turn() const;
  size_t participant_count() const { return participant_count_; }
  size_t eligible_participant() const;
  ActionMode action_mode() const { return mode_; }
  bool is_shutdown() const;

  /// Number of callers currently blocked waiting for their turn
  size_t waiting_count() const;

  TurnStats stats() const;

private:
  bool is_eligible(size_t participant_index) const;
  // Caller holds mutex_
  void finish_turn(size_t participant_index);

  const size_t participant_count_;
  const ActionMode mode_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t current_turn_{0};
  bool turn_in_progress_{false};
  bool cancelled_{false};
  size_t next_registration_{0};
  size_t waiting_{0};
  TurnStats stats_;
};

} // namespace turncoord
