#include "turn-coordinator/coordinator/TurnCoordinator.hpp"
#include "turn-coordinator/Logger.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace turncoord {

const char *to_string(TurnResult result) {
  switch (result) {
  case TurnResult::Granted:
    return "granted";
  case TurnResult::TimedOut:
    return "timed_out";
  case TurnResult::Cancelled:
    return "cancelled";
  case TurnResult::InvalidParticipant:
    return "invalid_participant";
  }
  return "unknown";
}

const char *to_string(ActionMode mode) {
  return mode == ActionMode::LockHeld ? "lock_held" : "unlocked";
}

// Saturating now() + timeout. A negative timeout is already expired; one the
// steady clock cannot represent yields nullopt, meaning no deadline.
static std::optional<std::chrono::steady_clock::time_point>
deadline_after(std::chrono::milliseconds timeout) {
  const auto now = std::chrono::steady_clock::now();
  if (timeout <= std::chrono::milliseconds::zero()) {
    return now;
  }
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::time_point::max() - now);
  if (timeout >= headroom) {
    return std::nullopt;
  }
  return now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                   timeout);
}

TurnCoordinator::TurnCoordinator(size_t participant_count, ActionMode mode)
    : participant_count_(participant_count), mode_(mode) {
  if (participant_count_ == 0) {
    LOG_ERROR("TURN", "CREATE", "Rejected coordinator with zero participants");
    throw ConstructionError("participant_count must be at least 1");
  }
  LOG_INFO("TURN", "CREATE", "Coordinator created: participants={} mode={}",
           participant_count_, to_string(mode_));
}

TurnCoordinator::~TurnCoordinator() {
  std::lock_guard lock(mutex_);
  if (waiting_ > 0) {
    LOG_WARN("TURN", "DESTROY",
             "Coordinator destroyed with {} participants still waiting",
             waiting_);
  }
  LOG_DEBUG("TURN", "DESTROY", "Coordinator destroyed at turn {}",
            current_turn_);
}

bool TurnCoordinator::is_eligible(size_t participant_index) const {
  return !turn_in_progress_ &&
         current_turn_ % participant_count_ == participant_index;
}

TurnResult TurnCoordinator::take_turn(size_t participant_index,
                                      Timeout timeout) {
  return take_turn(participant_index, timeout, TurnAction{});
}

TurnResult TurnCoordinator::take_turn(size_t participant_index,
                                      Timeout timeout,
                                      const TurnAction &action) {
  if (participant_index >= participant_count_) {
    std::lock_guard lock(mutex_);
    ++stats_.invalid;
    LOG_WARN("TURN", "INVALID",
             "Participant index {} out of range [0, {})", participant_index,
             participant_count_);
    return TurnResult::InvalidParticipant;
  }

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (timeout) {
    deadline = deadline_after(*timeout);
    if (!deadline) {
      LOG_DEBUG("TURN", "WAIT",
                "Timeout {}ms exceeds the clock range; waiting without a "
                "deadline",
                timeout->count());
    }
  }

  std::unique_lock lock(mutex_);

  // A wakeup carries no information; re-check after every return from wait
  while (!cancelled_ && !is_eligible(participant_index)) {
    ++waiting_;
    std::cv_status status = std::cv_status::no_timeout;
    if (deadline) {
      status = cv_.wait_until(lock, *deadline);
    } else {
      cv_.wait(lock);
    }
    --waiting_;

    if (status == std::cv_status::timeout && !cancelled_ &&
        !is_eligible(participant_index)) {
      ++stats_.timed_out;
      LOG_TRACE("TURN", "TIMEOUT",
                "Participant {} timed out waiting (turn={}, eligible={})",
                participant_index, current_turn_,
                current_turn_ % participant_count_);
      return TurnResult::TimedOut;
    }
  }

  if (cancelled_) {
    ++stats_.cancelled;
    LOG_TRACE("TURN", "CANCELLED", "Participant {} observed shutdown",
              participant_index);
    return TurnResult::Cancelled;
  }

  const uint64_t turn = current_turn_;
  turn_in_progress_ = true;

  if (action) {
    if (mode_ == ActionMode::Unlocked) {
      lock.unlock();
    }
    try {
      action(turn);
    } catch (...) {
      if (!lock.owns_lock()) {
        lock.lock();
      }
      turn_in_progress_ = false;
      LOG_WARN("TURN", "ABORT",
               "Action for participant {} threw; turn {} not advanced",
               participant_index, turn);
      cv_.notify_all();
      throw;
    }
    if (!lock.owns_lock()) {
      lock.lock();
    }
  }

  finish_turn(participant_index);
  return TurnResult::Granted;
}

void TurnCoordinator::finish_turn(size_t participant_index) {
  ++current_turn_;
  turn_in_progress_ = false;
  ++stats_.granted;
  LOG_TRACE("TURN", "GRANT", "Participant {} completed turn {}",
            participant_index, current_turn_ - 1);

  // The next eligible waiter is indistinguishable from the others
  cv_.notify_all();
}

void TurnCoordinator::shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    LOG_INFO("TURN", "SHUTDOWN",
             "Coordinator shutting down at turn {} ({} waiting)",
             current_turn_, waiting_);
  }
  cv_.notify_all();
}

void TurnCoordinator::wake_waiters() {
  std::lock_guard lock(mutex_);
  cv_.notify_all();
}

size_t TurnCoordinator::register_participant() {
  std::lock_guard lock(mutex_);
  if (next_registration_ >= participant_count_) {
    LOG_WARN("TURN", "REGISTER", "All {} participant slots are taken",
             participant_count_);
    throw RegistrationError("all " + std::to_string(participant_count_) +
                            " participant slots are taken");
  }
  size_t index = next_registration_++;
  LOG_DEBUG("TURN", "REGISTER", "Registered participant {}/{}", index + 1,
            participant_count_);
  return index;
}

TurnState TurnCoordinator::state() const {
  std::lock_guard lock(mutex_);
  return TurnState{current_turn_, participant_count_};
}

uint64_t TurnCoordinator::current_turn() const {
  std::lock_guard lock(mutex_);
  return current_turn_;
}

size_t TurnCoordinator::eligible_participant() const {
  std::lock_guard lock(mutex_);
  return current_turn_ % participant_count_;
}

bool TurnCoordinator::is_shutdown() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

size_t TurnCoordinator::waiting_count() const {
  std::lock_guard lock(mutex_);
  return waiting_;
}

TurnStats TurnCoordinator::stats() const {
  std::lock_guard lock(mutex_);
  TurnStats out = stats_;
  out.waiting = waiting_;
  return out;
}

} // namespace turncoord
