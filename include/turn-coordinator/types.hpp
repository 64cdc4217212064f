#pragma once
#include "turn-coordinator/export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace turncoord {

/// Outcome of a single take_turn() call
enum class TurnResult {
  Granted,           // turn taken and counter advanced
  TimedOut,          // deadline passed before the turn came around
  Cancelled,         // coordinator shut down
  InvalidParticipant // index outside [0, participant_count)
};

TURN_COORDINATOR_API const char *to_string(TurnResult result);

/// Whether the caller's action runs with the coordinator lock held
enum class ActionMode { Unlocked, LockHeld };

TURN_COORDINATOR_API const char *to_string(ActionMode mode);

/// Per-wait timeout; std::nullopt waits forever
using Timeout = std::optional<std::chrono::milliseconds>;
inline constexpr Timeout kNoTimeout = std::nullopt;

struct TurnState {
  uint64_t current_turn = 0;
  size_t participant_count = 0;
};

struct TurnStats {
  uint64_t granted = 0;
  uint64_t timed_out = 0;
  uint64_t cancelled = 0;
  uint64_t invalid = 0;
  size_t waiting = 0;
};

/// Thrown when a coordinator is constructed with zero participants
class ConstructionError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// Thrown when more participants register than the coordinator has slots
class RegistrationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Thrown when a rotation config cannot be read or fails validation
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ValidationError {
  std::string path;
  std::string message;
};

struct ValidationResult {
  bool valid = true;
  std::vector<ValidationError> errors;
};

} // namespace turncoord
