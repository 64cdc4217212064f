#pragma once
#include "turn-coordinator/coordinator/TurnCoordinator.hpp"
#include "turn-coordinator/export.h"

#include <memory>

namespace turncoord {

/// Handle binding one registered participant index to a shared coordinator
class TURN_COORDINATOR_API Participant {
public:
  /// Register with coordinator; throws RegistrationError when it is full
  static Participant join(std::shared_ptr<TurnCoordinator> coordinator);

  TurnResult take_turn(Timeout timeout = kNoTimeout);
  TurnResult take_turn(Timeout timeout, const TurnAction &action);

  size_t index() const { return index_; }
  const std::shared_ptr<TurnCoordinator> &coordinator() const {
    return coordinator_;
  }

private:
  Participant(std::shared_ptr<TurnCoordinator> coordinator, size_t index);

  std::shared_ptr<TurnCoordinator> coordinator_;
  size_t index_;
};

} // namespace turncoord
