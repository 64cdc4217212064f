#include "turn-coordinator/coordinator/Participant.hpp"

#include <stdexcept>
#include <utility>

namespace turncoord {

Participant::Participant(std::shared_ptr<TurnCoordinator> coordinator,
                         size_t index)
    : coordinator_(std::move(coordinator)), index_(index) {}

Participant Participant::join(std::shared_ptr<TurnCoordinator> coordinator) {
  if (!coordinator) {
    throw std::invalid_argument("Participant::join requires a coordinator");
  }
  size_t index = coordinator->register_participant();
  return Participant(std::move(coordinator), index);
}

TurnResult Participant::take_turn(Timeout timeout) {
  return coordinator_->take_turn(index_, timeout);
}

TurnResult Participant::take_turn(Timeout timeout, const TurnAction &action) {
  return coordinator_->take_turn(index_, timeout, action);
}

} // namespace turncoord
