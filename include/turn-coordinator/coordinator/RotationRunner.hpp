#pragma once
#include "turn-coordinator/RotationConfig.hpp"
#include "turn-coordinator/coordinator/Participant.hpp"
#include "turn-coordinator/coordinator/TurnCoordinator.hpp"
#include "turn-coordinator/export.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace turncoord {

struct GrantRecord {
  uint64_t turn;
  size_t participant;
};

struct ParticipantReport {
  std::string name;
  size_t index = 0;
  uint64_t granted = 0;
  uint64_t timed_out = 0;
  bool cancelled = false;
  bool gave_up = false;
};

struct TURN_COORDINATOR_API RotationReport {
  std::vector<GrantRecord> grants;
  std::vector<ParticipantReport> participants;
  uint64_t final_turn = 0;
  bool completed = false;
  bool cancelled = false;
  std::chrono::milliseconds elapsed{0};

  /// True if grants are turns 0,1,2,... served by participants 0,1,..,N-1,0,..
  bool is_round_robin() const;

  nlohmann::json to_json() const;
};

/// Drives a configured rotation: one thread per participant, each taking
/// `rounds` turns through a shared TurnCoordinator.
class TURN_COORDINATOR_API RotationRunner {
public:
  explicit RotationRunner(RotationConfig config);
  virtual ~RotationRunner() = default;

  RotationRunner(const RotationRunner &) = delete;
  RotationRunner &operator=(const RotationRunner &) = delete;

  /// Run to completion (or until stop()); blocks until all threads exit.
  /// A runner can be run once.
  RotationReport run();

  /// Shut down the coordinator; safe from any thread, including signal
  /// watchers, and safe to call more than once
  void stop();

  const RotationConfig &config() const { return config_; }
  std::shared_ptr<TurnCoordinator> coordinator() const { return coordinator_; }

protected:
  /// Start the thread that drives one participant. If this throws, run()
  /// shuts the coordinator down and joins the threads already started.
  virtual std::thread spawn_participant(Participant participant,
                                        ParticipantReport &report);

private:
  void participant_loop(Participant participant, ParticipantReport &report);

  RotationConfig config_;
  std::shared_ptr<TurnCoordinator> coordinator_;

  std::mutex grants_mutex_;
  std::vector<GrantRecord> grants_;
  bool started_{false};
};

} // namespace turncoord
