#pragma once
#include "turn-coordinator/export.h"
#include "turn-coordinator/types.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace turncoord {

// Upper bounds accepted by RotationConfigLoader and the demo command
inline constexpr int64_t kMaxParticipants = 4096;
// One week
inline constexpr int64_t kMaxDurationMs = 7LL * 24 * 60 * 60 * 1000;

struct ParticipantSpec {
  std::string name;
  std::chrono::milliseconds start_delay{0};
};

struct TURN_COORDINATOR_API RotationConfig {
  std::vector<ParticipantSpec> participants;
  uint64_t rounds = 1;
  Timeout timeout = kNoTimeout;
  std::chrono::milliseconds work{0};
  ActionMode action_mode = ActionMode::Unlocked;
  uint32_t max_timeouts = 0; // consecutive; 0 retries forever
  std::string log_level = "info";
  std::string log_file = "turn_coordinator.log";

  /// Config with `count` participants named p0, p1, ...
  static RotationConfig with_participants(size_t count);

  nlohmann::json to_json() const;
};

class TURN_COORDINATOR_API RotationConfigLoader {
public:
  /// Validate a YAML file, collecting every error found
  static ValidationResult validate(const std::string &yaml_path);
  static ValidationResult validate_node(const YAML::Node &doc);

  /// Load and validate; throws ConfigError listing all problems
  static RotationConfig load(const std::string &yaml_path);
  static RotationConfig from_node(const YAML::Node &doc);
};

} // namespace turncoord
