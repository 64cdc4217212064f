#include "turn-coordinator/RotationConfig.hpp"
#include "turn-coordinator/Logger.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace turncoord {

static const std::set<std::string> kKnownKeys = {
    "participants", "rounds",       "timeout_ms", "work_ms",
    "action_mode",  "max_timeouts", "log_level",  "log_file"};

static const std::set<std::string> kLogLevels = {"trace", "debug", "info",
                                                 "warn", "error"};

static std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out.empty() ? "/" : out;
}

static void add_error(ValidationResult &result,
                      const std::vector<std::string> &path,
                      const std::string &msg) {
  result.valid = false;
  result.errors.push_back({node_path(path), msg});
}

// Reads an integer scalar in [min, max]; records an error and returns nullopt
// otherwise.
static std::optional<int64_t>
read_int(const YAML::Node &node, const std::vector<std::string> &path,
         int64_t min, int64_t max, ValidationResult &result) {
  if (!node.IsScalar()) {
    add_error(result, path, "Expected an integer");
    return std::nullopt;
  }
  int64_t value = 0;
  try {
    value = node.as<int64_t>();
  } catch (const YAML::Exception &) {
    add_error(result, path,
              "Expected an integer, got '" + node.Scalar() + "'");
    return std::nullopt;
  }
  if (value < min) {
    add_error(result, path,
              "Must be at least " + std::to_string(min) + ", got " +
                  std::to_string(value));
    return std::nullopt;
  }
  if (value > max) {
    add_error(result, path,
              "Must be at most " + std::to_string(max) + ", got " +
                  std::to_string(value));
    return std::nullopt;
  }
  return value;
}

static std::optional<std::string>
read_string(const YAML::Node &node, const std::vector<std::string> &path,
            ValidationResult &result) {
  if (!node.IsScalar() || node.Scalar().empty()) {
    add_error(result, path, "Expected a non-empty string");
    return std::nullopt;
  }
  return node.Scalar();
}

static void validate_participants(const YAML::Node &node,
                                  ValidationResult &result) {
  const std::vector<std::string> path = {"participants"};
  if (node.IsScalar()) {
    read_int(node, path, 1, kMaxParticipants, result);
    return;
  }
  if (!node.IsSequence()) {
    add_error(result, path,
              "participants must be a count or a sequence of participants");
    return;
  }
  if (node.size() == 0) {
    add_error(result, path, "participants must not be empty");
    return;
  }
  if (node.size() > static_cast<size_t>(kMaxParticipants)) {
    add_error(result, path,
              "At most " + std::to_string(kMaxParticipants) +
                  " participants are supported, got " +
                  std::to_string(node.size()));
    return;
  }

  std::set<std::string> names;
  for (size_t i = 0; i < node.size(); ++i) {
    const auto &entry = node[i];
    std::vector<std::string> entry_path = {"participants", std::to_string(i)};

    std::optional<std::string> name;
    if (entry.IsScalar()) {
      name = read_string(entry, entry_path, result);
    } else if (entry.IsMap()) {
      if (!entry["name"]) {
        add_error(result, entry_path, "Missing required field 'name'");
      } else {
        auto name_path = entry_path;
        name_path.push_back("name");
        name = read_string(entry["name"], name_path, result);
      }
      if (entry["start_delay_ms"]) {
        auto delay_path = entry_path;
        delay_path.push_back("start_delay_ms");
        read_int(entry["start_delay_ms"], delay_path, 0, kMaxDurationMs,
                 result);
      }
      for (const auto &kv : entry) {
        auto key = kv.first.as<std::string>();
        if (key != "name" && key != "start_delay_ms") {
          add_error(result, entry_path, "Unknown participant field '" + key +
                                            "'");
        }
      }
    } else {
      add_error(result, entry_path,
                "Participant must be a name or a map with 'name'");
    }

    if (name && !names.insert(*name).second) {
      add_error(result, entry_path, "Duplicate participant name '" + *name +
                                        "'");
    }
  }
}

ValidationResult RotationConfigLoader::validate_node(const YAML::Node &doc) {
  ValidationResult result;

  if (!doc.IsMap()) {
    add_error(result, {}, "Rotation config must be a map");
    return result;
  }

  for (const auto &kv : doc) {
    auto key = kv.first.as<std::string>();
    if (kKnownKeys.find(key) == kKnownKeys.end()) {
      add_error(result, {key}, "Unknown field '" + key + "'");
    }
  }

  if (!doc["participants"]) {
    add_error(result, {}, "Missing required field 'participants'");
  } else {
    validate_participants(doc["participants"], result);
  }

  if (doc["rounds"]) {
    read_int(doc["rounds"], {"rounds"}, 1,
             std::numeric_limits<int64_t>::max(), result);
  }
  if (doc["timeout_ms"]) {
    read_int(doc["timeout_ms"], {"timeout_ms"}, 0, kMaxDurationMs, result);
  }
  if (doc["work_ms"]) {
    read_int(doc["work_ms"], {"work_ms"}, 0, kMaxDurationMs, result);
  }
  if (doc["max_timeouts"]) {
    read_int(doc["max_timeouts"], {"max_timeouts"}, 0,
             std::numeric_limits<uint32_t>::max(), result);
  }
  if (doc["action_mode"]) {
    auto mode = read_string(doc["action_mode"], {"action_mode"}, result);
    if (mode && *mode != "unlocked" && *mode != "lock_held") {
      add_error(result, {"action_mode"},
                "action_mode must be 'unlocked' or 'lock_held', got '" +
                    *mode + "'");
    }
  }
  if (doc["log_level"]) {
    auto level = read_string(doc["log_level"], {"log_level"}, result);
    if (level && kLogLevels.find(*level) == kLogLevels.end()) {
      add_error(result, {"log_level"}, "Unknown log level '" + *level + "'");
    }
  }
  if (doc["log_file"]) {
    read_string(doc["log_file"], {"log_file"}, result);
  }

  return result;
}

ValidationResult RotationConfigLoader::validate(const std::string &yaml_path) {
  try {
    YAML::Node doc = YAML::LoadFile(yaml_path);
    return validate_node(doc);
  } catch (const YAML::Exception &ex) {
    ValidationResult result;
    add_error(result, {}, std::string("YAML parsing error: ") + ex.what());
    return result;
  }
}

RotationConfig RotationConfigLoader::from_node(const YAML::Node &doc) {
  auto result = validate_node(doc);
  if (!result.valid) {
    std::string msg = "Invalid rotation config:";
    for (const auto &err : result.errors) {
      msg += "\n  - " + err.path + ": " + err.message;
    }
    throw ConfigError(msg);
  }

  RotationConfig config;
  const auto &participants = doc["participants"];
  if (participants.IsScalar()) {
    config = RotationConfig::with_participants(participants.as<size_t>());
  } else {
    for (const auto &entry : participants) {
      ParticipantSpec spec;
      if (entry.IsScalar()) {
        spec.name = entry.Scalar();
      } else {
        spec.name = entry["name"].as<std::string>();
        if (entry["start_delay_ms"]) {
          spec.start_delay =
              std::chrono::milliseconds(entry["start_delay_ms"].as<int64_t>());
        }
      }
      config.participants.push_back(std::move(spec));
    }
  }

  if (doc["rounds"]) {
    config.rounds = doc["rounds"].as<uint64_t>();
  }
  if (doc["timeout_ms"]) {
    auto ms = doc["timeout_ms"].as<int64_t>();
    // 0 means wait without a deadline
    if (ms > 0) {
      config.timeout = std::chrono::milliseconds(ms);
    }
  }
  if (doc["work_ms"]) {
    config.work = std::chrono::milliseconds(doc["work_ms"].as<int64_t>());
  }
  if (doc["max_timeouts"]) {
    config.max_timeouts = doc["max_timeouts"].as<uint32_t>();
  }
  if (doc["action_mode"]) {
    config.action_mode = doc["action_mode"].as<std::string>() == "lock_held"
                             ? ActionMode::LockHeld
                             : ActionMode::Unlocked;
  }
  if (doc["log_level"]) {
    config.log_level = doc["log_level"].as<std::string>();
  }
  if (doc["log_file"]) {
    config.log_file = doc["log_file"].as<std::string>();
  }
  return config;
}

RotationConfig RotationConfigLoader::load(const std::string &yaml_path) {
  LOG_INFO("CONFIG", "LOAD", "Loading rotation config from: {}", yaml_path);

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(yaml_path);
  } catch (const YAML::Exception &ex) {
    LOG_ERROR("CONFIG", "LOAD", "Failed to read {}: {}", yaml_path, ex.what());
    throw ConfigError("Failed to read " + yaml_path + ": " + ex.what());
  }
  return from_node(doc);
}

RotationConfig RotationConfig::with_participants(size_t count) {
  RotationConfig config;
  config.participants.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    config.participants.push_back({"p" + std::to_string(i), {}});
  }
  return config;
}

nlohmann::json RotationConfig::to_json() const {
  nlohmann::json j;
  j["participants"] = nlohmann::json::array();
  for (const auto &p : participants) {
    j["participants"].push_back(
        {{"name", p.name}, {"start_delay_ms", p.start_delay.count()}});
  }
  j["rounds"] = rounds;
  j["timeout_ms"] = timeout ? nlohmann::json(timeout->count())
                            : nlohmann::json(nullptr);
  j["work_ms"] = work.count();
  j["action_mode"] = to_string(action_mode);
  j["max_timeouts"] = max_timeouts;
  j["log_level"] = log_level;
  j["log_file"] = log_file;
  return j;
}

} // namespace turncoord
