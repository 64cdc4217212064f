#include "turn-coordinator/coordinator/RotationRunner.hpp"
#include "turn-coordinator/Logger.hpp"
#include "turn-coordinator/coordinator/Participant.hpp"

#include <functional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace turncoord {

bool RotationReport::is_round_robin() const {
  const size_t n = participants.size();
  if (n == 0)
    return grants.empty();
  for (size_t i = 0; i < grants.size(); ++i) {
    if (grants[i].turn != i || grants[i].participant != i % n) {
      return false;
    }
  }
  return true;
}

nlohmann::json RotationReport::to_json() const {
  nlohmann::json j;
  j["final_turn"] = final_turn;
  j["completed"] = completed;
  j["cancelled"] = cancelled;
  j["round_robin"] = is_round_robin();
  j["elapsed_ms"] = elapsed.count();

  j["participants"] = nlohmann::json::array();
  for (const auto &p : participants) {
    j["participants"].push_back({{"name", p.name},
                                 {"index", p.index},
                                 {"granted", p.granted},
                                 {"timed_out", p.timed_out},
                                 {"cancelled", p.cancelled},
                                 {"gave_up", p.gave_up}});
  }

  j["grants"] = nlohmann::json::array();
  for (const auto &g : grants) {
    j["grants"].push_back({{"turn", g.turn}, {"participant", g.participant}});
  }
  return j;
}

RotationRunner::RotationRunner(RotationConfig config)
    : config_(std::move(config)),
      coordinator_(std::make_shared<TurnCoordinator>(
          config_.participants.size(), config_.action_mode)) {}

void RotationRunner::stop() {
  LOG_INFO("RUNNER", "STOP", "Stop requested");
  coordinator_->shutdown();
}

RotationReport RotationRunner::run() {
  {
    std::lock_guard lock(grants_mutex_);
    if (started_) {
      throw std::logic_error("RotationRunner::run() called twice");
    }
    started_ = true;
  }

  const size_t n = config_.participants.size();
  LOG_INFO("RUNNER", "START",
           "Starting rotation: participants={} rounds={} timeout={} mode={}",
           n, config_.rounds,
           config_.timeout ? std::to_string(config_.timeout->count()) + "ms"
                           : std::string("none"),
           to_string(config_.action_mode));

  RotationReport report;
  report.participants.resize(n);
  for (size_t i = 0; i < n; ++i) {
    report.participants[i].name = config_.participants[i].name;
    report.participants[i].index = i;
  }

  auto start = std::chrono::steady_clock::now();

  // Register up front so index i belongs to config_.participants[i]
  std::vector<Participant> members;
  members.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    members.push_back(Participant::join(coordinator_));
  }

  std::vector<std::thread> threads;
  threads.reserve(n);
  try {
    for (size_t i = 0; i < n; ++i) {
      threads.push_back(spawn_participant(members[i], report.participants[i]));
    }
  } catch (const std::exception &ex) {
    LOG_ERROR("RUNNER", "SPAWN",
              "Started {} of {} participant threads: {}", threads.size(), n,
              ex.what());
    coordinator_->shutdown();
    for (auto &t : threads) {
      t.join();
    }
    throw;
  }
  for (auto &t : threads) {
    t.join();
  }

  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  {
    std::lock_guard lock(grants_mutex_);
    report.grants = grants_;
  }
  report.final_turn = coordinator_->current_turn();
  report.cancelled = coordinator_->is_shutdown();
  report.completed = true;
  for (const auto &p : report.participants) {
    if (p.granted < config_.rounds) {
      report.completed = false;
    }
  }

  LOG_INFO("RUNNER", "DONE",
           "Rotation finished: turns={} completed={} cancelled={} "
           "round_robin={} elapsed={}ms",
           report.final_turn, report.completed, report.cancelled,
           report.is_round_robin(), report.elapsed.count());
  return report;
}

std::thread RotationRunner::spawn_participant(Participant participant,
                                              ParticipantReport &report) {
  return std::thread(&RotationRunner::participant_loop, this,
                     std::move(participant), std::ref(report));
}

void RotationRunner::participant_loop(Participant participant,
                                      ParticipantReport &report) {
  const size_t slot = participant.index();
  const auto &spec = config_.participants[slot];

  try {
    // Late arrivals poll for shutdown so stop() is not held up by the delay
    auto remaining = spec.start_delay;
    const auto step = std::chrono::milliseconds(20);
    while (remaining.count() > 0 && !coordinator_->is_shutdown()) {
      auto chunk = remaining < step ? remaining : step;
      std::this_thread::sleep_for(chunk);
      remaining -= chunk;
    }

    LOG_DEBUG("RUNNER", "ARRIVE", "Participant {} ({}) arrived", slot,
              spec.name);

    uint32_t consecutive_timeouts = 0;
    while (report.granted < config_.rounds) {
      TurnResult result =
          participant.take_turn(config_.timeout, [&](uint64_t turn) {
            {
              std::lock_guard lock(grants_mutex_);
              grants_.push_back({turn, slot});
            }
            if (config_.work.count() > 0) {
              std::this_thread::sleep_for(config_.work);
            }
          });

      switch (result) {
      case TurnResult::Granted:
        ++report.granted;
        consecutive_timeouts = 0;
        LOG_DEBUG("RUNNER", "GRANT", "Participant {} ({}) granted {}/{}", slot,
                  spec.name, report.granted, config_.rounds);
        break;
      case TurnResult::TimedOut:
        ++report.timed_out;
        ++consecutive_timeouts;
        LOG_DEBUG("RUNNER", "TIMEOUT",
                  "Participant {} ({}) timed out waiting for turn {}", slot,
                  spec.name, coordinator_->current_turn());
        if (config_.max_timeouts > 0 &&
            consecutive_timeouts >= config_.max_timeouts) {
          LOG_WARN("RUNNER", "GIVE_UP",
                   "Participant {} ({}) gave up after {} consecutive timeouts",
                   slot, spec.name, consecutive_timeouts);
          report.gave_up = true;
          return;
        }
        break;
      case TurnResult::Cancelled:
        report.cancelled = true;
        LOG_DEBUG("RUNNER", "CANCELLED", "Participant {} ({}) cancelled", slot,
                  spec.name);
        return;
      case TurnResult::InvalidParticipant:
        LOG_ERROR("RUNNER", "INVALID", "Participant {} rejected", slot);
        report.gave_up = true;
        return;
      }
    }
  } catch (const std::exception &ex) {
    LOG_ERROR("RUNNER", "FAILED", "Participant {} ({}) failed: {}", slot,
              spec.name, ex.what());
    report.gave_up = true;
    // Nobody else can complete the rotation without this participant
    coordinator_->shutdown();
  }
}

} // namespace turncoord
