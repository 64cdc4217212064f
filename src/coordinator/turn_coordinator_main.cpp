#include "turn-coordinator/Logger.hpp"
#include "turn-coordinator/RotationConfig.hpp"
#include "turn-coordinator/coordinator/RotationRunner.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using namespace turncoord;

static volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int sig) {
  (void)sig;
  g_stop_requested = 1;
}

void print_usage() {
  std::cout << "Usage: turn-coordinator <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run <config.yaml>                  Run rotation from config\n";
  std::cout << "  demo                               Run rotation from flags\n";
  std::cout << "\nRun options:\n";
  std::cout << "  --report <path>      Write JSON report to file\n";
  std::cout << "  --log-level <level>  Override config log level\n";
  std::cout << "\nDemo options:\n";
  std::cout << "  --participants <n>   Participant count (default: 4)\n";
  std::cout << "  --rounds <n>         Full cycles (default: 10)\n";
  std::cout << "  --timeout-ms <ms>    Per-wait timeout (default: none)\n";
  std::cout << "  --work-ms <ms>       Work per granted turn (default: 0)\n";
  std::cout << "  --lock-held          Run work while holding the lock\n";
  std::cout << "  --log-level <level>  Log level (default: info)\n";
  std::cout << "  --report <path>      Write JSON report to file\n";
  std::cout << "\nExit codes: 0 completed, 1 usage/config error, "
               "2 cancelled or incomplete\n";
}

// Runs the rotation while a watcher thread turns SIGINT/SIGTERM into stop()
static int execute(RotationConfig config, const std::string &report_path) {
  CoordinatorLogger::instance().init(config.log_file,
                                     parse_log_level(config.log_level));

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  RotationRunner runner(std::move(config));

  std::atomic<bool> finished{false};
  std::thread watcher([&]() {
    while (!finished) {
      if (g_stop_requested) {
        LOG_WARN("MAIN", "SIGNAL", "Signal received, shutting down rotation");
        runner.stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  RotationReport report;
  try {
    report = runner.run();
  } catch (...) {
    finished = true;
    watcher.join();
    throw;
  }
  finished = true;
  watcher.join();

  auto j = report.to_json();
  j["config"] = runner.config().to_json();

  if (!report_path.empty()) {
    std::ofstream ofs(report_path);
    if (!ofs) {
      std::cerr << "Error: cannot write report to " << report_path << "\n";
      return 1;
    }
    ofs << j.dump(2) << "\n";
    std::cout << "Report written to " << report_path << "\n";
  }

  std::cout << "Turns granted: " << report.final_turn << "\n";
  for (const auto &p : report.participants) {
    std::cout << "  [" << p.index << "] " << p.name << ": granted=" << p.granted
              << " timed_out=" << p.timed_out
              << (p.cancelled ? " cancelled" : "")
              << (p.gave_up ? " gave_up" : "") << "\n";
  }
  std::cout << "Round robin: " << (report.is_round_robin() ? "yes" : "NO")
            << "\n";

  if (report.completed && report.is_round_robin()) {
    return 0;
  }
  std::cout << (report.cancelled ? "Rotation cancelled\n"
                                 : "Rotation incomplete\n");
  return 2;
}

int cmd_run(int argc, char **argv) {
  if (argc < 1) {
    std::cerr << "Usage: turn-coordinator run <config.yaml> [--report <path>] "
                 "[--log-level <level>]\n";
    return 1;
  }

  std::string config_path = argv[0];
  std::string report_path;
  std::string log_level;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--report" && i + 1 < argc) {
      report_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  RotationConfig config;
  try {
    config = RotationConfigLoader::load(config_path);
  } catch (const ConfigError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
  if (!log_level.empty()) {
    config.log_level = log_level;
  }
  return execute(std::move(config), report_path);
}

int cmd_demo(int argc, char **argv) {
  size_t participants = 4;
  uint64_t rounds = 10;
  long timeout_ms = 0;
  long work_ms = 0;
  bool lock_held = false;
  std::string log_level = "info";
  std::string report_path;

  try {
    for (int i = 0; i < argc; i++) {
      std::string arg = argv[i];
      if (arg == "--participants" && i + 1 < argc) {
        participants = std::stoul(argv[++i]);
      } else if (arg == "--rounds" && i + 1 < argc) {
        rounds = std::stoull(argv[++i]);
      } else if (arg == "--timeout-ms" && i + 1 < argc) {
        timeout_ms = std::stol(argv[++i]);
      } else if (arg == "--work-ms" && i + 1 < argc) {
        work_ms = std::stol(argv[++i]);
      } else if (arg == "--lock-held") {
        lock_held = true;
      } else if (arg == "--log-level" && i + 1 < argc) {
        log_level = argv[++i];
      } else if (arg == "--report" && i + 1 < argc) {
        report_path = argv[++i];
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        return 1;
      }
    }
  } catch (const std::logic_error &ex) {
    std::cerr << "Error: invalid numeric option (" << ex.what() << ")\n";
    return 1;
  }

  if (participants == 0 || rounds == 0 || timeout_ms < 0 || work_ms < 0) {
    std::cerr << "Error: participants and rounds must be positive, "
                 "timeouts non-negative\n";
    return 1;
  }
  if (participants > static_cast<size_t>(kMaxParticipants) ||
      timeout_ms > kMaxDurationMs || work_ms > kMaxDurationMs) {
    std::cerr << "Error: at most " << kMaxParticipants
              << " participants and " << kMaxDurationMs
              << "ms per timeout or work period\n";
    return 1;
  }

  auto config = RotationConfig::with_participants(participants);
  config.rounds = rounds;
  if (timeout_ms > 0) {
    config.timeout = std::chrono::milliseconds(timeout_ms);
  }
  config.work = std::chrono::milliseconds(work_ms);
  config.action_mode = lock_held ? ActionMode::LockHeld : ActionMode::Unlocked;
  config.log_level = log_level;
  return execute(std::move(config), report_path);
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  try {
    if (command == "run") {
      return cmd_run(argc - 2, argv + 2);
    } else if (command == "demo") {
      return cmd_demo(argc - 2, argv + 2);
    } else if (command == "--help" || command == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown command: " << command << "\n\n";
      print_usage();
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
