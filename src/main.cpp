// Repository: OnAir-relay
// Component: Supervisor Daemon Entry Point
// Purpose: Hosts the BroadcastControl gRPC service around one
//          SessionSupervisor.
// Copyright (c) 2026 OnAir
//
// Configuration is read from ONAIR_* environment variables first; command
// line flags override it. SIGINT/SIGTERM stop every live session (monitors
// cancelled, encoder process groups terminated) before the server exits.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "control/BroadcastControlService.h"
#include "control/NotificationHub.h"
#include "onair/process/PosixProcess.hpp"
#include "onair/runtime/SessionSupervisor.hpp"
#include "onair/runtime/SupervisorConfig.hpp"
#include "onair/util/Logger.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct AutostartEntry {
  int64_t owner_id = 0;
  std::string path;
};

struct CliArgs {
  std::string listen_address = "127.0.0.1:50061";
  std::string log_file;
  std::vector<AutostartEntry> autostart;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Live broadcast session supervisor. Runs ffmpeg push sessions and exposes\n"
            << "the onair.v1.BroadcastControl gRPC service.\n"
            << "\n"
            << "SERVER:\n"
            << "  --listen ADDR              gRPC listen address (default: 127.0.0.1:50061)\n"
            << "  --log-file PATH            Also append log lines to PATH\n"
            << "\n"
            << "ENCODER:\n"
            << "  --encoder PATH             Encoder binary (default: ffmpeg)\n"
            << "  --manifest-dir DIR         Playlist manifest directory\n"
            << "  --encoder-log-dir DIR      Per-session encoder output (default: discarded)\n"
            << "  --default-tier N           Default quality tier (default: 720)\n"
            << "\n"
            << "RESTART POLICY:\n"
            << "  --restart-ceiling N        Restarts before a session is crashed (default: 5)\n"
            << "  --backoff-ms MS            Delay before each restart (default: 5000)\n"
            << "  --terminate-timeout-ms MS  SIGTERM grace before SIGKILL (default: 5000)\n"
            << "  --single-session-per-owner Reject a second live session per owner\n"
            << "\n"
            << "ADAPTATION:\n"
            << "  --adapt                    Enable CPU-driven quality adaptation\n"
            << "  --adapt-interval-ms MS     Sampling interval (default: 30000)\n"
            << "  --adapt-high N             Step down above N% CPU (default: 85)\n"
            << "  --adapt-low N              Step up below N% CPU (default: 40)\n"
            << "\n"
            << "BOOT:\n"
            << "  --autostart OWNER:PATH     Start a looping broadcast of PATH for OWNER to\n"
            << "                             the default destination (repeatable)\n"
            << "  --help                     Show this help message\n"
            << "\n"
            << "Environment: ONAIR_DEFAULT_RTMP_URL, ONAIR_DEFAULT_STREAM_KEY, ONAIR_PROFILE_<tier>,\n"
            << "ONAIR_DEBUG and the ONAIR_* equivalents of the flags above.\n";
}

CliArgs ParseArgs(int argc, char* argv[], onair::runtime::SupervisorConfig& config) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--listen" && i + 1 < argc) {
        args.listen_address = argv[++i];
      } else if (arg == "--log-file" && i + 1 < argc) {
        args.log_file = argv[++i];
      } else if (arg == "--encoder" && i + 1 < argc) {
        config.encoder.binary = argv[++i];
      } else if (arg == "--manifest-dir" && i + 1 < argc) {
        config.manifest_dir = argv[++i];
      } else if (arg == "--encoder-log-dir" && i + 1 < argc) {
        config.encoder_log_dir = argv[++i];
      } else if (arg == "--default-tier" && i + 1 < argc) {
        config.default_tier = std::stoi(argv[++i]);
      } else if (arg == "--restart-ceiling" && i + 1 < argc) {
        config.restart_ceiling = std::stoi(argv[++i]);
      } else if (arg == "--backoff-ms" && i + 1 < argc) {
        config.restart_backoff = std::chrono::milliseconds(std::stoll(argv[++i]));
      } else if (arg == "--terminate-timeout-ms" && i + 1 < argc) {
        config.terminate_timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
      } else if (arg == "--single-session-per-owner") {
        config.single_session_per_owner = true;
      } else if (arg == "--adapt") {
        config.adaptation.enabled = true;
      } else if (arg == "--adapt-interval-ms" && i + 1 < argc) {
        config.adaptation.interval = std::chrono::milliseconds(std::stoll(argv[++i]));
      } else if (arg == "--adapt-high" && i + 1 < argc) {
        config.adaptation.high_water_percent = std::stod(argv[++i]);
      } else if (arg == "--adapt-low" && i + 1 < argc) {
        config.adaptation.low_water_percent = std::stod(argv[++i]);
      } else if (arg == "--autostart" && i + 1 < argc) {
        const std::string value = argv[++i];
        const size_t colon = value.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
          args.error = "--autostart expects OWNER:PATH, got '" + value + "'";
          return args;
        }
        AutostartEntry entry;
        entry.owner_id = std::stoll(value.substr(0, colon));
        entry.path = value.substr(colon + 1);
        args.autostart.push_back(entry);
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric argument: ") + e.what();
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using onair::util::Logger;

  onair::runtime::SupervisorConfig config = onair::runtime::LoadConfigFromEnvironment();
  CliArgs args = ParseArgs(argc, argv, config);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.log_file.empty()) {
    if (const char* env = std::getenv("ONAIR_LOG_FILE")) args.log_file = env;
  }
  if (!args.log_file.empty() && !Logger::SetLogFile(args.log_file)) {
    Logger::Warn("[Main] Cannot open log file " + args.log_file + "; console only");
  }

  const std::string problem = onair::runtime::ValidateConfig(config);
  if (!problem.empty()) {
    Logger::Error("[Main] Invalid configuration: " + problem);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // Writes to a closed notification stream must not kill the daemon.
  std::signal(SIGPIPE, SIG_IGN);

  auto hub = std::make_shared<onair::control::NotificationHub>();
  auto supervisor = std::make_shared<onair::runtime::SessionSupervisor>(
      config, std::make_shared<onair::process::PosixProcessLauncher>(), hub);
  auto service = std::make_unique<onair::control::BroadcastControlImpl>(supervisor, hub);

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(args.listen_address, grpc::InsecureServerCredentials(), &bound_port);
  builder.RegisterService(service.get());
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    Logger::Error("[Main] Cannot listen on " + args.listen_address);
    supervisor->Shutdown();
    return 1;
  }

  Logger::Info("[Main] BroadcastControl " + std::string(onair::control::kApiVersion) +
               " listening on " + args.listen_address + " (encoder " + config.encoder.binary +
               ", restart ceiling " + std::to_string(config.restart_ceiling) + ", " +
               (config.single_session_per_owner ? "single" : "multiple") +
               " sessions per owner)");

  for (const auto& entry : args.autostart) {
    onair::runtime::StartRequest request;
    request.owner_id = entry.owner_id;
    request.source = onair::command::SingleFileSource{entry.path};
    request.loop = true;
    const auto result = supervisor->StartInternal(request);
    if (!result.success) {
      Logger::Warn("[Main] Autostart for owner " + std::to_string(entry.owner_id) +
                   " failed: " + result.message);
    }
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[Main] Termination requested, stopping all sessions");
  service->BeginShutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  server->Wait();
  Logger::Info("[Main] Shutdown complete");
  return 0;
}
