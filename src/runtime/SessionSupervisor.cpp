// Repository: OnAir-relay
// Component: Session Supervisor
// Copyright (c) 2026 OnAir

#include "onair/runtime/SessionSupervisor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <variant>

#include "onair/util/FileSystem.hpp"
#include "onair/util/Logger.hpp"
#include "onair/util/Redact.hpp"

namespace onair::runtime {

namespace {

constexpr const char* kTag = "[SessionSupervisor] ";

std::string ShortId(const std::string& id) { return id.substr(0, 8); }

std::string SessionTag(const std::string& id) {
  return std::string(kTag) + "Session " + ShortId(id) + ": ";
}

int64_t NowUtcMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string FormatSeconds(std::chrono::milliseconds d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(d.count()) / 1000.0);
  return buf;
}

SupervisorError FromBuildError(command::BuildError e) {
  switch (e) {
    case command::BuildError::kUnsupportedSourceKind:
      return SupervisorError::kUnsupportedSourceKind;
    case command::BuildError::kEmptyQueue:
      return SupervisorError::kEmptyQueue;
    case command::BuildError::kManifestWriteFailed:
      return SupervisorError::kConfigurationMissing;
    case command::BuildError::kNone:
      break;
  }
  return SupervisorError::kSpawnError;
}

// True for a playlist source whose queue has no unplayed item left.
bool PlaylistExhausted(const command::SourceDescriptor& source) {
  const auto* playlist = std::get_if<command::PlaylistSource>(&source);
  return playlist && playlist->queue && playlist->queue->UnplayedCount() == 0;
}

profile::ProfileRegistry MakeRegistry(const SupervisorConfig& config) {
  const std::string problem = ValidateConfig(config);
  if (!problem.empty()) {
    throw std::invalid_argument("SessionSupervisor: " + problem);
  }
  return profile::ProfileRegistry(config.profiles, config.default_tier);
}

}  // namespace

SessionSupervisor::SessionSupervisor(SupervisorConfig config,
                                     std::shared_ptr<process::IProcessLauncher> launcher,
                                     std::shared_ptr<INotifier> notifier,
                                     std::shared_ptr<ILoadSampler> sampler)
    : config_(std::move(config)),
      registry_(MakeRegistry(config_)),
      builder_(config_.encoder),
      launcher_(std::move(launcher)),
      notifier_(notifier ? std::move(notifier)
                         : std::shared_ptr<INotifier>(std::make_shared<NullNotifier>())),
      sampler_(std::move(sampler)) {
  if (!launcher_) {
    throw std::invalid_argument("SessionSupervisor: launcher is required");
  }
  if (config_.adaptation.enabled) {
    if (!sampler_) sampler_ = std::make_shared<ProcStatCpuSampler>();
    adaptation_thread_ = std::thread(&SessionSupervisor::AdaptationLoop, this,
                                     adaptation_cancel_.Token());
    util::Logger::Info(std::string(kTag) + "Quality adaptation enabled: every " +
                       FormatSeconds(config_.adaptation.interval) + ", high-water " +
                       std::to_string(config_.adaptation.high_water_percent) + "%, low-water " +
                       std::to_string(config_.adaptation.low_water_percent) + "%");
  }
}

SessionSupervisor::~SessionSupervisor() { Shutdown(); }

// =============================================================================
// Start
// =============================================================================

StartResult SessionSupervisor::Start(const StartRequest& request) {
  return StartWithTrigger(request, StartTrigger::kOperator);
}

StartResult SessionSupervisor::StartInternal(const StartRequest& request) {
  return StartWithTrigger(request, StartTrigger::kInternal);
}

StartResult SessionSupervisor::StartWithTrigger(const StartRequest& request,
                                                StartTrigger trigger) {
  JoinRetiredThreads();

  auto fail = [&](SupervisorError e, const std::string& msg) {
    util::Logger::Warn(std::string(kTag) + "Start for owner " + std::to_string(request.owner_id) +
                       " rejected: " + SupervisorErrorToString(e) + " (" + msg + ")");
    if (trigger == StartTrigger::kInternal) {
      NotifyOwner(request.owner_id, "Automatic broadcast start failed: " + msg);
    }
    return StartResult::Failure(e, msg);
  };

  std::lock_guard<std::mutex> start_lock(start_mutex_);
  if (shutting_down_.load()) {
    return fail(SupervisorError::kInvalidState, "supervisor is shutting down");
  }

  const command::SourceKind kind = command::KindOf(request.source);
  if (kind == command::SourceKind::kUnsupported) {
    return fail(SupervisorError::kUnsupportedSourceKind, "source kind is not supported");
  }

  command::DestinationDescriptor destination = request.destination;
  if (!destination.IsConfigured()) {
    destination = config_.default_destination;
  }
  if (!destination.IsConfigured()) {
    return fail(SupervisorError::kConfigurationMissing, "no streaming destination configured");
  }

  if (config_.single_session_per_owner) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& [id, s] : sessions_) {
      if (s->owner_id == request.owner_id) {
        return fail(SupervisorError::kAlreadyRunning,
                    "owner already has live session " + ShortId(id));
      }
    }
  }

  const profile::Profile profile =
      registry_.Resolve(request.tier == 0 ? registry_.DefaultTier() : request.tier);

  const std::string id = NewSessionId();
  uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    seq = next_start_seq_++;
  }

  std::string manifest_path;
  if (kind == command::SourceKind::kPlaylist) {
    manifest_path = util::JoinPath(config_.manifest_dir, "concat_" + id + ".txt");
  }
  std::string log_path;
  if (!config_.encoder_log_dir.empty()) {
    if (util::MakeDirectories(config_.encoder_log_dir)) {
      log_path = util::JoinPath(config_.encoder_log_dir, "encoder_" + id + ".log");
    } else {
      util::Logger::Warn(std::string(kTag) + "Cannot create encoder log directory " +
                         config_.encoder_log_dir + "; encoder output discarded");
    }
  }

  auto session = std::make_shared<Session>(id, request.owner_id, request.source, destination,
                                           request.loop, manifest_path, log_path, seq, NowUtcMs());

  command::BuildError build_error = command::BuildError::kNone;
  process::SpawnResult spawned = Launch(*session, profile, &build_error);
  if (!spawned.handle) {
    CleanupArtifacts(*session);
    return fail(FromBuildError(build_error), spawned.message);
  }
  const int pid = spawned.handle->Pid();

  {
    // Registry insert and monitor start under state_mutex: the monitor's
    // first step takes state_mutex, so it cannot finalize a session that is
    // not registered yet.
    std::lock_guard<std::mutex> lock(session->state_mutex);
    session->profile = profile;
    session->requested_tier = profile.tier;
    session->process = std::move(spawned.handle);
    session->status = SessionStatus::kRunning;
    {
      std::lock_guard<std::mutex> reg(registry_mutex_);
      sessions_.emplace(id, session);
    }
    StartMonitorLocked(session);
  }

  util::Logger::Info(SessionTag(id) + "started for owner " + std::to_string(request.owner_id) +
                     " (" + command::SourceKindToString(kind) + ", " +
                     std::to_string(profile.tier) + "p, loop=" + (request.loop ? "on" : "off") +
                     ", pid " + std::to_string(pid) + ") -> " + destination.DisplayUrl() +
                     (trigger == StartTrigger::kInternal ? " [internal]" : ""));
  if (trigger == StartTrigger::kInternal) {
    NotifyOwner(request.owner_id, "Broadcast " + ShortId(id) + " started automatically (" +
                                      std::to_string(profile.tier) + "p).");
  }
  return StartResult::Success(id);
}

process::SpawnResult SessionSupervisor::Launch(const Session& session,
                                               const profile::Profile& profile,
                                               command::BuildError* build_error) {
  const command::BuildResult built = builder_.Build(session.source, session.destination, profile,
                                                    session.loop, session.manifest_path);
  if (build_error) *build_error = built.error;
  if (!built.success) {
    return process::SpawnResult::Failure(built.message);
  }
  util::Logger::Info(SessionTag(session.id) + "launching " +
                     util::JoinArguments(
                         util::RedactArguments(built.args, session.destination.stream_key)));
  return launcher_->Spawn(built.args, session.encoder_log_path);
}

// =============================================================================
// Stop
// =============================================================================

bool SessionSupervisor::Stop(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) return false;
  std::lock_guard<std::mutex> op(session->op_mutex);
  return StopLocked(session, "operator request");
}

size_t SessionSupervisor::StopAllForOwner(int64_t owner_id) {
  size_t stopped = 0;
  for (const auto& session : Snapshot()) {
    if (session->owner_id != owner_id) continue;
    std::lock_guard<std::mutex> op(session->op_mutex);
    if (StopLocked(session, "stop all for owner")) ++stopped;
  }
  return stopped;
}

bool SessionSupervisor::StopLocked(const std::shared_ptr<Session>& session,
                                   const std::string& reason) {
  std::thread monitor;
  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    if (IsTerminal(session->status) || session->status == SessionStatus::kStopping) {
      return false;
    }
    session->status = SessionStatus::kStopping;
    // Cancel before terminate: once the token is set the monitor neither
    // counts the coming exit nor touches the session again.
    session->monitor_cancel.Cancel();
    monitor = std::move(session->monitor);
  }
  if (monitor.joinable()) {
    monitor.join();
  }

  std::unique_ptr<process::IProcessHandle> proc;
  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    proc = std::move(session->process);
  }
  if (proc) {
    proc->Terminate(config_.terminate_timeout);
    proc.reset();
  }

  int32_t restarts = 0;
  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    session->status = SessionStatus::kStopped;
    restarts = session->restart_count;
  }
  RemoveFromRegistry(session->id);
  CleanupArtifacts(*session);
  util::Logger::Info(SessionTag(session->id) + "stopped (" + reason + ", restarts " +
                     std::to_string(restarts) + ")");
  return true;
}

// =============================================================================
// Pause / Resume
// =============================================================================

OperationResult SessionSupervisor::Pause(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return OperationResult::Failure(SupervisorError::kNotFound, "no live session " + session_id);
  }
  std::lock_guard<std::mutex> op(session->op_mutex);
  std::lock_guard<std::mutex> lock(session->state_mutex);
  if (IsTerminal(session->status)) {
    return OperationResult::Failure(SupervisorError::kNotFound, "no live session " + session_id);
  }
  if (session->status != SessionStatus::kRunning) {
    return OperationResult::Failure(
        SupervisorError::kInvalidState,
        std::string("cannot pause a ") + SessionStatusToString(session->status) + " session");
  }
  if (!session->process) {
    return OperationResult::Failure(SupervisorError::kInvalidState, "encoder is restarting");
  }

  switch (session->process->Suspend()) {
    case process::SignalStatus::kOk:
      session->status = SessionStatus::kPaused;
      util::Logger::Info(SessionTag(session->id) + "paused");
      return OperationResult::Success();
    case process::SignalStatus::kUnsupported:
      return OperationResult::Failure(SupervisorError::kUnsupportedOperation,
                                      "pause is not supported on this platform");
    case process::SignalStatus::kNotRunning:
      return OperationResult::Failure(SupervisorError::kInvalidState, "encoder is restarting");
    case process::SignalStatus::kFailed:
      break;
  }
  return OperationResult::Failure(SupervisorError::kInvalidState, "could not suspend encoder");
}

OperationResult SessionSupervisor::Resume(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return OperationResult::Failure(SupervisorError::kNotFound, "no live session " + session_id);
  }
  std::lock_guard<std::mutex> op(session->op_mutex);
  std::lock_guard<std::mutex> lock(session->state_mutex);
  if (IsTerminal(session->status)) {
    return OperationResult::Failure(SupervisorError::kNotFound, "no live session " + session_id);
  }
  if (session->status != SessionStatus::kPaused) {
    return OperationResult::Failure(
        SupervisorError::kInvalidState,
        std::string("cannot resume a ") + SessionStatusToString(session->status) + " session");
  }
  if (!session->process) {
    return OperationResult::Failure(SupervisorError::kInvalidState, "encoder is restarting");
  }

  switch (session->process->Continue()) {
    case process::SignalStatus::kOk:
      session->status = SessionStatus::kRunning;
      util::Logger::Info(SessionTag(session->id) + "resumed");
      return OperationResult::Success();
    case process::SignalStatus::kUnsupported:
      return OperationResult::Failure(SupervisorError::kUnsupportedOperation,
                                      "resume is not supported on this platform");
    case process::SignalStatus::kNotRunning:
      return OperationResult::Failure(SupervisorError::kInvalidState, "encoder is restarting");
    case process::SignalStatus::kFailed:
      break;
  }
  return OperationResult::Failure(SupervisorError::kInvalidState, "could not continue encoder");
}

// =============================================================================
// Profile swap
// =============================================================================

OperationResult SessionSupervisor::ChangeProfile(const std::string& session_id, int32_t tier) {
  auto session = Find(session_id);
  if (!session) {
    return OperationResult::Failure(SupervisorError::kNotFound, "no live session " + session_id);
  }
  std::lock_guard<std::mutex> op(session->op_mutex);
  return SwapProfileLocked(session, tier, true);
}

OperationResult SessionSupervisor::SwapProfileLocked(const std::shared_ptr<Session>& session,
                                                     int32_t tier, bool explicit_request) {
  const profile::Profile target = registry_.Resolve(tier);
  profile::Profile previous;
  std::thread monitor;
  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    if (IsTerminal(session->status)) {
      return OperationResult::Failure(SupervisorError::kNotFound,
                                      "no live session " + session->id);
    }
    if (session->status != SessionStatus::kRunning) {
      return OperationResult::Failure(
          SupervisorError::kInvalidState,
          std::string("cannot change quality of a ") + SessionStatusToString(session->status) +
              " session");
    }
    if (explicit_request) session->requested_tier = target.tier;
    if (session->profile == target) {
      return OperationResult::Success();
    }
    previous = session->profile;
    // The old monitor is retired before the old encoder is terminated, and
    // the new monitor starts before op_mutex is released.
    session->monitor_cancel.Cancel();
    monitor = std::move(session->monitor);
  }
  if (monitor.joinable()) {
    monitor.join();
  }

  std::unique_ptr<process::IProcessHandle> old;
  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    old = std::move(session->process);
  }
  if (old) {
    old->Terminate(config_.terminate_timeout);
    old.reset();
  }

  command::BuildError build_error = command::BuildError::kNone;
  process::SpawnResult spawned = Launch(*session, target, &build_error);
  profile::Profile installed = target;
  if (!spawned.handle && build_error != command::BuildError::kEmptyQueue) {
    util::Logger::Warn(SessionTag(session->id) + "cannot launch " + std::to_string(target.tier) +
                       "p encoder (" + spawned.message + "), restoring " +
                       std::to_string(previous.tier) + "p");
    spawned = Launch(*session, previous, &build_error);
    installed = previous;
  }

  if (!spawned.handle) {
    const bool finished = build_error == command::BuildError::kEmptyQueue;
    const SessionStatus terminal = finished ? SessionStatus::kStopped : SessionStatus::kCrashed;
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      session->status = terminal;
    }
    RemoveFromRegistry(session->id);
    CleanupArtifacts(*session);
    util::Logger::Error(SessionTag(session->id) + "ended during quality change (" +
                        SessionStatusToString(terminal) + "): " + spawned.message);
    NotifyOwner(session->owner_id,
                finished ? "Broadcast " + ShortId(session->id) + " finished: playlist complete."
                         : "Broadcast " + ShortId(session->id) +
                               " crashed: encoder could not be relaunched.");
    return OperationResult::Failure(finished ? SupervisorError::kEmptyQueue
                                             : SupervisorError::kSpawnError,
                                    spawned.message);
  }

  {
    std::lock_guard<std::mutex> lock(session->state_mutex);
    session->process = std::move(spawned.handle);
    session->profile = installed;
    StartMonitorLocked(session);
  }

  if (installed != target) {
    return OperationResult::Failure(SupervisorError::kSpawnError,
                                    "could not switch to " + std::to_string(target.tier) +
                                        "p; still broadcasting at " +
                                        std::to_string(installed.tier) + "p");
  }
  util::Logger::Info(SessionTag(session->id) + "quality " + std::to_string(previous.tier) +
                     "p -> " + std::to_string(installed.tier) + "p" +
                     (explicit_request ? "" : " (adaptation)"));
  return OperationResult::Success();
}

// =============================================================================
// Monitor
// =============================================================================

void SessionSupervisor::StartMonitorLocked(const std::shared_ptr<Session>& session) {
  session->monitor_cancel = util::CancellationSource();
  session->monitor = std::thread(&SessionSupervisor::MonitorLoop, this, session,
                                 session->monitor_cancel.Token());
}

void SessionSupervisor::MonitorLoop(std::shared_ptr<Session> session,
                                    util::CancellationToken token) {
  const std::string tag = SessionTag(session->id);
  const int32_t ceiling = config_.restart_ceiling;

  // A playlist with nothing left ends as stopped; no restart is consumed.
  auto finish_playlist = [&] {
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      if (token.IsCancellationRequested()) return;
      FinalizeFromMonitorLocked(*session, SessionStatus::kStopped);
    }
    util::Logger::Info(tag + "playlist has no unplayed items, session stopped");
    NotifyOwner(session->owner_id,
                "Broadcast " + ShortId(session->id) + " finished: playlist complete.");
    CleanupArtifacts(*session);
  };

  for (;;) {
    // Only this thread replaces session->process while it runs; stop and
    // swap cancel and join it first, so the raw pointer stays valid.
    process::IProcessHandle* handle = nullptr;
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      if (token.IsCancellationRequested()) return;
      handle = session->process.get();
    }

    std::string cause = "encoder could not be relaunched";
    if (handle) {
      std::optional<process::ExitStatus> exit = handle->Wait(token);
      if (!exit) return;
      cause = "encoder exited (" + exit->ToString() + ")";
      if (PlaylistExhausted(session->source)) {
        finish_playlist();
        return;
      }
    }

    int32_t attempt = 0;
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      if (token.IsCancellationRequested()) return;
      attempt = ++session->restart_count;
      if (attempt > ceiling) {
        FinalizeFromMonitorLocked(*session, SessionStatus::kCrashed);
      }
    }
    if (attempt > ceiling) {
      util::Logger::Error(tag + cause + "; restart limit " + std::to_string(ceiling) +
                          " exceeded, session crashed");
      NotifyOwner(session->owner_id, "Broadcast " + ShortId(session->id) + " crashed: " + cause +
                                         ". Restart limit (" + std::to_string(ceiling) +
                                         ") reached.");
      CleanupArtifacts(*session);
      return;
    }

    util::Logger::Warn(tag + cause + ", restart " + std::to_string(attempt) + "/" +
                       std::to_string(ceiling) + " in " + FormatSeconds(config_.restart_backoff));
    NotifyOwner(session->owner_id, "Broadcast " + ShortId(session->id) + ": " + cause +
                                       ". Restarting in " +
                                       FormatSeconds(config_.restart_backoff) + " (" +
                                       std::to_string(attempt) + "/" + std::to_string(ceiling) +
                                       ").");

    if (!token.WaitFor(config_.restart_backoff)) return;

    profile::Profile profile;
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      profile = session->profile;
    }

    command::BuildError build_error = command::BuildError::kNone;
    process::SpawnResult spawned = Launch(*session, profile, &build_error);

    if (build_error == command::BuildError::kEmptyQueue) {
      finish_playlist();
      return;
    }

    if (!spawned.handle) {
      // Counted as the next failed attempt on the following iteration.
      util::Logger::Error(tag + "relaunch failed: " + spawned.message);
      std::lock_guard<std::mutex> lock(session->state_mutex);
      if (token.IsCancellationRequested()) return;
      session->process.reset();
      continue;
    }

    const int pid = spawned.handle->Pid();
    std::unique_ptr<process::IProcessHandle> replaced;
    {
      std::unique_lock<std::mutex> lock(session->state_mutex);
      if (token.IsCancellationRequested()) {
        lock.unlock();
        spawned.handle->Terminate(config_.terminate_timeout);
        return;
      }
      replaced = std::move(session->process);
      session->process = std::move(spawned.handle);
      session->status = SessionStatus::kRunning;
    }
    replaced.reset();

    util::Logger::Info(tag + "encoder relaunched (pid " + std::to_string(pid) + ", restart " +
                       std::to_string(attempt) + "/" + std::to_string(ceiling) + ")");
    NotifyOwner(session->owner_id, "Broadcast " + ShortId(session->id) + " is live again.");
  }
}

void SessionSupervisor::FinalizeFromMonitorLocked(Session& session, SessionStatus terminal) {
  session.status = terminal;
  session.process.reset();
  // This thread is session.monitor; it cannot join itself. It is retired
  // before the registry entry goes, so a Shutdown() snapshot that misses the
  // session still finds the thread in retired_threads_.
  {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_threads_.push_back(std::move(session.monitor));
  }
  RemoveFromRegistry(session.id);
}

// =============================================================================
// Shutdown
// =============================================================================

void SessionSupervisor::Shutdown() {
  {
    std::lock_guard<std::mutex> start_lock(start_mutex_);
    shutting_down_.store(true);
  }
  adaptation_cancel_.Cancel();
  if (adaptation_thread_.joinable()) {
    adaptation_thread_.join();
  }

  for (const auto& session : Snapshot()) {
    std::lock_guard<std::mutex> op(session->op_mutex);
    if (StopLocked(session, "shutdown")) {
      NotifyOwner(session->owner_id,
                  "Broadcast " + ShortId(session->id) + " stopped: service shutting down.");
    }
  }
  JoinRetiredThreads();
}

void SessionSupervisor::JoinRetiredThreads() {
  std::vector<std::thread> retired;
  {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired.swap(retired_threads_);
  }
  for (auto& t : retired) {
    if (t.joinable()) t.join();
  }
}

// =============================================================================
// Queries
// =============================================================================

std::shared_ptr<Session> SessionSupervisor::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> SessionSupervisor::Snapshot() const {
  std::vector<std::shared_ptr<Session>> out;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s);
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a->start_seq < b->start_seq; });
  return out;
}

std::optional<SessionView> SessionSupervisor::Get(const std::string& session_id) const {
  auto session = Find(session_id);
  if (!session) return std::nullopt;
  SessionView view = session->View();
  if (IsTerminal(view.status)) return std::nullopt;
  return view;
}

std::vector<SessionView> SessionSupervisor::ListForOwner(int64_t owner_id) const {
  std::vector<SessionView> out;
  for (const auto& session : Snapshot()) {
    if (session->owner_id != owner_id) continue;
    SessionView view = session->View();
    if (!IsTerminal(view.status)) out.push_back(std::move(view));
  }
  return out;
}

std::vector<SessionView> SessionSupervisor::ListAll() const {
  std::vector<SessionView> out;
  for (const auto& session : Snapshot()) {
    SessionView view = session->View();
    if (!IsTerminal(view.status)) out.push_back(std::move(view));
  }
  return out;
}

std::optional<SessionView> SessionSupervisor::ResolvePrefix(int64_t owner_id,
                                                            const std::string& prefix) const {
  for (const auto& view : ListForOwner(owner_id)) {
    if (view.id.compare(0, prefix.size(), prefix) == 0) return view;
  }
  return std::nullopt;
}

std::shared_ptr<playlist::PlaylistQueue> SessionSupervisor::OwnerPlaylist(int64_t owner_id) {
  std::lock_guard<std::mutex> lock(playlists_mutex_);
  auto& queue = playlists_[owner_id];
  if (!queue) queue = std::make_shared<playlist::PlaylistQueue>();
  return queue;
}

// =============================================================================
// Adaptation
// =============================================================================

void SessionSupervisor::AdaptationLoop(util::CancellationToken token) {
  while (token.WaitFor(config_.adaptation.interval)) {
    std::optional<double> load = sampler_->SampleCpuPercent();
    if (!load) continue;
    util::Logger::Debug(std::string(kTag) + "CPU " + std::to_string(*load) + "%");
    ApplyLoadSample(*load);
  }
}

void SessionSupervisor::ApplyLoadSample(double load_percent) {
  for (const auto& session : Snapshot()) {
    // A session busy with an operator call is looked at next cycle.
    std::unique_lock<std::mutex> op(session->op_mutex, std::try_to_lock);
    if (!op.owns_lock()) continue;

    int32_t current = 0;
    int32_t requested = 0;
    {
      std::lock_guard<std::mutex> lock(session->state_mutex);
      if (session->status != SessionStatus::kRunning) continue;
      current = session->profile.tier;
      requested = session->requested_tier;
    }

    const std::optional<int32_t> next =
        DecideTier(current, requested, load_percent, registry_, config_.adaptation);
    if (!next) continue;

    char load_text[16];
    std::snprintf(load_text, sizeof(load_text), "%.0f%%", load_percent);
    util::Logger::Info(SessionTag(session->id) + "CPU " + load_text + ", switching " +
                       std::to_string(current) + "p -> " + std::to_string(*next) + "p");
    const OperationResult r = SwapProfileLocked(session, *next, false);
    if (r.success) {
      NotifyOwner(session->owner_id,
                  "Broadcast " + ShortId(session->id) + ": CPU at " + load_text + ", quality " +
                      (*next < current ? "lowered" : "raised") + " to " + std::to_string(*next) +
                      "p.");
    } else {
      util::Logger::Warn(SessionTag(session->id) + "adaptive switch failed: " + r.message);
    }
  }
}

// =============================================================================
// Helpers
// =============================================================================

void SessionSupervisor::RemoveFromRegistry(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  sessions_.erase(session_id);
}

void SessionSupervisor::CleanupArtifacts(const Session& session) {
  if (session.manifest_path.empty()) return;
  // ENOENT is expected when the manifest was never written.
  (void)std::remove(session.manifest_path.c_str());
}

void SessionSupervisor::NotifyOwner(int64_t owner_id, const std::string& text) {
  try {
    notifier_->Notify(owner_id, text);
  } catch (const std::exception& e) {
    util::Logger::Warn(std::string(kTag) + "Notification to owner " + std::to_string(owner_id) +
                       " failed: " + e.what());
  }
}

std::string SessionSupervisor::NewSessionId() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";

  std::lock_guard<std::mutex> lock(registry_mutex_);
  for (;;) {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 32; ++i) {
      if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
      if (i == 12) out += '4';
      else if (i == 16) out += hexdig[8 + dis(gen) % 4];
      else out += hexdig[dis(gen)];
    }
    if (sessions_.count(out) == 0) return out;
  }
}

}  // namespace onair::runtime
