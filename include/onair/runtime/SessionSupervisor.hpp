// Repository: OnAir-relay
// Component: Session Supervisor
// Purpose: Owns all live broadcast sessions: start/stop/pause/resume, crash
//          monitoring with bounded restarts, profile swaps and the optional
//          quality adaptation loop.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_SESSION_SUPERVISOR_HPP_
#define ONAIR_RUNTIME_SESSION_SUPERVISOR_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "onair/command/CommandBuilder.hpp"
#include "onair/playlist/PlaylistQueue.hpp"
#include "onair/process/IProcessHandle.hpp"
#include "onair/profile/ProfileRegistry.hpp"
#include "onair/runtime/INotifier.hpp"
#include "onair/runtime/QualityAdaptation.hpp"
#include "onair/runtime/Session.hpp"
#include "onair/runtime/SessionTypes.hpp"
#include "onair/runtime/SupervisorConfig.hpp"
#include "onair/util/Cancellation.hpp"

namespace onair::runtime {

// One instance per process, constructed by main and injected into the
// control service. All public methods are thread-safe.
//
// Each live session has one monitor thread that blocks on its encoder's
// exit. Operator calls on the same session are serialized by the session's
// op_mutex; stop and profile swaps always cancel and join the monitor before
// terminating the encoder, so an intentional exit is never counted as a
// crash.
class SessionSupervisor {
 public:
  // Throws std::invalid_argument when ValidateConfig(config) fails.
  // `sampler` may be null; a ProcStatCpuSampler is used when adaptation is
  // enabled.
  SessionSupervisor(SupervisorConfig config,
                    std::shared_ptr<process::IProcessLauncher> launcher,
                    std::shared_ptr<INotifier> notifier,
                    std::shared_ptr<ILoadSampler> sampler = nullptr);

  // Stops every session (Shutdown()).
  ~SessionSupervisor();

  SessionSupervisor(const SessionSupervisor&) = delete;
  SessionSupervisor& operator=(const SessionSupervisor&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  StartResult Start(const StartRequest& request);

  // Same as Start(), tagged as an internal trigger (boot-time auto-start).
  // The owner is notified of the outcome because no caller is waiting on it.
  StartResult StartInternal(const StartRequest& request);

  // running|paused -> stopping -> stopped, then removed. Returns false when
  // no live session has this id.
  bool Stop(const std::string& session_id);

  // Returns the number of sessions stopped.
  size_t StopAllForOwner(int64_t owner_id);

  // running -> paused. UnsupportedOperation leaves the session unchanged.
  OperationResult Pause(const std::string& session_id);

  // paused -> running.
  OperationResult Resume(const std::string& session_id);

  // Rebuilds the encoder with another tier. Preserves id, owner, source,
  // destination and restart count. `tier` also becomes the ceiling for
  // upward adaptation.
  OperationResult ChangeProfile(const std::string& session_id, int32_t tier);

  // Stops all sessions and the adaptation loop; later starts are rejected.
  void Shutdown();

  // ==========================================================================
  // Queries
  // ==========================================================================

  std::optional<SessionView> Get(const std::string& session_id) const;
  std::vector<SessionView> ListForOwner(int64_t owner_id) const;
  std::vector<SessionView> ListAll() const;

  // Owner's session whose id starts with `prefix`, earliest start first.
  // An empty prefix selects the owner's earliest session.
  std::optional<SessionView> ResolvePrefix(int64_t owner_id, const std::string& prefix) const;

  // The owner's playlist, created empty on first use. Playlist sessions
  // started by this owner broadcast from it.
  std::shared_ptr<playlist::PlaylistQueue> OwnerPlaylist(int64_t owner_id);

  int32_t RestartCeiling() const { return config_.restart_ceiling; }
  const profile::ProfileRegistry& Profiles() const { return registry_; }
  const SupervisorConfig& Config() const { return config_; }

  // Runs one adaptation pass immediately with `load_percent`. The loop
  // thread calls this on every sample.
  void ApplyLoadSample(double load_percent);

 private:
  StartResult StartWithTrigger(const StartRequest& request, StartTrigger trigger);

  std::shared_ptr<Session> Find(const std::string& session_id) const;
  std::vector<std::shared_ptr<Session>> Snapshot() const;

  // Builds and spawns an encoder for `session` with `profile`.
  process::SpawnResult Launch(const Session& session, const profile::Profile& profile,
                              command::BuildError* build_error);

  // Requires session.op_mutex held.
  bool StopLocked(const std::shared_ptr<Session>& session, const std::string& reason);

  // Requires session.op_mutex held and status == running.
  OperationResult SwapProfileLocked(const std::shared_ptr<Session>& session,
                                    int32_t tier, bool explicit_request);

  // Requires session.state_mutex held. Starts a fresh monitor thread.
  void StartMonitorLocked(const std::shared_ptr<Session>& session);

  void MonitorLoop(std::shared_ptr<Session> session, util::CancellationToken token);

  // Moves the session to `terminal`, removes it from the registry and
  // retires the calling monitor thread. Requires session.state_mutex held.
  void FinalizeFromMonitorLocked(Session& session, SessionStatus terminal);

  void RemoveFromRegistry(const std::string& session_id);
  void CleanupArtifacts(const Session& session);
  void JoinRetiredThreads();

  void AdaptationLoop(util::CancellationToken token);

  void NotifyOwner(int64_t owner_id, const std::string& text);

  // Random v4 UUID, unique among live sessions. Requires start_mutex_ held.
  std::string NewSessionId();

  const SupervisorConfig config_;
  const profile::ProfileRegistry registry_;
  const command::CommandBuilder builder_;
  std::shared_ptr<process::IProcessLauncher> launcher_;
  std::shared_ptr<INotifier> notifier_;
  std::shared_ptr<ILoadSampler> sampler_;

  // Serializes Start() so the single-session-per-owner check and the
  // registry insert are atomic.
  std::mutex start_mutex_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  uint64_t next_start_seq_ = 1;

  std::mutex playlists_mutex_;
  std::unordered_map<int64_t, std::shared_ptr<playlist::PlaylistQueue>> playlists_;

  // Monitor threads that ended a session on their own; joined later.
  std::mutex retired_mutex_;
  std::vector<std::thread> retired_threads_;

  util::CancellationSource adaptation_cancel_;
  std::thread adaptation_thread_;

  std::atomic<bool> shutting_down_{false};
};

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_SESSION_SUPERVISOR_HPP_
