// Repository: OnAir-relay
// Component: Session Supervisor Contract Tests
// Purpose: Lifecycle, bounded crash restarts, cancel-before-terminate,
//          pause/resume capability checks and owner notifications.
// Copyright (c) 2026 OnAir

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "SupervisorContractFixture.hpp"
#include "onair/util/Logger.hpp"

namespace onair::tests::contracts {

using runtime::SessionStatus;
using runtime::SupervisorError;

// =============================================================================
// Start
// =============================================================================

TEST_F(SupervisorContractTest, StartRunsEncoderAndRegistersSession) {
  const std::string id = StartOk(SingleFile(42));
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[14], '4');

  const auto view = View(id);
  EXPECT_EQ(view.id, id);
  EXPECT_EQ(view.owner_id, 42);
  EXPECT_EQ(view.status, SessionStatus::kRunning);
  EXPECT_EQ(view.profile_tier, 720);
  EXPECT_EQ(view.requested_tier, 720);
  EXPECT_TRUE(view.loop);
  EXPECT_EQ(view.restart_count, 0);
  EXPECT_EQ(view.source_kind, command::SourceKind::kSingleFile);
  EXPECT_EQ(view.destination_display, "rtmp://example/live/*****t123");
  EXPECT_GT(view.started_utc_ms, 0);

  ASSERT_EQ(launcher_->SpawnCount(), 1u);
  const auto args = launcher_->LastArgs();
  EXPECT_EQ(args.front(), "ffmpeg");
  EXPECT_EQ(args.back(), "rtmp://example/live/secret123");
  EXPECT_EQ(FakeProcessLauncher::ValueAfter(args, "-i"), "clip.mp4");
  EXPECT_EQ(FakeProcessLauncher::ValueAfter(args, "-stream_loop"), "-1");
  EXPECT_EQ(FakeProcessLauncher::ValueAfter(args, "-vf"), "scale=1280:720,fps=30");
}

TEST_F(SupervisorContractTest, ZeroTierUsesDefaultAndUnknownTierFallsBack) {
  const std::string a = StartOk(SingleFile(1, 0));
  const std::string b = StartOk(SingleFile(1, 999));
  EXPECT_EQ(View(a).profile_tier, 720);
  EXPECT_EQ(View(b).profile_tier, 720);
}

TEST_F(SupervisorContractTest, SessionIdsAreUnique) {
  std::vector<std::string> ids;
  for (int i = 0; i < 20; ++i) ids.push_back(StartOk(SingleFile(i % 3)));
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(std::adjacent_find(ids.begin(), ids.end()), ids.end());
  EXPECT_EQ(Supervisor().ListAll().size(), 20u);
}

TEST_F(SupervisorContractTest, SessionIdsStayUniqueAcrossStartStopCycles) {
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    const std::string id = StartOk(SingleFile(42));
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[14], '4');
    ids.insert(id);
    ASSERT_TRUE(Supervisor().Stop(id));
  }
  EXPECT_EQ(ids.size(), 100u);
  EXPECT_TRUE(Supervisor().ListAll().empty());
}

TEST_F(SupervisorContractTest, MissingDestinationIsConfigurationMissing) {
  auto request = SingleFile(42);
  request.destination = {};
  const auto r = Supervisor().Start(request);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, SupervisorError::kConfigurationMissing);
  EXPECT_EQ(launcher_->SpawnAttempts(), 0u);
  EXPECT_TRUE(Supervisor().ListAll().empty());
}

TEST_F(SupervisorContractTest, EmptyDestinationUsesConfiguredDefault) {
  config_.default_destination = {"rtmp://default/app/", "dkey1234"};
  auto request = SingleFile(42);
  request.destination = {};
  const std::string id = StartOk(request);
  EXPECT_EQ(launcher_->LastArgs().back(), "rtmp://default/app/dkey1234");
  EXPECT_EQ(View(id).destination_display, "rtmp://default/app/****1234");
}

TEST_F(SupervisorContractTest, SpawnFailureNeverEntersRunning) {
  launcher_->SetFailAll(true);
  const auto r = Supervisor().Start(SingleFile(42));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, SupervisorError::kSpawnError);
  EXPECT_NE(r.message.find("cannot execute 'ffmpeg'"), std::string::npos) << r.message;
  EXPECT_TRUE(Supervisor().ListAll().empty());
  EXPECT_TRUE(Supervisor().ListForOwner(42).empty());
}

TEST_F(SupervisorContractTest, UnmodelledSourceIsRejected) {
  auto request = SingleFile(42);
  request.source = std::monostate{};
  const auto r = Supervisor().Start(request);
  EXPECT_EQ(r.error, SupervisorError::kUnsupportedSourceKind);
  EXPECT_EQ(launcher_->SpawnAttempts(), 0u);
}

TEST_F(SupervisorContractTest, SingleSessionPerOwnerRejectsSecondStart) {
  config_.single_session_per_owner = true;
  const std::string id = StartOk(SingleFile(42));

  const auto second = Supervisor().Start(SingleFile(42));
  EXPECT_FALSE(second.success);
  EXPECT_EQ(second.error, SupervisorError::kAlreadyRunning);
  EXPECT_EQ(Supervisor().ListForOwner(42).size(), 1u);
  EXPECT_EQ(View(id).status, SessionStatus::kRunning);

  // Other owners are unaffected, and a stopped owner may start again.
  StartOk(SingleFile(7));
  ASSERT_TRUE(Supervisor().Stop(id));
  StartOk(SingleFile(42));
}

TEST_F(SupervisorContractTest, MultipleSessionsPerOwnerByDefault) {
  const std::string a = StartOk(SingleFile(42));
  const std::string b = StartOk(SingleFile(42));
  StartOk(SingleFile(7));

  const auto mine = Supervisor().ListForOwner(42);
  ASSERT_EQ(mine.size(), 2u);
  EXPECT_EQ(mine[0].id, a);
  EXPECT_EQ(mine[1].id, b);
  EXPECT_EQ(Supervisor().ListAll().size(), 3u);
}

TEST_F(SupervisorContractTest, EncoderOutputGoesToPerSessionLog) {
  config_.encoder_log_dir = temp_dir_ + "/logs/encoder";
  const std::string id = StartOk(SingleFile(42));
  EXPECT_EQ(launcher_->LastLogPath(), config_.encoder_log_dir + "/encoder_" + id + ".log");
  EXPECT_TRUE(FileExists(config_.encoder_log_dir));
}

TEST_F(SupervisorContractTest, InvalidConfigurationIsRejectedAtConstruction) {
  config_.default_tier = 360;
  EXPECT_THROW({ runtime::SessionSupervisor s(config_, launcher_, notifier_); },
               std::invalid_argument);
  config_.default_tier = 720;
  EXPECT_THROW({ runtime::SessionSupervisor s(config_, nullptr, notifier_); },
               std::invalid_argument);
}

// =============================================================================
// Prefix lookup
// =============================================================================

TEST_F(SupervisorContractTest, PrefixResolvesWithinOwner) {
  const std::string a = StartOk(SingleFile(42));
  const std::string b = StartOk(SingleFile(42));
  const std::string other = StartOk(SingleFile(7));

  auto first = Supervisor().ResolvePrefix(42, "");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, a);

  auto exact = Supervisor().ResolvePrefix(42, b);
  ASSERT_TRUE(exact.has_value());
  EXPECT_EQ(exact->id, b);

  EXPECT_FALSE(Supervisor().ResolvePrefix(42, other).has_value());
  EXPECT_FALSE(Supervisor().ResolvePrefix(42, "zzzz").has_value());
}

// =============================================================================
// Crash restarts
// =============================================================================

TEST_F(SupervisorContractTest, ExternalKillRestartsWithinBackoff) {
  const std::string id = StartOk(SingleFile(42));
  const auto first = launcher_->Latest();

  ASSERT_TRUE(CrashAndAwaitRestart());
  ASSERT_TRUE(Eventually([&] { return View(id).restart_count == 1; }));
  const auto view = View(id);
  EXPECT_EQ(view.status, SessionStatus::kRunning);
  EXPECT_EQ(view.id, id);
  EXPECT_NE(launcher_->Latest(), first);
  EXPECT_EQ(launcher_->ArgsAt(1), launcher_->ArgsAt(0));

  EXPECT_TRUE(Eventually([&] { return notifier_->AnyContains("is live again"); }));
  EXPECT_TRUE(notifier_->AnyContains("encoder exited (signal 9). Restarting in 0.0s (1/5)."));
}

TEST_F(SupervisorContractTest, RestartCountTracksEveryExitUntilCeiling) {
  const std::string id = StartOk(SingleFile(42));

  for (int n = 1; n <= 5; ++n) {
    ASSERT_TRUE(CrashAndAwaitRestart()) << "exit " << n;
    const auto view = View(id);
    EXPECT_EQ(view.restart_count, n);
    EXPECT_EQ(view.status, SessionStatus::kRunning);
  }

  launcher_->Latest()->KillExternally();
  ASSERT_TRUE(AwaitGone(id));
  EXPECT_TRUE(Supervisor().ListAll().empty());
  EXPECT_EQ(launcher_->SpawnCount(), 6u);
  EXPECT_TRUE(Eventually([&] { return notifier_->AnyContains("Restart limit (5) reached."); }));
  EXPECT_EQ(notifier_->CountContaining("crashed"), 1u);
}

TEST_F(SupervisorContractTest, ZeroCeilingCrashesOnFirstExit) {
  config_.restart_ceiling = 0;
  const std::string id = StartOk(SingleFile(42));
  launcher_->Latest()->KillExternally();
  ASSERT_TRUE(AwaitGone(id));
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
}

TEST_F(SupervisorContractTest, FailedRelaunchesCountAgainstCeiling) {
  const std::string id = StartOk(SingleFile(42));
  launcher_->SetFailAll(true);
  launcher_->Latest()->ExitWithCode(1);

  ASSERT_TRUE(AwaitGone(id));
  EXPECT_EQ(launcher_->SpawnAttempts(), 6u);
  EXPECT_TRUE(Eventually([&] { return notifier_->AnyContains("Restart limit (5) reached."); }));
}

TEST_F(SupervisorContractTest, CleanExitIsAlsoRestarted) {
  const std::string id = StartOk(SingleFile(42, 720, false));
  const size_t before = launcher_->SpawnCount();
  launcher_->Latest()->ExitWithCode(0);
  ASSERT_TRUE(Eventually([&] { return launcher_->SpawnCount() == before + 1; }));
  EXPECT_TRUE(Eventually([&] { return notifier_->AnyContains("encoder exited (exit 0)"); }));
  EXPECT_EQ(View(id).restart_count, 1);
}

// =============================================================================
// Stop
// =============================================================================

TEST_F(SupervisorContractTest, StopNeverCountsAsCrash) {
  const std::string id = StartOk(SingleFile(42));
  const auto proc = launcher_->Latest();

  EXPECT_TRUE(Supervisor().Stop(id));
  EXPECT_TRUE(proc->WasTerminated());
  EXPECT_FALSE(Supervisor().Get(id).has_value());
  EXPECT_TRUE(Supervisor().ListAll().empty());
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
  EXPECT_EQ(notifier_->CountContaining("Restarting"), 0u);
  EXPECT_EQ(notifier_->CountContaining("crashed"), 0u);

  EXPECT_FALSE(Supervisor().Stop(id));
  EXPECT_FALSE(Supervisor().Stop("no-such-session"));
}

TEST_F(SupervisorContractTest, StopDuringBackoffCancelsPendingRestart) {
  config_.restart_backoff = 2000ms;
  const std::string id = StartOk(SingleFile(42));
  launcher_->Latest()->KillExternally();
  ASSERT_TRUE(Eventually([&] { return notifier_->AnyContains("Restarting in 2.0s"); }));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(Supervisor().Stop(id));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
  EXPECT_FALSE(Supervisor().Get(id).has_value());
}

TEST_F(SupervisorContractTest, StopRacingCrashNeverRestarts) {
  for (int i = 0; i < 25; ++i) {
    const std::string id = StartOk(SingleFile(42));
    const auto proc = launcher_->Latest();
    std::thread killer([proc] { proc->KillExternally(); });
    Supervisor().Stop(id);
    killer.join();
    EXPECT_FALSE(Supervisor().Get(id).has_value());
  }
  // A crash observed before the stop may have restarted once; the stop then
  // terminated that replacement. Nothing is live afterwards.
  EXPECT_TRUE(Supervisor().ListAll().empty());
  for (size_t i = 0; i < launcher_->SpawnCount(); ++i) {
    EXPECT_TRUE(launcher_->Process(i)->HasExited()) << "encoder " << i << " left running";
  }
}

TEST_F(SupervisorContractTest, StopAllForOwner) {
  StartOk(SingleFile(42));
  StartOk(SingleFile(42));
  const std::string other = StartOk(SingleFile(7));

  EXPECT_EQ(Supervisor().StopAllForOwner(42), 2u);
  EXPECT_TRUE(Supervisor().ListForOwner(42).empty());
  EXPECT_TRUE(Supervisor().Get(other).has_value());
  EXPECT_EQ(Supervisor().StopAllForOwner(42), 0u);
}

// =============================================================================
// Pause / Resume
// =============================================================================

TEST_F(SupervisorContractTest, PauseResumePreservesIdentity) {
  const std::string id = StartOk(SingleFile(42, 1080));
  ASSERT_TRUE(CrashAndAwaitRestart());
  ASSERT_TRUE(Eventually([&] { return View(id).restart_count == 1; }));
  const auto proc = launcher_->Latest();

  const auto paused = Supervisor().Pause(id);
  ASSERT_TRUE(paused.success) << paused.message;
  EXPECT_EQ(View(id).status, SessionStatus::kPaused);
  EXPECT_TRUE(proc->IsSuspended());

  const auto resumed = Supervisor().Resume(id);
  ASSERT_TRUE(resumed.success) << resumed.message;
  const auto view = View(id);
  EXPECT_EQ(view.status, SessionStatus::kRunning);
  EXPECT_EQ(view.id, id);
  EXPECT_EQ(view.restart_count, 1);
  EXPECT_EQ(view.profile_tier, 1080);
  EXPECT_FALSE(proc->IsSuspended());
  EXPECT_EQ(launcher_->Latest(), proc);
}

TEST_F(SupervisorContractTest, PauseUnsupportedLeavesStateUnchanged) {
  launcher_->SetSuspendSupported(false);
  const std::string id = StartOk(SingleFile(42));
  const auto r = Supervisor().Pause(id);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, SupervisorError::kUnsupportedOperation);
  EXPECT_EQ(View(id).status, SessionStatus::kRunning);
}

TEST_F(SupervisorContractTest, PauseResumePreconditions) {
  const std::string id = StartOk(SingleFile(42));
  EXPECT_EQ(Supervisor().Resume(id).error, SupervisorError::kInvalidState);
  ASSERT_TRUE(Supervisor().Pause(id).success);
  EXPECT_EQ(Supervisor().Pause(id).error, SupervisorError::kInvalidState);
  EXPECT_EQ(Supervisor().Pause("missing").error, SupervisorError::kNotFound);
  EXPECT_EQ(Supervisor().Resume("missing").error, SupervisorError::kNotFound);

  ASSERT_TRUE(Supervisor().Stop(id));
  EXPECT_EQ(Supervisor().Resume(id).error, SupervisorError::kNotFound);
}

TEST_F(SupervisorContractTest, ExitWhilePausedRestartsToRunning) {
  const std::string id = StartOk(SingleFile(42));
  ASSERT_TRUE(Supervisor().Pause(id).success);
  ASSERT_TRUE(CrashAndAwaitRestart());
  ASSERT_TRUE(Eventually([&] { return View(id).status == SessionStatus::kRunning; }));
  EXPECT_EQ(View(id).restart_count, 1);
}

TEST_F(SupervisorContractTest, StopPausedSession) {
  const std::string id = StartOk(SingleFile(42));
  ASSERT_TRUE(Supervisor().Pause(id).success);
  const auto proc = launcher_->Latest();
  EXPECT_TRUE(Supervisor().Stop(id));
  EXPECT_TRUE(proc->WasTerminated());
  EXPECT_EQ(notifier_->CountContaining("Restarting"), 0u);
}

// =============================================================================
// Internal start and notifications
// =============================================================================

TEST_F(SupervisorContractTest, InternalStartNotifiesOwner) {
  const auto r = Supervisor().StartInternal(SingleFile(42));
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(notifier_->AnyContains("Broadcast " + r.session_id.substr(0, 8) +
                                     " started automatically (720p)."));

  auto bad = SingleFile(42);
  bad.destination = {};
  const auto failed = Supervisor().StartInternal(bad);
  EXPECT_FALSE(failed.success);
  EXPECT_TRUE(notifier_->AnyContains("Automatic broadcast start failed"));

  // Operator starts are answered by the caller, not notified.
  const size_t before = notifier_->Count();
  Supervisor().Start(bad);
  EXPECT_EQ(notifier_->Count(), before);
}

TEST_F(SupervisorContractTest, NotifierFailuresNeverBlockTransitions) {
  notifier_ = std::make_shared<fixtures::RecordingNotifier>(true);
  const std::string id = StartOk(SingleFile(42));
  ASSERT_TRUE(CrashAndAwaitRestart());
  ASSERT_TRUE(Eventually([&] { return View(id).restart_count == 1; }));
  EXPECT_EQ(View(id).status, SessionStatus::kRunning);
  EXPECT_GE(notifier_->Count(), 1u);
  EXPECT_TRUE(Supervisor().Stop(id));
}

TEST_F(SupervisorContractTest, StreamKeyNeverReachesLogsOrNotifications) {
  std::mutex mutex;
  std::vector<std::string> lines;
  auto capture = [&](const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex);
    lines.push_back(line);
  };
  util::Logger::SetInfoSink(capture);
  util::Logger::SetErrorSink(capture);

  const std::string id = StartOk(SingleFile(42));
  CrashAndAwaitRestart();
  Eventually([&] { return notifier_->AnyContains("is live again"); });
  Supervisor().ChangeProfile(id, 480);
  Supervisor().Stop(id);

  util::Logger::SetInfoSink(nullptr);
  util::Logger::SetErrorSink(nullptr);

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_FALSE(lines.empty());
  bool saw_masked = false;
  for (const auto& line : lines) {
    EXPECT_EQ(line.find("secret123"), std::string::npos) << line;
    if (line.find("*****t123") != std::string::npos) saw_masked = true;
  }
  EXPECT_TRUE(saw_masked);
  for (const auto& [owner, text] : notifier_->Messages()) {
    EXPECT_EQ(text.find("secret123"), std::string::npos) << text;
  }
}

// =============================================================================
// Shutdown
// =============================================================================

TEST_F(SupervisorContractTest, ShutdownStopsEverySession) {
  StartOk(SingleFile(1));
  StartOk(SingleFile(2));
  const std::string paused = StartOk(SingleFile(3));
  ASSERT_TRUE(Supervisor().Pause(paused).success);

  Supervisor().Shutdown();
  EXPECT_TRUE(Supervisor().ListAll().empty());
  for (size_t i = 0; i < launcher_->SpawnCount(); ++i) {
    EXPECT_TRUE(launcher_->Process(i)->WasTerminated());
  }
  EXPECT_EQ(notifier_->CountContaining("stopped: service shutting down."), 3u);

  const auto late = Supervisor().Start(SingleFile(4));
  EXPECT_FALSE(late.success);
  EXPECT_EQ(late.error, SupervisorError::kInvalidState);
}

TEST_F(SupervisorContractTest, DestructionJoinsMonitorThatCrashedItsSession) {
  config_.restart_ceiling = 0;
  auto launcher = std::make_shared<FakeProcessLauncher>();
  auto notifier = std::make_shared<fixtures::RecordingNotifier>();
  {
    runtime::SessionSupervisor supervisor(config_, launcher, notifier);
    const auto r = supervisor.Start(SingleFile(42));
    ASSERT_TRUE(r.success);
    launcher->Latest()->KillExternally();
    ASSERT_TRUE(Eventually([&] { return !supervisor.Get(r.session_id).has_value(); }));
  }
  EXPECT_EQ(notifier->CountContaining("Restart limit (0) reached."), 1u);
  EXPECT_EQ(notifier->CountContaining("service shutting down"), 0u);
}

TEST_F(SupervisorContractTest, DestructionRacingSelfFinalizingMonitorIsClean) {
  config_.restart_ceiling = 0;
  for (int i = 0; i < 200; ++i) {
    auto launcher = std::make_shared<FakeProcessLauncher>();
    auto notifier = std::make_shared<fixtures::RecordingNotifier>();
    {
      runtime::SessionSupervisor supervisor(config_, launcher, notifier);
      ASSERT_TRUE(supervisor.Start(SingleFile(42)).success);
      launcher->Latest()->KillExternally();
    }
    // Either the monitor ended the session or shutdown stopped it; every
    // notice was delivered before destruction returned.
    EXPECT_EQ(notifier->CountContaining("crashed") +
                  notifier->CountContaining("stopped: service shutting down."),
              1u)
        << "iteration " << i;
  }
}

// =============================================================================
// Example scenario: owner 42, clip.mp4, 720p, looping
// =============================================================================

TEST_F(SupervisorContractTest, OwnerFortyTwoScenario) {
  const std::string id = StartOk(SingleFile(42, 720, true));
  EXPECT_EQ(View(id).status, SessionStatus::kRunning);

  ASSERT_TRUE(CrashAndAwaitRestart());
  ASSERT_TRUE(Eventually([&] { return View(id).restart_count == 1; }));
  EXPECT_EQ(View(id).status, SessionStatus::kRunning);

  for (int n = 2; n <= 5; ++n) ASSERT_TRUE(CrashAndAwaitRestart());
  launcher_->Latest()->KillExternally();
  ASSERT_TRUE(AwaitGone(id));
  EXPECT_FALSE(Supervisor().Get(id).has_value());
}

}  // namespace onair::tests::contracts
