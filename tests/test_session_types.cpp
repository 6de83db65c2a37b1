// Repository: OnAir-relay
// Component: Session Type Tests
// Copyright (c) 2026 OnAir

#include <gtest/gtest.h>

#include <stdexcept>

#include "onair/runtime/SessionTypes.hpp"

using namespace onair::runtime;

TEST(SessionStatusTest, NamesRoundTrip) {
  for (auto s : {SessionStatus::kRunning, SessionStatus::kPaused, SessionStatus::kStopping,
                 SessionStatus::kStopped, SessionStatus::kCrashed}) {
    EXPECT_EQ(SessionStatusFromString(SessionStatusToString(s)), s);
  }
  EXPECT_STREQ(SessionStatusToString(SessionStatus::kRunning), "running");
  EXPECT_THROW(SessionStatusFromString("live"), std::invalid_argument);
}

TEST(SessionStatusTest, OnlyStoppedAndCrashedAreTerminal) {
  EXPECT_FALSE(IsTerminal(SessionStatus::kRunning));
  EXPECT_FALSE(IsTerminal(SessionStatus::kPaused));
  EXPECT_FALSE(IsTerminal(SessionStatus::kStopping));
  EXPECT_TRUE(IsTerminal(SessionStatus::kStopped));
  EXPECT_TRUE(IsTerminal(SessionStatus::kCrashed));
}

TEST(SupervisorErrorTest, Names) {
  EXPECT_STREQ(SupervisorErrorToString(SupervisorError::kAlreadyRunning), "ALREADY_RUNNING");
  EXPECT_STREQ(SupervisorErrorToString(SupervisorError::kConfigurationMissing),
               "CONFIGURATION_MISSING");
  EXPECT_STREQ(SupervisorErrorToString(SupervisorError::kRestartCeilingExceeded),
               "RESTART_CEILING_EXCEEDED");
}

TEST(FormatStatusTest, RendersOperatorBlock) {
  SessionView view;
  view.id = "3f2a9c1e-0000-4000-8000-000000000000";
  view.owner_id = 42;
  view.status = SessionStatus::kRunning;
  view.profile_tier = 720;
  view.requested_tier = 1080;
  view.loop = true;
  view.restart_count = 1;
  view.source_kind = onair::command::SourceKind::kSingleFile;
  view.destination_display = "rtmp://example/live/*****t123";

  EXPECT_EQ(FormatStatus(view, 5),
            "Session 3f2a9c1e\n"
            "Status: running\n"
            "Quality: 720p (requested 1080p)\n"
            "Source: single_file\n"
            "Loop: on\n"
            "Restarts: 1/5\n"
            "Destination: rtmp://example/live/*****t123");

  view.requested_tier = 720;
  view.loop = false;
  view.status = SessionStatus::kPaused;
  const std::string text = FormatStatus(view, 3);
  EXPECT_NE(text.find("Quality: 720p\n"), std::string::npos) << text;
  EXPECT_NE(text.find("Status: paused"), std::string::npos);
  EXPECT_NE(text.find("Loop: off"), std::string::npos);
  EXPECT_NE(text.find("Restarts: 1/3"), std::string::npos);
}
