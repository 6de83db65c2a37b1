// Repository: OnAir-relay
// Component: Profile Registry Tests
// Purpose: Builtin tier table, default fallback and neighbour lookup.
// Copyright (c) 2026 OnAir

#include <gtest/gtest.h>

#include <stdexcept>

#include "onair/profile/ProfileRegistry.hpp"

using namespace onair;

namespace {

profile::ProfileRegistry Builtin() {
  return profile::ProfileRegistry(profile::ProfileRegistry::BuiltinProfiles(),
                                  profile::kDefaultTier);
}

}  // namespace

TEST(ProfileRegistryTest, BuiltinTiersMatchPublishedTable) {
  const auto registry = Builtin();
  EXPECT_EQ(registry.Tiers(), (std::vector<int32_t>{480, 720, 1080}));

  const auto p480 = registry.Resolve(480);
  EXPECT_EQ(p480.width, 854);
  EXPECT_EQ(p480.height, 480);
  EXPECT_EQ(p480.video_bitrate, "1500k");
  EXPECT_EQ(p480.buffer_size, "3000k");

  const auto p720 = registry.Resolve(720);
  EXPECT_EQ(p720.width, 1280);
  EXPECT_EQ(p720.height, 720);
  EXPECT_EQ(p720.video_bitrate, "2500k");
  EXPECT_EQ(p720.buffer_size, "5000k");

  const auto p1080 = registry.Resolve(1080);
  EXPECT_EQ(p1080.width, 1920);
  EXPECT_EQ(p1080.height, 1080);
  EXPECT_EQ(p1080.video_bitrate, "4500k");
  EXPECT_EQ(p1080.buffer_size, "9000k");

  for (int32_t tier : registry.Tiers()) {
    const auto p = registry.Resolve(tier);
    EXPECT_EQ(p.frame_rate, (profile::FrameRate{30, 1}));
    EXPECT_EQ(p.audio_bitrate, "128k");
    EXPECT_EQ(p.tier, tier);
  }
}

TEST(ProfileRegistryTest, UnknownTierResolvesToDefault) {
  const auto registry = Builtin();
  EXPECT_EQ(registry.Resolve(999), registry.Resolve(720));
  EXPECT_EQ(registry.Resolve(0), registry.Resolve(720));
  EXPECT_EQ(registry.Resolve(-1).tier, 720);
}

TEST(ProfileRegistryTest, NeighbourTiers) {
  const auto registry = Builtin();
  EXPECT_EQ(registry.LowerTier(1080), 720);
  EXPECT_EQ(registry.LowerTier(720), 480);
  EXPECT_FALSE(registry.LowerTier(480).has_value());
  EXPECT_EQ(registry.HigherTier(480), 720);
  EXPECT_EQ(registry.HigherTier(720), 1080);
  EXPECT_FALSE(registry.HigherTier(1080).has_value());
  EXPECT_FALSE(registry.HigherTier(555).has_value());
  EXPECT_FALSE(registry.LowerTier(555).has_value());
}

TEST(ProfileRegistryTest, RejectsInvalidTables) {
  EXPECT_THROW(profile::ProfileRegistry({}, 720), std::invalid_argument);

  auto dup = profile::ProfileRegistry::BuiltinProfiles();
  dup.push_back(dup.front());
  EXPECT_THROW(profile::ProfileRegistry(dup, 720), std::invalid_argument);

  EXPECT_THROW(profile::ProfileRegistry(profile::ProfileRegistry::BuiltinProfiles(), 360),
               std::invalid_argument);
}

TEST(FrameRateTest, RendersExactRatio) {
  EXPECT_EQ((profile::FrameRate{30, 1}).ToString(), "30");
  EXPECT_EQ((profile::FrameRate{30000, 1001}).ToString(), "30000/1001");
  EXPECT_EQ((profile::FrameRate{30000, 1001}).CeilFps(), 30);
  EXPECT_EQ((profile::FrameRate{25, 1}).CeilFps(), 25);
  EXPECT_FALSE((profile::FrameRate{0, 1}).IsValid());
}
