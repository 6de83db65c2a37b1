// Repository: OnAir-relay
// Component: Notification Hub Tests
// Copyright (c) 2026 OnAir

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "control/NotificationHub.h"

using namespace onair::control;
using namespace std::chrono_literals;

TEST(NotificationHubTest, FansOutToMatchingSubscribers) {
  NotificationHub hub;
  auto all = hub.Subscribe(std::nullopt);
  auto owner42 = hub.Subscribe(42);
  auto owner7 = hub.Subscribe(7);
  EXPECT_EQ(hub.SubscriberCount(), 3u);

  hub.Notify(42, "Broadcast 3f2a9c1e is live again.");

  auto a = all->Next(100ms);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->owner_id, 42);
  EXPECT_EQ(a->text, "Broadcast 3f2a9c1e is live again.");
  EXPECT_GT(a->emitted_utc_ms, 0);

  ASSERT_TRUE(owner42->Next(100ms).has_value());
  EXPECT_FALSE(owner7->Next(20ms).has_value());
}

TEST(NotificationHubTest, FullQueueDropsOldest) {
  NotificationHub hub(2);
  auto sub = hub.Subscribe(std::nullopt);
  hub.Notify(1, "one");
  hub.Notify(1, "two");
  hub.Notify(1, "three");

  EXPECT_EQ(sub->DroppedCount(), 1u);
  EXPECT_EQ(sub->Next(10ms)->text, "two");
  EXPECT_EQ(sub->Next(10ms)->text, "three");
  EXPECT_FALSE(sub->Next(10ms).has_value());
}

TEST(NotificationHubTest, NextWakesOnNotifyFromAnotherThread) {
  NotificationHub hub;
  auto sub = hub.Subscribe(5);
  std::thread notifier([&] {
    std::this_thread::sleep_for(30ms);
    hub.Notify(5, "late");
  });
  auto n = sub->Next(2000ms);
  notifier.join();
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(n->text, "late");
}

TEST(NotificationHubTest, UnsubscribeAndCloseAll) {
  NotificationHub hub;
  auto a = hub.Subscribe(std::nullopt);
  auto b = hub.Subscribe(std::nullopt);
  hub.Unsubscribe(a);
  EXPECT_EQ(hub.SubscriberCount(), 1u);

  hub.Notify(1, "only b");
  EXPECT_FALSE(a->Next(10ms).has_value());

  hub.CloseAll();
  EXPECT_TRUE(b->IsClosed());
  // Closed subscriptions drain what they already hold, then end.
  EXPECT_EQ(b->Next(10ms)->text, "only b");
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(b->Next(2000ms).has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}
