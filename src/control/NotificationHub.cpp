// Repository: OnAir-relay
// Component: Notification Hub
// Copyright (c) 2026 OnAir

#include "control/NotificationHub.h"

#include <algorithm>

#include "onair/util/Logger.hpp"

namespace onair::control {

namespace {

int64_t NowUtcMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

// =============================================================================
// NotificationSubscription
// =============================================================================

NotificationSubscription::NotificationSubscription(std::optional<int64_t> owner_filter,
                                                   size_t capacity)
    : owner_filter_(owner_filter), capacity_(capacity == 0 ? 1 : capacity) {}

void NotificationSubscription::Push(OwnerNotification n) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(n));
  }
  cv_.notify_one();
}

std::optional<OwnerNotification> NotificationSubscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) return std::nullopt;
  OwnerNotification n = std::move(queue_.front());
  queue_.pop_front();
  return n;
}

void NotificationSubscription::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool NotificationSubscription::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

uint64_t NotificationSubscription::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

// =============================================================================
// NotificationHub
// =============================================================================

NotificationHub::NotificationHub(size_t queue_capacity) : queue_capacity_(queue_capacity) {}

NotificationHub::~NotificationHub() { CloseAll(); }

void NotificationHub::Notify(int64_t owner_id, const std::string& text) {
  util::Logger::Info("[Notify] owner " + std::to_string(owner_id) + ": " + text);

  OwnerNotification n{owner_id, text, NowUtcMs()};
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& sub : subscribers_) {
    if (sub->Matches(owner_id)) sub->Push(n);
  }
}

std::shared_ptr<NotificationSubscription> NotificationHub::Subscribe(
    std::optional<int64_t> owner_filter) {
  auto sub = std::make_shared<NotificationSubscription>(owner_filter, queue_capacity_);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(sub);
  return sub;
}

void NotificationHub::Unsubscribe(const std::shared_ptr<NotificationSubscription>& sub) {
  if (!sub) return;
  sub->Close();
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), sub),
                     subscribers_.end());
}

void NotificationHub::CloseAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& sub : subscribers_) sub->Close();
  subscribers_.clear();
}

size_t NotificationHub::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace onair::control
