// Repository: OnAir-relay
// Component: Notification Hub
// Purpose: Fans supervisor notifications out to streaming subscribers
//          without ever blocking the notifying thread.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_CONTROL_NOTIFICATION_HUB_H_
#define ONAIR_CONTROL_NOTIFICATION_HUB_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "onair/runtime/INotifier.hpp"

namespace onair::control {

struct OwnerNotification {
  int64_t owner_id = 0;
  std::string text;
  int64_t emitted_utc_ms = 0;
};

// One subscriber's bounded queue. When full, the oldest entry is dropped.
class NotificationSubscription {
 public:
  NotificationSubscription(std::optional<int64_t> owner_filter, size_t capacity);

  bool Matches(int64_t owner_id) const {
    return !owner_filter_ || *owner_filter_ == owner_id;
  }

  // Never blocks.
  void Push(OwnerNotification n);

  // Waits up to `timeout`. nullopt on timeout or once closed and drained.
  std::optional<OwnerNotification> Next(std::chrono::milliseconds timeout);

  void Close();
  bool IsClosed() const;

  uint64_t DroppedCount() const;

 private:
  const std::optional<int64_t> owner_filter_;
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<OwnerNotification> queue_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
};

class NotificationHub : public runtime::INotifier {
 public:
  static constexpr size_t kDefaultQueueCapacity = 64;

  explicit NotificationHub(size_t queue_capacity = kDefaultQueueCapacity);
  ~NotificationHub() override;

  // Called by the supervisor from monitor/adaptation/operator threads.
  void Notify(int64_t owner_id, const std::string& text) override;

  // nullopt filter => every owner.
  std::shared_ptr<NotificationSubscription> Subscribe(std::optional<int64_t> owner_filter);
  void Unsubscribe(const std::shared_ptr<NotificationSubscription>& sub);

  // Closes every subscription so streaming RPCs return (server shutdown).
  void CloseAll();

  size_t SubscriberCount() const;

 private:
  const size_t queue_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<NotificationSubscription>> subscribers_;
};

}  // namespace onair::control

#endif  // ONAIR_CONTROL_NOTIFICATION_HUB_H_
