// Repository: OnAir-relay
// Component: Cancellation
// Purpose: Owner/observer cancellation pair for monitor and adaptation
//          threads; waits on it wake immediately when cancelled.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_UTIL_CANCELLATION_HPP_
#define ONAIR_UTIL_CANCELLATION_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace onair::util {

// Observer side, handed to worker threads. Copies share state.
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  bool IsCancellationRequested() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->requested;
  }

  // Sleeps for `d` or until cancelled. Returns false if cancelled.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, d, [this] { return state_->requested; });
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool requested = false;
  };
  std::shared_ptr<State> state_;

  friend class CancellationSource;
};

// Owner side. Cancel() is sticky; a new source is needed for a new task.
class CancellationSource {
 public:
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(token_.state_->mutex);
      token_.state_->requested = true;
    }
    token_.state_->cv.notify_all();
  }

  CancellationToken Token() const { return token_; }

 private:
  CancellationToken token_;
};

}  // namespace onair::util

#endif  // ONAIR_UTIL_CANCELLATION_HPP_
