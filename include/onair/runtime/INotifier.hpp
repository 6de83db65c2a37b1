// Repository: OnAir-relay
// Component: Notifier Boundary
// Purpose: One-way owner notifications emitted by the supervisor.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_RUNTIME_INOTIFIER_HPP_
#define ONAIR_RUNTIME_INOTIFIER_HPP_

#include <cstdint>
#include <string>

namespace onair::runtime {

// Implemented by the messaging layer. Must not block for long: it is called
// from monitor threads. Exceptions are caught and logged by the supervisor;
// delivery failure never affects a session.
class INotifier {
 public:
  virtual ~INotifier() = default;
  virtual void Notify(int64_t owner_id, const std::string& text) = 0;
};

// Drops everything. Used when no messaging layer is attached.
class NullNotifier : public INotifier {
 public:
  void Notify(int64_t, const std::string&) override {}
};

}  // namespace onair::runtime

#endif  // ONAIR_RUNTIME_INOTIFIER_HPP_
