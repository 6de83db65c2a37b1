// Repository: OnAir-relay
// Component: Session
// Copyright (c) 2026 OnAir

#include "onair/runtime/Session.hpp"

namespace onair::runtime {

Session::Session(std::string id_in, int64_t owner_id_in, command::SourceDescriptor source_in,
                 command::DestinationDescriptor destination_in, bool loop_in,
                 std::string manifest_path_in, std::string encoder_log_path_in,
                 uint64_t start_seq_in, int64_t started_utc_ms_in)
    : id(std::move(id_in)),
      owner_id(owner_id_in),
      source(std::move(source_in)),
      destination(std::move(destination_in)),
      loop(loop_in),
      manifest_path(std::move(manifest_path_in)),
      encoder_log_path(std::move(encoder_log_path_in)),
      start_seq(start_seq_in),
      started_utc_ms(started_utc_ms_in) {}

Session::~Session() {
  // Normally already joined or retired by the supervisor.
  monitor_cancel.Cancel();
  if (monitor.joinable() && monitor.get_id() != std::this_thread::get_id()) {
    monitor.join();
  } else if (monitor.joinable()) {
    monitor.detach();
  }
}

SessionView Session::View() const {
  std::lock_guard<std::mutex> lock(state_mutex);
  return ViewLocked();
}

SessionView Session::ViewLocked() const {
  SessionView v;
  v.id = id;
  v.owner_id = owner_id;
  v.status = status;
  v.profile_tier = profile.tier;
  v.requested_tier = requested_tier;
  v.loop = loop;
  v.restart_count = restart_count;
  v.source_kind = command::KindOf(source);
  v.destination_display = destination.DisplayUrl();
  v.started_utc_ms = started_utc_ms;
  return v;
}

}  // namespace onair::runtime
