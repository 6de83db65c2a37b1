// Repository: OnAir-relay
// Component: BroadcastControl gRPC Service Implementation
// Copyright (c) 2026 OnAir

#include "control/BroadcastControlService.h"

#include <string>
#include <utility>

#include "onair/util/Logger.hpp"

namespace onair::control {

namespace {

constexpr const char* kTag = "[BroadcastControl] ";

v1::SessionStatus ToProto(runtime::SessionStatus s) {
  switch (s) {
    case runtime::SessionStatus::kRunning:
      return v1::SESSION_STATUS_RUNNING;
    case runtime::SessionStatus::kPaused:
      return v1::SESSION_STATUS_PAUSED;
    case runtime::SessionStatus::kStopping:
      return v1::SESSION_STATUS_STOPPING;
    case runtime::SessionStatus::kStopped:
      return v1::SESSION_STATUS_STOPPED;
    case runtime::SessionStatus::kCrashed:
      return v1::SESSION_STATUS_CRASHED;
  }
  return v1::SESSION_STATUS_UNSPECIFIED;
}

v1::SourceKind ToProto(command::SourceKind k) {
  switch (k) {
    case command::SourceKind::kSingleFile:
      return v1::SOURCE_KIND_SINGLE_FILE;
    case command::SourceKind::kCompositeAudio:
      return v1::SOURCE_KIND_COMPOSITE_AUDIO;
    case command::SourceKind::kPlaylist:
      return v1::SOURCE_KIND_PLAYLIST;
    case command::SourceKind::kUnsupported:
      break;
  }
  return v1::SOURCE_KIND_UNSPECIFIED;
}

void FillItem(const playlist::PlaylistItem& item, v1::PlaylistItem* out) {
  out->set_item_id(item.item_id);
  out->set_position(item.position);
  out->set_path(item.path);
  out->set_title(item.title);
  out->set_played(item.played);
}

grpc::Status FromPlaylistError(playlist::PlaylistError e, int64_t item_id) {
  switch (e) {
    case playlist::PlaylistError::kNone:
      return grpc::Status::OK;
    case playlist::PlaylistError::kEmptyQueue:
      return grpc::Status(grpc::StatusCode::OUT_OF_RANGE, "playlist has no unplayed items");
    case playlist::PlaylistError::kItemNotFound:
      return grpc::Status(grpc::StatusCode::NOT_FOUND,
                          "no playlist item " + std::to_string(item_id));
    case playlist::PlaylistError::kItemPlayed:
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                          "playlist item " + std::to_string(item_id) + " was already played");
  }
  return grpc::Status(grpc::StatusCode::INTERNAL, "unknown playlist error");
}

command::SourceDescriptor SourceFromRequest(const v1::StartSessionRequest& request,
                                            runtime::SessionSupervisor& supervisor) {
  switch (request.source_case()) {
    case v1::StartSessionRequest::kSingleFile:
      return command::SingleFileSource{request.single_file().path()};
    case v1::StartSessionRequest::kCompositeAudio:
      return command::CompositeAudioSource{request.composite_audio().audio_path(),
                                           request.composite_audio().image_path()};
    case v1::StartSessionRequest::kPlaylist:
      return command::PlaylistSource{supervisor.OwnerPlaylist(request.owner_id())};
    case v1::StartSessionRequest::SOURCE_NOT_SET:
      break;
  }
  return std::monostate{};
}

}  // namespace

grpc::StatusCode ToGrpcCode(runtime::SupervisorError e) {
  using runtime::SupervisorError;
  switch (e) {
    case SupervisorError::kNone:
      return grpc::StatusCode::OK;
    case SupervisorError::kAlreadyRunning:
      return grpc::StatusCode::ALREADY_EXISTS;
    case SupervisorError::kNotFound:
      return grpc::StatusCode::NOT_FOUND;
    case SupervisorError::kConfigurationMissing:
    case SupervisorError::kInvalidState:
      return grpc::StatusCode::FAILED_PRECONDITION;
    case SupervisorError::kUnsupportedSourceKind:
    case SupervisorError::kUnsupportedOperation:
      return grpc::StatusCode::UNIMPLEMENTED;
    case SupervisorError::kEmptyQueue:
      return grpc::StatusCode::OUT_OF_RANGE;
    case SupervisorError::kSpawnError:
      return grpc::StatusCode::UNAVAILABLE;
    case SupervisorError::kRestartCeilingExceeded:
      return grpc::StatusCode::ABORTED;
  }
  return grpc::StatusCode::INTERNAL;
}

BroadcastControlImpl::BroadcastControlImpl(std::shared_ptr<runtime::SessionSupervisor> supervisor,
                                           std::shared_ptr<NotificationHub> hub)
    : supervisor_(std::move(supervisor)), hub_(std::move(hub)) {}

BroadcastControlImpl::~BroadcastControlImpl() { CloseStreams(); }

void BroadcastControlImpl::BeginShutdown() {
  // Sessions are stopped first so their "service shutting down" notices are
  // queued on the streams before those streams close.
  if (supervisor_) supervisor_->Shutdown();
  CloseStreams();
}

void BroadcastControlImpl::CloseStreams() {
  shutting_down_.store(true);
  if (hub_) hub_->CloseAll();
}

void BroadcastControlImpl::FillSessionInfo(const runtime::SessionView& view,
                                           v1::SessionInfo* out) const {
  out->set_session_id(view.id);
  out->set_owner_id(view.owner_id);
  out->set_status(ToProto(view.status));
  out->set_profile_tier(view.profile_tier);
  out->set_requested_tier(view.requested_tier);
  out->set_loop(view.loop);
  out->set_restart_count(view.restart_count);
  out->set_restart_ceiling(supervisor_->RestartCeiling());
  out->set_source_kind(ToProto(view.source_kind));
  out->set_destination(view.destination_display);
  out->set_started_utc_ms(view.started_utc_ms);
  out->set_status_text(runtime::FormatStatus(view, supervisor_->RestartCeiling()));
}

grpc::Status BroadcastControlImpl::RespondWithSession(const std::string& session_id,
                                                      v1::SessionResponse* response) const {
  auto view = supervisor_->Get(session_id);
  if (!view) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "no live session " + session_id);
  }
  FillSessionInfo(*view, response->mutable_session());
  return grpc::Status::OK;
}

// =============================================================================
// Session lifecycle
// =============================================================================

grpc::Status BroadcastControlImpl::StartSession(grpc::ServerContext* /*context*/,
                                                const v1::StartSessionRequest* request,
                                                v1::SessionResponse* response) {
  util::Logger::Info(std::string(kTag) + "StartSession owner=" +
                     std::to_string(request->owner_id()) + " tier=" +
                     std::to_string(request->tier()) + " loop=" +
                     (request->loop() ? "on" : "off"));

  runtime::StartRequest start;
  start.owner_id = request->owner_id();
  start.source = SourceFromRequest(*request, *supervisor_);
  start.destination.base_endpoint = request->destination().base_endpoint();
  start.destination.stream_key = request->destination().stream_key();
  start.tier = request->tier();
  start.loop = request->loop();

  const runtime::StartResult result = supervisor_->Start(start);
  if (!result.success) {
    return grpc::Status(ToGrpcCode(result.error), result.message);
  }
  return RespondWithSession(result.session_id, response);
}

grpc::Status BroadcastControlImpl::StopSession(grpc::ServerContext* /*context*/,
                                               const v1::StopSessionRequest* request,
                                               v1::StopSessionResponse* response) {
  util::Logger::Info(std::string(kTag) + "StopSession " + request->session_id());
  response->set_stopped(supervisor_->Stop(request->session_id()));
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::StopOwnerSessions(grpc::ServerContext* /*context*/,
                                                     const v1::StopOwnerSessionsRequest* request,
                                                     v1::StopOwnerSessionsResponse* response) {
  util::Logger::Info(std::string(kTag) + "StopOwnerSessions owner=" +
                     std::to_string(request->owner_id()));
  const size_t n = supervisor_->StopAllForOwner(request->owner_id());
  response->set_stopped_count(static_cast<int32_t>(n));
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::PauseSession(grpc::ServerContext* /*context*/,
                                                const v1::SessionRequest* request,
                                                v1::SessionResponse* response) {
  const runtime::OperationResult result = supervisor_->Pause(request->session_id());
  if (!result.success) {
    return grpc::Status(ToGrpcCode(result.error), result.message);
  }
  return RespondWithSession(request->session_id(), response);
}

grpc::Status BroadcastControlImpl::ResumeSession(grpc::ServerContext* /*context*/,
                                                 const v1::SessionRequest* request,
                                                 v1::SessionResponse* response) {
  const runtime::OperationResult result = supervisor_->Resume(request->session_id());
  if (!result.success) {
    return grpc::Status(ToGrpcCode(result.error), result.message);
  }
  return RespondWithSession(request->session_id(), response);
}

grpc::Status BroadcastControlImpl::ChangeProfile(grpc::ServerContext* /*context*/,
                                                 const v1::ChangeProfileRequest* request,
                                                 v1::SessionResponse* response) {
  util::Logger::Info(std::string(kTag) + "ChangeProfile " + request->session_id() + " -> " +
                     std::to_string(request->tier()) + "p");
  const runtime::OperationResult result =
      supervisor_->ChangeProfile(request->session_id(), request->tier());
  if (!result.success) {
    return grpc::Status(ToGrpcCode(result.error), result.message);
  }
  return RespondWithSession(request->session_id(), response);
}

// =============================================================================
// Queries
// =============================================================================

grpc::Status BroadcastControlImpl::GetSession(grpc::ServerContext* /*context*/,
                                              const v1::SessionRequest* request,
                                              v1::SessionResponse* response) {
  return RespondWithSession(request->session_id(), response);
}

grpc::Status BroadcastControlImpl::ListSessions(grpc::ServerContext* /*context*/,
                                                const v1::ListSessionsRequest* request,
                                                v1::ListSessionsResponse* response) {
  const auto views = request->filter_by_owner() ? supervisor_->ListForOwner(request->owner_id())
                                                : supervisor_->ListAll();
  for (const auto& view : views) {
    FillSessionInfo(view, response->add_sessions());
  }
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::ResolveSessionPrefix(
    grpc::ServerContext* /*context*/, const v1::ResolveSessionPrefixRequest* request,
    v1::SessionResponse* response) {
  auto view = supervisor_->ResolvePrefix(request->owner_id(), request->prefix());
  if (!view) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND,
                        "owner " + std::to_string(request->owner_id()) +
                            " has no live session matching '" + request->prefix() + "'");
  }
  FillSessionInfo(*view, response->mutable_session());
  return grpc::Status::OK;
}

// =============================================================================
// Owner playlist
// =============================================================================

grpc::Status BroadcastControlImpl::AddPlaylistItem(grpc::ServerContext* /*context*/,
                                                   const v1::AddPlaylistItemRequest* request,
                                                   v1::PlaylistItemResponse* response) {
  if (request->path().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "path is required");
  }
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  const playlist::PlaylistItem item = queue->Add(request->path(), request->title());
  FillItem(item, response->mutable_item());
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::RemovePlaylistItem(grpc::ServerContext* /*context*/,
                                                      const v1::PlaylistItemRequest* request,
                                                      v1::RemovePlaylistItemResponse* /*response*/) {
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  return FromPlaylistError(queue->Remove(request->item_id()), request->item_id());
}

grpc::Status BroadcastControlImpl::ClearPlaylist(grpc::ServerContext* /*context*/,
                                                 const v1::OwnerRequest* request,
                                                 v1::ClearPlaylistResponse* response) {
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  response->set_removed_count(static_cast<int32_t>(queue->Clear()));
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::ListPlaylist(grpc::ServerContext* /*context*/,
                                                const v1::OwnerRequest* request,
                                                v1::ListPlaylistResponse* response) {
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  for (const auto& item : queue->List()) {
    FillItem(item, response->add_items());
  }
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::AdvancePlaylist(grpc::ServerContext* /*context*/,
                                                   const v1::OwnerRequest* request,
                                                   v1::PlaylistItemResponse* response) {
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  const auto result = queue->Advance();
  if (!result.success) {
    return FromPlaylistError(result.error, 0);
  }
  FillItem(result.item, response->mutable_item());
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::MarkPlaylistItemPlayed(grpc::ServerContext* /*context*/,
                                                          const v1::PlaylistItemRequest* request,
                                                          v1::PlaylistItemResponse* response) {
  auto queue = supervisor_->OwnerPlaylist(request->owner_id());
  const playlist::PlaylistError e = queue->MarkPlayed(request->item_id());
  if (e != playlist::PlaylistError::kNone) {
    return FromPlaylistError(e, request->item_id());
  }
  for (const auto& item : queue->List()) {
    if (item.item_id == request->item_id()) {
      FillItem(item, response->mutable_item());
      break;
    }
  }
  return grpc::Status::OK;
}

// =============================================================================
// Notifications
// =============================================================================

grpc::Status BroadcastControlImpl::SubscribeNotifications(
    grpc::ServerContext* context, const v1::SubscribeNotificationsRequest* request,
    grpc::ServerWriter<v1::Notification>* writer) {
  if (shutting_down_.load()) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "server is shutting down");
  }
  std::optional<int64_t> filter;
  if (request->filter_by_owner()) filter = request->owner_id();

  auto sub = hub_->Subscribe(filter);
  util::Logger::Info(std::string(kTag) + "Notification subscriber attached" +
                     (filter ? " (owner " + std::to_string(*filter) + ")" : std::string()));

  while (!context->IsCancelled() && !sub->IsClosed()) {
    auto n = sub->Next(kStreamPollInterval);
    if (!n) continue;
    v1::Notification msg;
    msg.set_owner_id(n->owner_id);
    msg.set_text(n->text);
    msg.set_emitted_utc_ms(n->emitted_utc_ms);
    if (!writer->Write(msg)) break;
  }

  const uint64_t dropped = sub->DroppedCount();
  hub_->Unsubscribe(sub);
  util::Logger::Info(std::string(kTag) + "Notification subscriber detached" +
                     (dropped > 0 ? " (" + std::to_string(dropped) + " dropped)" : std::string()));
  return grpc::Status::OK;
}

grpc::Status BroadcastControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                              const v1::ApiVersionRequest* /*request*/,
                                              v1::ApiVersion* response) {
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace onair::control
