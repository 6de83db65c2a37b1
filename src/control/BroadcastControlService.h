// Repository: OnAir-relay
// Component: BroadcastControl gRPC Service Implementation
// Purpose: Exposes the session supervisor, owner playlists and owner
//          notifications to the command layer.
// Copyright (c) 2026 OnAir

#ifndef ONAIR_CONTROL_BROADCAST_CONTROL_SERVICE_H_
#define ONAIR_CONTROL_BROADCAST_CONTROL_SERVICE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "control/NotificationHub.h"
#include "onair/runtime/SessionSupervisor.hpp"
#include "onair/v1/broadcast_control.grpc.pb.h"
#include "onair/v1/broadcast_control.pb.h"

namespace onair::control {

inline constexpr char kApiVersion[] = "1.0.0";

// Maps the supervisor's error taxonomy onto gRPC status codes.
grpc::StatusCode ToGrpcCode(runtime::SupervisorError e);

// BroadcastControlImpl implements the gRPC service defined in
// broadcast_control.proto. This is a thin adapter: it converts messages to
// domain types and delegates to SessionSupervisor.
class BroadcastControlImpl final : public onair::v1::BroadcastControl::Service {
 public:
  BroadcastControlImpl(std::shared_ptr<runtime::SessionSupervisor> supervisor,
                       std::shared_ptr<NotificationHub> hub);
  ~BroadcastControlImpl() override;

  BroadcastControlImpl(const BroadcastControlImpl&) = delete;
  BroadcastControlImpl& operator=(const BroadcastControlImpl&) = delete;

  // Stops every session, then ends all notification streams. Called before
  // server shutdown.
  void BeginShutdown();

  grpc::Status StartSession(grpc::ServerContext* context,
                            const v1::StartSessionRequest* request,
                            v1::SessionResponse* response) override;

  grpc::Status StopSession(grpc::ServerContext* context,
                           const v1::StopSessionRequest* request,
                           v1::StopSessionResponse* response) override;

  grpc::Status StopOwnerSessions(grpc::ServerContext* context,
                                 const v1::StopOwnerSessionsRequest* request,
                                 v1::StopOwnerSessionsResponse* response) override;

  grpc::Status PauseSession(grpc::ServerContext* context,
                            const v1::SessionRequest* request,
                            v1::SessionResponse* response) override;

  grpc::Status ResumeSession(grpc::ServerContext* context,
                             const v1::SessionRequest* request,
                             v1::SessionResponse* response) override;

  grpc::Status ChangeProfile(grpc::ServerContext* context,
                             const v1::ChangeProfileRequest* request,
                             v1::SessionResponse* response) override;

  grpc::Status GetSession(grpc::ServerContext* context,
                          const v1::SessionRequest* request,
                          v1::SessionResponse* response) override;

  grpc::Status ListSessions(grpc::ServerContext* context,
                            const v1::ListSessionsRequest* request,
                            v1::ListSessionsResponse* response) override;

  grpc::Status ResolveSessionPrefix(grpc::ServerContext* context,
                                    const v1::ResolveSessionPrefixRequest* request,
                                    v1::SessionResponse* response) override;

  grpc::Status AddPlaylistItem(grpc::ServerContext* context,
                               const v1::AddPlaylistItemRequest* request,
                               v1::PlaylistItemResponse* response) override;

  grpc::Status RemovePlaylistItem(grpc::ServerContext* context,
                                  const v1::PlaylistItemRequest* request,
                                  v1::RemovePlaylistItemResponse* response) override;

  grpc::Status ClearPlaylist(grpc::ServerContext* context,
                             const v1::OwnerRequest* request,
                             v1::ClearPlaylistResponse* response) override;

  grpc::Status ListPlaylist(grpc::ServerContext* context,
                            const v1::OwnerRequest* request,
                            v1::ListPlaylistResponse* response) override;

  grpc::Status AdvancePlaylist(grpc::ServerContext* context,
                               const v1::OwnerRequest* request,
                               v1::PlaylistItemResponse* response) override;

  grpc::Status MarkPlaylistItemPlayed(grpc::ServerContext* context,
                                      const v1::PlaylistItemRequest* request,
                                      v1::PlaylistItemResponse* response) override;

  // Server-streaming RPC for owner notifications.
  grpc::Status SubscribeNotifications(grpc::ServerContext* context,
                                      const v1::SubscribeNotificationsRequest* request,
                                      grpc::ServerWriter<v1::Notification>* writer) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

 private:
  // Poll interval of the notification stream for client cancellation.
  static constexpr std::chrono::milliseconds kStreamPollInterval{250};

  void CloseStreams();

  void FillSessionInfo(const runtime::SessionView& view, v1::SessionInfo* out) const;

  // Looks the session up again after a successful operation.
  grpc::Status RespondWithSession(const std::string& session_id,
                                  v1::SessionResponse* response) const;

  std::shared_ptr<runtime::SessionSupervisor> supervisor_;
  std::shared_ptr<NotificationHub> hub_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace onair::control

#endif  // ONAIR_CONTROL_BROADCAST_CONTROL_SERVICE_H_
