#pragma once

#include "localmesh_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>

#include "EventBroadcaster.hpp"
#include "../session/PeerSession.hpp"
#include "../dispatcher/Dispatcher.hpp"

namespace localmesh::rpc {

auto toGrpcStatus(session::SessionError error) -> grpc::Status;

class LocalMeshServiceImpl final : public localmesh::LocalMeshService::Service {
public:
    LocalMeshServiceImpl(std::shared_ptr<session::PeerSession> session, dispatch::Dispatcher& dispatcher,
        std::shared_ptr<EventBroadcaster> broadcaster)
        : session_(std::move(session)), dispatcher_(dispatcher), broadcaster_(std::move(broadcaster)) {}

    grpc::Status StartAsInitiator(grpc::ServerContext* context, const localmesh::Empty* request,
        localmesh::DescriptorReply* reply) override;
    grpc::Status AcceptRemoteOffer(grpc::ServerContext* context, const localmesh::DescriptorRequest* request,
        localmesh::DescriptorReply* reply) override;
    grpc::Status ApplyRemoteAnswer(grpc::ServerContext* context, const localmesh::DescriptorRequest* request,
        localmesh::Empty* reply) override;
    grpc::Status Restart(grpc::ServerContext* context, const localmesh::Empty* request,
        localmesh::Empty* reply) override;
    grpc::Status SendChat(grpc::ServerContext* context, const localmesh::ChatRequest* request,
        localmesh::Empty* reply) override;
    grpc::Status SendFile(grpc::ServerContext* context, const localmesh::SendFileRequest* request,
        localmesh::Empty* reply) override;
    grpc::Status SendMedia(grpc::ServerContext* context, grpc::ServerReader<localmesh::MediaPacket>* reader,
        localmesh::Empty* reply) override;
    grpc::Status ReceiveMedia(grpc::ServerContext* context, const localmesh::Empty* request,
        grpc::ServerWriter<localmesh::MediaPacket>* writer) override;
    grpc::Status GetStatus(grpc::ServerContext* context, const localmesh::Empty* request,
        localmesh::StatusReply* reply) override;
    grpc::Status GetChatLog(grpc::ServerContext* context, const localmesh::Empty* request,
        localmesh::ChatLogReply* reply) override;
    grpc::Status Subscribe(grpc::ServerContext* context, const localmesh::Empty* request,
        grpc::ServerWriter<localmesh::SessionEvent>* writer) override;

private:
    std::shared_ptr<session::PeerSession> session_;
    dispatch::Dispatcher& dispatcher_;
    std::shared_ptr<EventBroadcaster> broadcaster_;

    // Runs fn against the session on the dispatcher thread and waits for it.
    template <typename Fn> grpc::Status withSession(Fn&& fn);
};

}
