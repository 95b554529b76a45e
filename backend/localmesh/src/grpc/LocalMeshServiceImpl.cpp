#include "../service/LocalMeshServiceImpl.hpp"
#include "../service/EventStream.hpp"

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <spdlog/spdlog.h>

using namespace localmesh::rpc;

auto localmesh::rpc::toGrpcStatus(session::SessionError error) -> grpc::Status {
    const std::string message(session::toString(error));
    switch (error) {
        case session::SessionError::InvalidTransition:
        case session::SessionError::ChannelNotOpen:
        case session::SessionError::TransferInProgress:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, message);
        case session::SessionError::MalformedDescriptor:
        case session::SessionError::EmptyMessage:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
        case session::SessionError::NegotiationFailed:
        case session::SessionError::ApplyFailed:
            return grpc::Status(grpc::StatusCode::ABORTED, message);
        case session::SessionError::GatheringTimedOut:
            return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, message);
        case session::SessionError::FileUnavailable:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, message);
        case session::SessionError::TransportFailure:
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, message);
        case session::SessionError::SessionClosed:
            return grpc::Status(grpc::StatusCode::CANCELLED, message);
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, message);
}

template <typename Fn>
grpc::Status LocalMeshServiceImpl::withSession(Fn&& fn) {
    try {
        return dispatcher_.invoke([this, &fn]() { return fn(*session_); }).get();
    } catch (const std::future_error& e) {
        spdlog::warn("rpc: dispatcher unavailable: {}", e.what());
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "daemon is shutting down");
    }
}

grpc::Status LocalMeshServiceImpl::StartAsInitiator(grpc::ServerContext* context, const localmesh::Empty* request,
    localmesh::DescriptorReply* reply) {
    return withSession([reply](session::PeerSession& session) {
        auto offer = session.startAsInitiator();
        if (!offer)
            return toGrpcStatus(offer.error());
        reply->set_descriptor(std::move(*offer));
        return grpc::Status::OK;
    });
}

grpc::Status LocalMeshServiceImpl::AcceptRemoteOffer(grpc::ServerContext* context,
    const localmesh::DescriptorRequest* request, localmesh::DescriptorReply* reply) {
    return withSession([request, reply](session::PeerSession& session) {
        auto answer = session.acceptRemoteOffer(request->descriptor());
        if (!answer)
            return toGrpcStatus(answer.error());
        reply->set_descriptor(std::move(*answer));
        return grpc::Status::OK;
    });
}

grpc::Status LocalMeshServiceImpl::ApplyRemoteAnswer(grpc::ServerContext* context,
    const localmesh::DescriptorRequest* request, localmesh::Empty* reply) {
    return withSession([request](session::PeerSession& session) {
        auto applied = session.applyRemoteAnswer(request->descriptor());
        return applied ? grpc::Status::OK : toGrpcStatus(applied.error());
    });
}

grpc::Status LocalMeshServiceImpl::Restart(grpc::ServerContext* context, const localmesh::Empty* request,
    localmesh::Empty* reply) {
    return withSession([](session::PeerSession& session) {
        auto restarted = session.restart();
        return restarted ? grpc::Status::OK : toGrpcStatus(restarted.error());
    });
}

grpc::Status LocalMeshServiceImpl::SendChat(grpc::ServerContext* context, const localmesh::ChatRequest* request,
    localmesh::Empty* reply) {
    return withSession([request](session::PeerSession& session) {
        auto sent = session.sendChat(request->text());
        return sent ? grpc::Status::OK : toGrpcStatus(sent.error());
    });
}

grpc::Status LocalMeshServiceImpl::SendFile(grpc::ServerContext* context, const localmesh::SendFileRequest* request,
    localmesh::Empty* reply) {
    return withSession([request](session::PeerSession& session) {
        auto started = session.sendFile(request->path(), request->mime_type());
        return started ? grpc::Status::OK : toGrpcStatus(started.error());
    });
}

grpc::Status LocalMeshServiceImpl::SendMedia(grpc::ServerContext* context,
    grpc::ServerReader<localmesh::MediaPacket>* reader, localmesh::Empty* reply) {
    localmesh::MediaPacket packet;
    std::uint64_t dropped = 0;
    while (reader->Read(&packet)) {
        const auto* data = reinterpret_cast<const std::byte*>(packet.payload().data());
        rtc::Binary bytes(data, data + packet.payload().size());
        auto status = withSession([&packet, &bytes](session::PeerSession& session) {
            auto sent = session.sendMedia(packet.mid(), bytes);
            return sent ? grpc::Status::OK : toGrpcStatus(sent.error());
        });
        // TransportFailure: the track is not open (yet); only this packet is lost.
        if (status.error_code() == grpc::StatusCode::UNAVAILABLE) {
            ++dropped;
            continue;
        }
        if (!status.ok())
            return status;
    }
    if (dropped > 0)
        spdlog::debug("rpc: {} media packets dropped on unopened tracks", dropped);
    return grpc::Status::OK;
}

grpc::Status LocalMeshServiceImpl::ReceiveMedia(grpc::ServerContext* context, const localmesh::Empty* request,
    grpc::ServerWriter<localmesh::MediaPacket>* writer) {
    // Media is bursty and stale packets are useless; keep the queue short.
    auto stream = std::make_shared<MediaStream>(writer, 256);
    broadcaster_->subscribeMedia(stream);
    spdlog::info("rpc: media receiver connected from {}", context->peer());
    stream->run(context);
    return grpc::Status::OK;
}

grpc::Status LocalMeshServiceImpl::GetStatus(grpc::ServerContext* context, const localmesh::Empty* request,
    localmesh::StatusReply* reply) {
    return withSession([reply](session::PeerSession& session) {
        reply->set_state(toProto(session.state()));
        if (auto role = session.role())
            reply->set_role(*role == session::Role::Initiator ? localmesh::INITIATOR : localmesh::RESPONDER);
        else
            reply->set_role(localmesh::ROLE_UNSET);
        reply->set_channel_open(session.isChannelOpen());
        reply->set_sending_file(session.isSending());
        reply->set_inbound_bytes(session.receiver().receivedBytes());
        for (const auto& track : session.remoteTracks()) {
            auto* remote = reply->add_remote_tracks();
            remote->set_mid(track.mid);
            remote->set_kind(track.kind);
        }
        return grpc::Status::OK;
    });
}

grpc::Status LocalMeshServiceImpl::GetChatLog(grpc::ServerContext* context, const localmesh::Empty* request,
    localmesh::ChatLogReply* reply) {
    return withSession([reply](session::PeerSession& session) {
        for (const auto& message : session.chatLog().messages())
            fillChatEntry(message, reply->add_messages());
        return grpc::Status::OK;
    });
}

grpc::Status LocalMeshServiceImpl::Subscribe(grpc::ServerContext* context, const localmesh::Empty* request,
    grpc::ServerWriter<localmesh::SessionEvent>* writer) {
    auto stream = std::make_shared<SessionEventStream>(writer);

    // Registered on the dispatcher so the snapshot and later events keep their order.
    auto status = withSession([this, &stream](session::PeerSession& session) {
        localmesh::SessionEvent snapshot;
        snapshot.set_state(toProto(session.state()));
        stream->push(std::move(snapshot));
        broadcaster_->subscribe(stream);
        return grpc::Status::OK;
    });
    if (!status.ok())
        return status;

    spdlog::info("rpc: subscriber connected from {}", context->peer());
    stream->run(context);
    spdlog::info("rpc: subscriber {} gone", context->peer());
    return grpc::Status::OK;
}
