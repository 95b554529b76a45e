#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>
#include "EventStream.hpp"
#include "../session/ISessionObserver.hpp"
#include "localmesh_service.grpc.pb.h"

namespace localmesh::rpc {

void fillChatEntry(const chat::ChatMessage& message, localmesh::ChatEntry* entry);
auto toProto(session::ConnectionState state) -> localmesh::ConnectionState;
auto errorCode(session::SessionError error) -> std::string_view;

using SessionEventStream = EventStream<localmesh::SessionEvent>;
using MediaStream = EventStream<localmesh::MediaPacket>;

// Session observer that turns session events into SessionEvent messages for
// every subscriber, and received RTP into MediaPacket messages for every media
// subscriber. Received files are saved before they are announced.
class EventBroadcaster final : public session::ISessionObserver {
public:
    explicit EventBroadcaster(std::filesystem::path downloadDirectory)
        : downloadDirectory_(std::move(downloadDirectory)) {};

    void subscribe(const std::shared_ptr<SessionEventStream>& stream);
    void subscribeMedia(const std::shared_ptr<MediaStream>& stream);
    // Ends every open stream; later subscriptions are closed at once.
    void closeAll();

    void onStateChanged(session::ConnectionState state) override;
    void onChannelOpen() override;
    void onChannelClosed() override;
    void onChatMessage(const chat::ChatMessage& message) override;
    void onFileReceived(const transfer::ReceivedFile& file) override;
    void onFileSent(const wire::FileMeta& meta) override;
    void onRemoteTrack(const rtc::TrackInfo& track) override;
    void onNotice(session::SessionError error, const std::string& detail) override;
    void onMediaPacket(const std::string& mid, const rtc::Binary& packet) override;

private:
    std::filesystem::path downloadDirectory_;
    std::mutex mutex_;
    bool closed_ = false;
    std::vector<std::weak_ptr<SessionEventStream>> streams_;
    std::vector<std::weak_ptr<MediaStream>> mediaStreams_;

    void broadcast(const localmesh::SessionEvent& event);
};

}
