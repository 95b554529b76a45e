#pragma once

#include <string>
#include "SessionTypes.hpp"
#include "../chat/ChatLog.hpp"
#include "../rtc/ITransport.hpp"
#include "../transfer/FileTransfer.hpp"

namespace localmesh::session {

// Outbound side effects of a session. Called on the dispatcher thread.
class ISessionObserver {
public:
    virtual ~ISessionObserver() = default;

    virtual void onStateChanged(ConnectionState state) = 0;
    virtual void onChannelOpen() = 0;
    virtual void onChannelClosed() = 0;
    virtual void onChatMessage(const chat::ChatMessage& message) = 0;
    virtual void onFileReceived(const transfer::ReceivedFile& file) = 0;
    virtual void onFileSent(const wire::FileMeta& meta) = 0;
    virtual void onRemoteTrack(const rtc::TrackInfo& track) = 0;
    // Raw RTP received on a remote track.
    virtual void onMediaPacket(const std::string& mid, const rtc::Binary& packet) = 0;
    virtual void onNotice(SessionError error, const std::string& detail) = 0;
};

}
