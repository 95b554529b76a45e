#include "EventBroadcaster.hpp"
#include "../transfer/FileStore.hpp"

#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

using namespace localmesh::rpc;

void localmesh::rpc::fillChatEntry(const chat::ChatMessage& message, localmesh::ChatEntry* entry) {
    entry->set_origin(message.origin == chat::Origin::Local ? localmesh::LOCAL : localmesh::REMOTE);
    entry->set_text(message.text);
    entry->set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
        message.timestamp.time_since_epoch()).count());
}

auto localmesh::rpc::toProto(session::ConnectionState state) -> localmesh::ConnectionState {
    return static_cast<localmesh::ConnectionState>(state);
}

auto localmesh::rpc::errorCode(session::SessionError error) -> std::string_view {
    switch (error) {
        case session::SessionError::InvalidTransition:
            return "INVALID_TRANSITION";
        case session::SessionError::MalformedDescriptor:
            return "MALFORMED_DESCRIPTOR";
        case session::SessionError::NegotiationFailed:
            return "NEGOTIATION_FAILED";
        case session::SessionError::ApplyFailed:
            return "APPLY_FAILED";
        case session::SessionError::GatheringTimedOut:
            return "GATHERING_TIMED_OUT";
        case session::SessionError::ChannelNotOpen:
            return "CHANNEL_NOT_OPEN";
        case session::SessionError::EmptyMessage:
            return "EMPTY_MESSAGE";
        case session::SessionError::TransferInProgress:
            return "TRANSFER_IN_PROGRESS";
        case session::SessionError::FileUnavailable:
            return "FILE_UNAVAILABLE";
        case session::SessionError::TransportFailure:
            return "TRANSPORT_FAILURE";
        case session::SessionError::SessionClosed:
            return "SESSION_CLOSED";
    }
    return "UNKNOWN";
}

namespace {

template <typename Stream>
void addStream(std::vector<std::weak_ptr<Stream>>& streams, const std::shared_ptr<Stream>& stream, bool closed) {
    if (closed) {
        stream->close();
        return;
    }
    streams.push_back(stream);
}

template <typename Stream, typename Message>
void pushToAll(std::vector<std::weak_ptr<Stream>>& streams, const Message& message) {
    std::erase_if(streams, [](const std::weak_ptr<Stream>& weak) {
        auto stream = weak.lock();
        return !stream || stream->isClosed();
    });
    for (auto& weak : streams) {
        if (auto stream = weak.lock())
            stream->push(message);
    }
}

template <typename Stream>
void closeStreams(std::vector<std::weak_ptr<Stream>>& streams) {
    for (auto& weak : streams) {
        if (auto stream = weak.lock())
            stream->close();
    }
    streams.clear();
}

}

void EventBroadcaster::subscribe(const std::shared_ptr<SessionEventStream>& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    addStream(streams_, stream, closed_);
}

void EventBroadcaster::subscribeMedia(const std::shared_ptr<MediaStream>& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    addStream(mediaStreams_, stream, closed_);
}

void EventBroadcaster::closeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    closeStreams(streams_);
    closeStreams(mediaStreams_);
}

void EventBroadcaster::broadcast(const localmesh::SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    pushToAll(streams_, event);
}

void EventBroadcaster::onStateChanged(session::ConnectionState state) {
    localmesh::SessionEvent event;
    event.set_state(toProto(state));
    broadcast(event);
}

void EventBroadcaster::onChannelOpen() {
    localmesh::SessionEvent event;
    event.set_channel_open(true);
    broadcast(event);
}

void EventBroadcaster::onChannelClosed() {
    localmesh::SessionEvent event;
    event.set_channel_open(false);
    broadcast(event);
}

void EventBroadcaster::onChatMessage(const chat::ChatMessage& message) {
    localmesh::SessionEvent event;
    fillChatEntry(message, event.mutable_chat());
    broadcast(event);
}

void EventBroadcaster::onFileReceived(const transfer::ReceivedFile& file) {
    auto saved = transfer::saveReceivedFile(downloadDirectory_, file);
    if (!saved) {
        onNotice(session::SessionError::FileUnavailable,
                 "could not save \"" + file.meta.name + "\": " + std::string(transfer::toString(saved.error())));
        return;
    }

    localmesh::SessionEvent event;
    auto* received = event.mutable_file_received();
    received->set_name(saved->filename().string());
    received->set_mime_type(file.meta.mimeType);
    received->set_size(file.bytes.size());
    received->set_saved_path(saved->string());
    broadcast(event);
}

void EventBroadcaster::onFileSent(const wire::FileMeta& meta) {
    localmesh::SessionEvent event;
    auto* sent = event.mutable_file_sent();
    sent->set_name(meta.name);
    sent->set_size(meta.size);
    broadcast(event);
}

void EventBroadcaster::onRemoteTrack(const rtc::TrackInfo& track) {
    localmesh::SessionEvent event;
    auto* remote = event.mutable_remote_track();
    remote->set_mid(track.mid);
    remote->set_kind(track.kind);
    broadcast(event);
}

void EventBroadcaster::onNotice(session::SessionError error, const std::string& detail) {
    spdlog::warn("notice: {}: {}", errorCode(error), detail);
    localmesh::SessionEvent event;
    auto* notice = event.mutable_notice();
    notice->set_code(std::string(errorCode(error)));
    notice->set_message(detail);
    broadcast(event);
}

void EventBroadcaster::onMediaPacket(const std::string& mid, const rtc::Binary& packet) {
    localmesh::MediaPacket message;
    message.set_mid(mid);
    message.set_payload(reinterpret_cast<const char*>(packet.data()), packet.size());
    std::lock_guard<std::mutex> lock(mutex_);
    pushToAll(mediaStreams_, message);
}
