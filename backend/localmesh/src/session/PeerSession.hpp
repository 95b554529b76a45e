#pragma once
#include <cstdint>
#include <memory>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "SessionTypes.hpp"
#include "ISessionObserver.hpp"
#include "../chat/ChatLog.hpp"
#include "../chat/MessageDispatcher.hpp"
#include "../dispatcher/Dispatcher.hpp"
#include "../rtc/ITransport.hpp"
#include "../signaling/SignalingTypes.hpp"
#include "../transfer/FileTransfer.hpp"

namespace localmesh::session {

// One two-party session: owns the transport, the connection state, the
// inbound and outbound transfers and the chat log. Not thread-safe; every
// member is called on the dispatcher thread, and transport callbacks are
// re-posted there.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    PeerSession(dispatch::Dispatcher& dispatcher, rtc::TransportFactory transportFactory, SessionOptions options);
    ~PeerSession() { close(); };
    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    void start();
    void close();
    void attachObserver(std::shared_ptr<ISessionObserver> observer);

    auto startAsInitiator() -> std::expected<std::string, SessionError>;
    auto applyRemoteAnswer(std::string_view answerText) -> std::expected<void, SessionError>;
    auto acceptRemoteOffer(std::string_view offerText) -> std::expected<std::string, SessionError>;
    auto restart() -> std::expected<void, SessionError>;

    auto sendChat(std::string_view text) -> std::expected<void, SessionError>;
    auto sendFile(const std::filesystem::path& path, std::string mimeType = {}) -> std::expected<void, SessionError>;
    auto sendFile(transfer::FileSender sender) -> std::expected<void, SessionError>;
    // Forwards one RTP packet; only while Connected.
    auto sendMedia(const std::string& mid, const rtc::Binary& packet) -> std::expected<void, SessionError>;

    void handleTransportState(signaling::TransportState transportState);
    void handleFrame(rtc::Frame frame);

    ConnectionState state() const { return state_; }
    std::optional<Role> role() const { return role_; }
    bool isChannelOpen() const { return channelOpen_; }
    bool isSending() const { return outbound_.has_value(); }
    const chat::ChatLog& chatLog() const { return chatLog_; }
    const transfer::FileReceiver& receiver() const { return receiver_; }
    const std::vector<rtc::TrackInfo>& remoteTracks() const { return remoteTracks_; }

private:
    dispatch::Dispatcher& dispatcher_;
    rtc::TransportFactory transportFactory_;
    SessionOptions options_;
    std::unique_ptr<rtc::ITransport> transport_;
    std::shared_ptr<ISessionObserver> observer_;
    // Bumped whenever the transport is replaced; stale callbacks are dropped.
    std::uint64_t generation_ = 0;
    bool isClosed_ = false;

    ConnectionState state_ = ConnectionState::New;
    std::optional<Role> role_;
    bool remoteApplied_ = false;
    bool channelOpen_ = false;
    std::vector<rtc::TrackInfo> remoteTracks_;
    std::optional<signaling::Description> localDescriptor_;

    chat::ChatLog chatLog_;
    transfer::FileReceiver receiver_;
    chat::MessageDispatcher messageDispatcher_;
    std::optional<transfer::FileSender> outbound_;
    bool waitingForDrain_ = false;

    void createTransport();
    void setCallbacks();
    auto checkUsable() const -> std::expected<void, SessionError>;
    auto checkChannel() const -> std::expected<void, SessionError>;
    auto finishLocalDescriptor() -> std::expected<std::string, SessionError>;
    void transitionTo(ConnectionState next);
    bool isValidStateTransition(ConnectionState from, ConnectionState to);
    void handleChannelOpen();
    void handleChannelClosed();
    void handleTrack(const rtc::TrackInfo& track);
    void handleTrackData(const std::string& mid, const rtc::Binary& packet);
    void handleBufferedAmountLow();
    void scheduleNextChunk();
    void sendNextChunk();
    void abortTransfer(SessionError error, const std::string& detail);
    template <typename Fn> void postToDispatcher(std::uint64_t generation, Fn&& fn);
    template <typename Fn> void notify(Fn&& fn);
};

}
