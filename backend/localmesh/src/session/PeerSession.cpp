#include "PeerSession.hpp"
#include "../signaling/DescriptorCodec.hpp"
#include "../wire/WireCodec.hpp"

#include <algorithm>
#include <exception>
#include <spdlog/spdlog.h>

using namespace localmesh::session;

namespace {

auto fail(SessionError error, std::string_view what) -> std::unexpected<SessionError> {
    spdlog::warn("session: {}: {}", what, toString(error));
    return std::unexpected(error);
}

bool isBlank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

}

template <typename Fn>
void PeerSession::postToDispatcher(std::uint64_t generation, Fn&& fn) {
    auto weakSelf = weak_from_this();
    dispatcher_.post([weakSelf, generation, fn = std::forward<Fn>(fn)]() mutable {
        if (auto self = weakSelf.lock()) {
            if (self->isClosed_ || self->generation_ != generation) return;
            fn(*self);
        }
    });
}

template <typename Fn>
void PeerSession::notify(Fn&& fn) {
    if (observer_)
        fn(*observer_);
}

PeerSession::PeerSession(dispatch::Dispatcher& dispatcher, rtc::TransportFactory transportFactory, SessionOptions options)
    : dispatcher_(dispatcher),
      transportFactory_(std::move(transportFactory)),
      options_(std::move(options)),
      messageDispatcher_(chatLog_, receiver_) {
    messageDispatcher_.onChatMessage = [this](const chat::ChatMessage& message) {
        notify([&message](ISessionObserver& observer) { observer.onChatMessage(message); });
    };
    messageDispatcher_.onFileReceived = [this](const transfer::ReceivedFile& file) {
        spdlog::info("session: received \"{}\" ({} bytes)", file.meta.name, file.bytes.size());
        notify([&file](ISessionObserver& observer) { observer.onFileReceived(file); });
    };
}

void PeerSession::start() {
    if (isClosed_) return;
    if (transport_) return;
    createTransport();
    state_ = ConnectionState::New;
}

void PeerSession::createTransport() {
    try {
        transport_ = transportFactory_();
    } catch (const std::exception& e) {
        spdlog::error("session: cannot create transport: {}", e.what());
        transport_.reset();
    }
    if (transport_)
        setCallbacks();
}

void PeerSession::setCallbacks() {
    auto weakSelf = weak_from_this();
    const auto generation = generation_;

    transport_->onStateChange = [weakSelf, generation](signaling::TransportState state) {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [state](PeerSession& s) { s.handleTransportState(state); });
        }
    };

    transport_->onChannelOpen = [weakSelf, generation]() {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [](PeerSession& s) { s.handleChannelOpen(); });
        }
    };

    transport_->onChannelClosed = [weakSelf, generation]() {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [](PeerSession& s) { s.handleChannelClosed(); });
        }
    };

    transport_->onMessage = [weakSelf, generation](rtc::Frame frame) {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [frame = std::move(frame)](PeerSession& s) mutable {
                s.handleFrame(std::move(frame));
            });
        }
    };

    transport_->onTrack = [weakSelf, generation](const rtc::TrackInfo& track) {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [track](PeerSession& s) { s.handleTrack(track); });
        }
    };

    transport_->onTrackData = [weakSelf, generation](const std::string& mid, rtc::Binary packet) {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [mid, packet = std::move(packet)](PeerSession& s) {
                s.handleTrackData(mid, packet);
            });
        }
    };

    transport_->onBufferedAmountLow = [weakSelf, generation]() {
        if (auto self = weakSelf.lock()) {
            self->postToDispatcher(generation, [](PeerSession& s) { s.handleBufferedAmountLow(); });
        }
    };
}

void PeerSession::attachObserver(std::shared_ptr<ISessionObserver> observer) {
    if (isClosed_) return;
    observer_ = std::move(observer);
}

auto PeerSession::checkUsable() const -> std::expected<void, SessionError> {
    if (isClosed_)
        return std::unexpected(SessionError::SessionClosed);
    if (!transport_)
        return std::unexpected(SessionError::TransportFailure);
    return {};
}

auto PeerSession::checkChannel() const -> std::expected<void, SessionError> {
    if (auto usable = checkUsable(); !usable)
        return usable;
    if (!channelOpen_)
        return std::unexpected(SessionError::ChannelNotOpen);
    return {};
}

auto PeerSession::startAsInitiator() -> std::expected<std::string, SessionError> {
    if (auto usable = checkUsable(); !usable)
        return std::unexpected(usable.error());
    if (state_ != ConnectionState::New || role_)
        return fail(SessionError::InvalidTransition, "startAsInitiator");

    role_ = Role::Initiator;
    spdlog::info("session: starting as initiator");

    // The channel has to exist before the offer so the offer carries it.
    if (!transport_->createChannel(options_.channelLabel))
        return fail(SessionError::NegotiationFailed, "data channel creation");
    if (options_.enableMedia && !transport_->addMediaSections())
        return fail(SessionError::NegotiationFailed, "media sections");
    if (!transport_->generateOffer())
        return fail(SessionError::NegotiationFailed, "offer generation");

    return finishLocalDescriptor();
}

auto PeerSession::applyRemoteAnswer(std::string_view answerText) -> std::expected<void, SessionError> {
    if (auto usable = checkUsable(); !usable)
        return usable;
    if (role_ == Role::Initiator && remoteApplied_)
        return fail(SessionError::ApplyFailed, "answer already applied");
    if (role_ != Role::Initiator || state_ != ConnectionState::Negotiating)
        return fail(SessionError::InvalidTransition, "applyRemoteAnswer");

    auto answer = signaling::decodeDescriptor(answerText);
    if (!answer) {
        spdlog::warn("session: remote answer rejected: {}", answer.error().reason);
        return std::unexpected(SessionError::MalformedDescriptor);
    }
    if (answer->type != signaling::DescriptionType::Answer)
        return fail(SessionError::ApplyFailed, "expected an answer, got an offer");

    if (!transport_->setRemoteDescriptor(*answer))
        return fail(SessionError::ApplyFailed, "remote answer");

    remoteApplied_ = true;
    spdlog::info("session: remote answer applied ({} candidates)", answer->candidates.size());
    return {};
}

auto PeerSession::acceptRemoteOffer(std::string_view offerText) -> std::expected<std::string, SessionError> {
    if (auto usable = checkUsable(); !usable)
        return std::unexpected(usable.error());
    if (state_ != ConnectionState::New || role_)
        return fail(SessionError::InvalidTransition, "acceptRemoteOffer");

    auto offer = signaling::decodeDescriptor(offerText);
    if (!offer) {
        spdlog::warn("session: remote offer rejected: {}", offer.error().reason);
        return std::unexpected(SessionError::MalformedDescriptor);
    }
    if (offer->type != signaling::DescriptionType::Offer)
        return fail(SessionError::ApplyFailed, "expected an offer, got an answer");

    role_ = Role::Responder;
    spdlog::info("session: accepting remote offer ({} candidates)", offer->candidates.size());

    if (!transport_->setRemoteDescriptor(*offer))
        return fail(SessionError::ApplyFailed, "remote offer");
    remoteApplied_ = true;

    if (!transport_->generateAnswer())
        return fail(SessionError::NegotiationFailed, "answer generation");

    return finishLocalDescriptor();
}

auto PeerSession::finishLocalDescriptor() -> std::expected<std::string, SessionError> {
    // A copy-pasted descriptor cannot be completed later, so every candidate
    // must be in it.
    if (!transport_->awaitGatheringComplete(options_.gatheringTimeout))
        return fail(SessionError::GatheringTimedOut, "candidate gathering");

    auto local = transport_->localDescriptor();
    if (!local)
        return fail(SessionError::NegotiationFailed, "local description");

    localDescriptor_ = std::move(*local);
    transitionTo(ConnectionState::Negotiating);
    return signaling::encodeDescriptor(*localDescriptor_);
}

auto PeerSession::restart() -> std::expected<void, SessionError> {
    if (isClosed_)
        return std::unexpected(SessionError::SessionClosed);

    spdlog::info("session: restarting from {}", toString(state_));
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    ++generation_;

    if (outbound_)
        spdlog::warn("session: dropping outgoing \"{}\" after {} bytes", outbound_->meta().name, outbound_->bytesSent());
    outbound_.reset();
    waitingForDrain_ = false;
    receiver_.reset();
    remoteTracks_.clear();
    channelOpen_ = false;
    remoteApplied_ = false;
    role_.reset();
    localDescriptor_.reset();

    createTransport();
    transitionTo(ConnectionState::New);
    if (!transport_)
        return std::unexpected(SessionError::TransportFailure);
    return {};
}

void PeerSession::close() {
    if (isClosed_) return;
    isClosed_ = true;
    ++generation_;
    outbound_.reset();
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    observer_.reset();
}

bool PeerSession::isValidStateTransition(ConnectionState from, ConnectionState to) {
    switch (from) {
        case ConnectionState::New:
            return to == ConnectionState::Negotiating;
        case ConnectionState::Negotiating:
            return to == ConnectionState::Connected || to == ConnectionState::Disconnected ||
                   to == ConnectionState::Failed;
        case ConnectionState::Connected:
            return to == ConnectionState::Disconnected || to == ConnectionState::Failed;
        default:
            return false;
    }
}

void PeerSession::transitionTo(ConnectionState next) {
    if (state_ == next) return;
    spdlog::info("session: {} -> {}", toString(state_), toString(next));
    state_ = next;
    notify([next](ISessionObserver& observer) { observer.onStateChanged(next); });
}

void PeerSession::handleTransportState(signaling::TransportState transportState) {
    if (isClosed_) return;

    std::optional<ConnectionState> next;
    switch (transportState) {
        case signaling::TransportState::Connected:
            next = ConnectionState::Connected;
            break;
        case signaling::TransportState::Disconnected:
        case signaling::TransportState::Closed:
            next = ConnectionState::Disconnected;
            break;
        case signaling::TransportState::Failed:
            next = ConnectionState::Failed;
            break;
        default:
            break;
    }

    if (!next || !isValidStateTransition(state_, *next)) {
        spdlog::debug("session: transport {} ignored in state {}",
                      signaling::toString(transportState), toString(state_));
        return;
    }

    transitionTo(*next);
    if (state_ != ConnectionState::Connected && outbound_)
        abortTransfer(SessionError::TransportFailure, "connection lost during file transfer");
}

void PeerSession::handleChannelOpen() {
    if (channelOpen_) return;
    channelOpen_ = true;
    spdlog::info("session: data channel open");
    notify([](ISessionObserver& observer) { observer.onChannelOpen(); });
}

void PeerSession::handleChannelClosed() {
    if (!channelOpen_) return;
    channelOpen_ = false;
    spdlog::info("session: data channel closed");
    notify([](ISessionObserver& observer) { observer.onChannelClosed(); });
    if (outbound_)
        abortTransfer(SessionError::ChannelNotOpen, "data channel closed during file transfer");
}

void PeerSession::handleTrack(const rtc::TrackInfo& track) {
    if (std::find(remoteTracks_.begin(), remoteTracks_.end(), track) != remoteTracks_.end()) return;
    spdlog::info("session: remote {} track (mid {})", track.kind, track.mid);
    remoteTracks_.push_back(track);
    notify([&track](ISessionObserver& observer) { observer.onRemoteTrack(track); });
}

void PeerSession::handleTrackData(const std::string& mid, const rtc::Binary& packet) {
    notify([&mid, &packet](ISessionObserver& observer) { observer.onMediaPacket(mid, packet); });
}

auto PeerSession::sendMedia(const std::string& mid, const rtc::Binary& packet) -> std::expected<void, SessionError> {
    if (auto usable = checkUsable(); !usable)
        return usable;
    if (state_ != ConnectionState::Connected)
        return std::unexpected(SessionError::InvalidTransition);
    if (packet.empty())
        return std::unexpected(SessionError::EmptyMessage);

    if (auto sent = transport_->sendMedia(mid, packet); !sent) {
        spdlog::debug("session: media packet on {} not sent: {}", mid, rtc::toString(sent.error()));
        return std::unexpected(SessionError::TransportFailure);
    }
    return {};
}

void PeerSession::handleFrame(rtc::Frame frame) {
    if (isClosed_) return;
    messageDispatcher_.dispatch(wire::decode(std::move(frame)));
}

auto PeerSession::sendChat(std::string_view text) -> std::expected<void, SessionError> {
    if (auto open = checkChannel(); !open)
        return open;
    if (isBlank(text))
        return std::unexpected(SessionError::EmptyMessage);

    if (auto sent = transport_->send(wire::encode(wire::Chat{std::string(text)})); !sent) {
        spdlog::warn("session: chat not sent: {}", rtc::toString(sent.error()));
        return std::unexpected(SessionError::TransportFailure);
    }

    // Shown locally at once; delivery is left to the ordered channel.
    auto message = chatLog_.append(chat::Origin::Local, std::string(text));
    notify([&message](ISessionObserver& observer) { observer.onChatMessage(message); });
    return {};
}

auto PeerSession::sendFile(const std::filesystem::path& path, std::string mimeType) -> std::expected<void, SessionError> {
    if (auto open = checkChannel(); !open)
        return open;
    if (outbound_)
        return std::unexpected(SessionError::TransferInProgress);

    auto sender = transfer::FileSender::open(path, std::move(mimeType));
    if (!sender) {
        spdlog::warn("session: cannot send {}: {}", path.string(), transfer::toString(sender.error()));
        return std::unexpected(SessionError::FileUnavailable);
    }
    return sendFile(std::move(*sender));
}

auto PeerSession::sendFile(transfer::FileSender sender) -> std::expected<void, SessionError> {
    if (auto open = checkChannel(); !open)
        return open;
    if (outbound_)
        return std::unexpected(SessionError::TransferInProgress);

    if (auto sent = transport_->send(wire::encode(sender.meta())); !sent) {
        spdlog::warn("session: file-meta not sent: {}", rtc::toString(sent.error()));
        return std::unexpected(SessionError::TransportFailure);
    }

    spdlog::info("session: sending \"{}\" ({} bytes, {})", sender.meta().name, sender.meta().size, sender.meta().mimeType);
    outbound_.emplace(std::move(sender));
    scheduleNextChunk();
    return {};
}

void PeerSession::scheduleNextChunk() {
    postToDispatcher(generation_, [](PeerSession& s) { s.sendNextChunk(); });
}

// One chunk per task so inbound traffic keeps flowing during a large send.
void PeerSession::sendNextChunk() {
    if (!outbound_) return;
    if (!channelOpen_) {
        abortTransfer(SessionError::ChannelNotOpen, "data channel closed during file transfer");
        return;
    }
    if (transport_->bufferedAmount() > options_.bufferedAmountHighWatermark) {
        waitingForDrain_ = true;
        return;
    }

    auto chunk = outbound_->nextChunk();
    if (!chunk) {
        abortTransfer(SessionError::FileUnavailable, std::string(transfer::toString(chunk.error())));
        return;
    }

    if (!*chunk) {
        if (!transport_->send(wire::encode(wire::FileEnd{}))) {
            abortTransfer(SessionError::TransportFailure, "file-end not sent");
            return;
        }
        auto meta = outbound_->meta();
        outbound_.reset();
        spdlog::info("session: sent \"{}\" ({} bytes)", meta.name, meta.size);
        notify([&meta](ISessionObserver& observer) { observer.onFileSent(meta); });
        return;
    }

    if (auto sent = transport_->send(wire::encode(wire::FileChunk{std::move(**chunk)})); !sent) {
        abortTransfer(SessionError::TransportFailure, std::string(rtc::toString(sent.error())));
        return;
    }
    scheduleNextChunk();
}

void PeerSession::handleBufferedAmountLow() {
    if (!waitingForDrain_) return;
    waitingForDrain_ = false;
    scheduleNextChunk();
}

void PeerSession::abortTransfer(SessionError error, const std::string& detail) {
    if (outbound_)
        spdlog::warn("session: aborting \"{}\" after {} bytes: {}", outbound_->meta().name, outbound_->bytesSent(), detail);
    outbound_.reset();
    waitingForDrain_ = false;
    notify([error, &detail](ISessionObserver& observer) { observer.onNotice(error, detail); });
}
