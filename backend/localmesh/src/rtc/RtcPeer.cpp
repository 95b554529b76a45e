#include "RtcPeer.hpp"

#include <algorithm>
#include <exception>
#include <variant>
#include <spdlog/spdlog.h>

using namespace localmesh::rtc;

namespace {

auto toRtcType(localmesh::signaling::DescriptionType type) -> ::rtc::Description::Type {
    return type == localmesh::signaling::DescriptionType::Offer ? ::rtc::Description::Type::Offer
                                                                : ::rtc::Description::Type::Answer;
}

auto toDirection(::rtc::Description::Direction direction) -> MediaDirection {
    switch (direction) {
        case ::rtc::Description::Direction::SendOnly:
            return MediaDirection::SendOnly;
        case ::rtc::Description::Direction::RecvOnly:
            return MediaDirection::RecvOnly;
        case ::rtc::Description::Direction::SendRecv:
            return MediaDirection::SendRecv;
        default:
            return MediaDirection::Inactive;
    }
}

}

RtcPeer::RtcPeer(const config::Config& config)
    : bufferedAmountLowThreshold_(config.bufferedAmountHighWatermark),
      gatheringFuture_(gatheringComplete_.get_future().share()) {
    config_.disableAutoNegotiation = true;
    config_.portRangeBegin = config.portRangeBegin;
    config_.portRangeEnd = config.portRangeEnd;
    config_.maxMessageSize = config.maxMessageSize;
    if (!config.bindAddress.empty())
        config_.bindAddress = config.bindAddress;
    start();
}

void RtcPeer::populateMidToIndexMap(const ::rtc::Description& desc) {
    midToIndexMap_.clear(); // With new description, the old sdp becomes invalid, therefore we clear the map
    for (int i = 0; i < desc.mediaCount(); ++i) {
        const auto& mediaVar = desc.media(i);
        std::visit([this, i](auto* media) {
            midToIndexMap_[media->mid()] = i;
        }, mediaVar);
    }
}

void RtcPeer::start() {
    peerConnection_ = std::make_shared<::rtc::PeerConnection>(config_);

    peerConnection_->onStateChange([this](::rtc::PeerConnection::State state) {
        spdlog::debug("rtc: peer connection state {}", static_cast<int>(state));
        if (closed_) return;
        auto transportState = static_cast<signaling::TransportState>(state);
        if (onStateChange)
            onStateChange(transportState);
    });

    peerConnection_->onGatheringStateChange([this](::rtc::PeerConnection::GatheringState state) {
        if (state != ::rtc::PeerConnection::GatheringState::Complete) return;
        if (!gatheringSignalled_.exchange(true))
            gatheringComplete_.set_value();
    });

    // Channels opened by the remote side (responder role).
    peerConnection_->onDataChannel([this](std::shared_ptr<::rtc::DataChannel> channel) {
        if (closed_) return;
        spdlog::info("rtc: remote opened channel \"{}\"", channel->label());
        bindChannel(std::move(channel));
    });

    // Tracks from a remote offer. Tracks we added ourselves are announced
    // from the answer instead, see announceAnsweredTracks().
    peerConnection_->onTrack([this](std::shared_ptr<::rtc::Track> track) {
        if (closed_) return;
        TrackInfo info{.mid = track->mid(), .kind = track->description().type()};
        bindTrack(track);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tracks_.push_back(std::move(track));
        }
        if (onTrack)
            onTrack(info);
    });
}

void RtcPeer::bindChannel(std::shared_ptr<::rtc::DataChannel> channel) {
    channel->setBufferedAmountLowThreshold(bufferedAmountLowThreshold_);

    channel->onOpen([this]() {
        if (closed_ || channelOpenSignalled_.exchange(true)) return;
        if (onChannelOpen)
            onChannelOpen();
    });

    channel->onClosed([this]() {
        if (closed_) return;
        channelOpenSignalled_ = false;
        if (onChannelClosed)
            onChannelClosed();
    });

    channel->onMessage([this](::rtc::message_variant data) {
        if (closed_) return;
        if (onMessage)
            onMessage(std::move(data));
    });

    channel->onBufferedAmountLow([this]() {
        if (closed_) return;
        if (onBufferedAmountLow)
            onBufferedAmountLow();
    });

    const bool alreadyOpen = channel->isOpen();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dataChannel_ = std::move(channel);
    }
    if (alreadyOpen && !channelOpenSignalled_.exchange(true) && onChannelOpen)
        onChannelOpen();
}

void RtcPeer::bindTrack(const std::shared_ptr<::rtc::Track>& track) {
    const auto mid = track->mid();
    track->onOpen([mid]() { spdlog::debug("rtc: track {} open", mid); });
    track->onMessage([this, mid](::rtc::message_variant data) {
        if (closed_) return;
        auto* packet = std::get_if<::rtc::binary>(&data);
        if (packet && onTrackData)
            onTrackData(mid, std::move(*packet));
    });
}

void RtcPeer::announceAnsweredTracks(::rtc::Description& answer) {
    std::vector<RemoteMedia> remoteMedia;
    for (int i = 0; i < answer.mediaCount(); ++i) {
        auto entry = answer.media(i);
        if (auto* media = std::get_if<::rtc::Description::Media*>(&entry))
            remoteMedia.push_back({(*media)->mid(), toDirection((*media)->direction())});
    }

    std::vector<TrackInfo> localTracks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& track : tracks_)
            localTracks.push_back({track->mid(), track->description().type()});
    }

    for (const auto& track : tracksSentByRemote(localTracks, remoteMedia)) {
        if (onTrack)
            onTrack(track);
    }
}

template <typename Fn>
auto RtcPeer::guarded(const char* what, Fn&& fn) -> std::expected<void, TransportError> {
    if (closed_ || !peerConnection_)
        return std::unexpected(TransportError::Closed);
    try {
        fn();
        return {};
    } catch (const std::exception& e) {
        spdlog::error("rtc: {} failed: {}", what, e.what());
        return std::unexpected(TransportError::Rejected);
    }
}

auto RtcPeer::createChannel(const std::string& label) -> std::expected<void, TransportError> {
    return guarded("createDataChannel", [&]() {
        bindChannel(peerConnection_->createDataChannel(label));
    });
}

auto RtcPeer::addMediaSections() -> std::expected<void, TransportError> {
    return guarded("addTrack", [&]() {
        ::rtc::Description::Audio audio("audio", ::rtc::Description::Direction::SendRecv);
        audio.addOpusCodec(111);
        ::rtc::Description::Video video("video", ::rtc::Description::Direction::SendRecv);
        video.addVP8Codec(96);
        video.addH264Codec(102);

        auto audioTrack = peerConnection_->addTrack(audio);
        auto videoTrack = peerConnection_->addTrack(video);
        bindTrack(audioTrack);
        bindTrack(videoTrack);
        std::lock_guard<std::mutex> lock(mutex_);
        tracks_.push_back(std::move(audioTrack));
        tracks_.push_back(std::move(videoTrack));
    });
}

auto RtcPeer::generateOffer() -> std::expected<void, TransportError> {
    return guarded("setLocalDescription(offer)", [&]() {
        peerConnection_->setLocalDescription(::rtc::Description::Type::Offer);
    });
}

auto RtcPeer::generateAnswer() -> std::expected<void, TransportError> {
    return guarded("setLocalDescription(answer)", [&]() {
        peerConnection_->setLocalDescription(::rtc::Description::Type::Answer);
    });
}

auto RtcPeer::setRemoteDescriptor(const signaling::Description& desc) -> std::expected<void, TransportError> {
    return guarded("setRemoteDescription", [&]() {
        ::rtc::Description description(desc.sdp, toRtcType(desc.type));
        // Candidates listed beside the sdp only matter when the sdp carries none.
        const bool sdpHasCandidates = !description.candidates().empty();
        peerConnection_->setRemoteDescription(description);
        if (!sdpHasCandidates) {
            for (const auto& candidate : desc.candidates) {
                ::rtc::Candidate rtcCandidate(candidate.candidate, candidate.sdpMid);
                peerConnection_->addRemoteCandidate(rtcCandidate);
            }
        }
        if (desc.type == signaling::DescriptionType::Answer)
            announceAnsweredTracks(description);
    });
}

bool RtcPeer::awaitGatheringComplete(std::chrono::milliseconds timeout) {
    if (closed_ || !peerConnection_) return false;
    if (peerConnection_->gatheringState() == ::rtc::PeerConnection::GatheringState::Complete)
        return true;
    return gatheringFuture_.wait_for(timeout) == std::future_status::ready;
}

auto RtcPeer::localDescriptor() -> std::optional<signaling::Description> {
    if (closed_ || !peerConnection_) return std::nullopt;
    auto local = peerConnection_->localDescription();
    if (!local) return std::nullopt;

    populateMidToIndexMap(*local);
    signaling::Description desc;
    desc.type = local->type() == ::rtc::Description::Type::Answer ? signaling::DescriptionType::Answer
                                                                  : signaling::DescriptionType::Offer;
    desc.sdp = std::string(*local);
    for (const auto& candidate : local->candidates()) {
        signaling::IceCandidate iceCandidate;
        iceCandidate.candidate = candidate.candidate();
        iceCandidate.sdpMid = candidate.mid();
        auto index = midToIndexMap_.find(iceCandidate.sdpMid);
        iceCandidate.sdpMLineIndex = index != midToIndexMap_.end() ? index->second : 0;
        desc.candidates.push_back(std::move(iceCandidate));
    }
    return desc;
}

auto RtcPeer::send(const Frame& frame) -> std::expected<void, TransportError> {
    std::shared_ptr<::rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = dataChannel_;
    }
    if (closed_)
        return std::unexpected(TransportError::Closed);
    if (!channel || !channel->isOpen())
        return std::unexpected(TransportError::ChannelUnavailable);
    try {
        // false only means the message was queued behind earlier ones
        channel->send(frame);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("rtc: send failed: {}", e.what());
        return std::unexpected(TransportError::Rejected);
    }
}

auto RtcPeer::sendMedia(const std::string& mid, const Binary& packet) -> std::expected<void, TransportError> {
    std::shared_ptr<::rtc::Track> track;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = std::find_if(tracks_.begin(), tracks_.end(),
                                  [&mid](const std::shared_ptr<::rtc::Track>& t) { return t->mid() == mid; });
        if (found != tracks_.end())
            track = *found;
    }
    if (closed_)
        return std::unexpected(TransportError::Closed);
    if (!track || !track->isOpen())
        return std::unexpected(TransportError::ChannelUnavailable);
    try {
        track->send(packet.data(), packet.size());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("rtc: media send on {} failed: {}", mid, e.what());
        return std::unexpected(TransportError::Rejected);
    }
}

std::size_t RtcPeer::bufferedAmount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dataChannel_ ? dataChannel_->bufferedAmount() : 0;
}

void RtcPeer::close() {
    if (closed_.exchange(true)) return;
    midToIndexMap_.clear();
    std::shared_ptr<::rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(dataChannel_);
        tracks_.clear();
    }
    if (channel)
        channel->close();
    if (peerConnection_) {
        peerConnection_->close();
        peerConnection_.reset();
    }
}
