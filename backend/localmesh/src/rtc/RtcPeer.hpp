#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <rtc/rtc.hpp>
#include "ITransport.hpp"
#include "../config/Config.hpp"

namespace localmesh::rtc {

// ITransport over libdatachannel. No ICE servers: host candidates only.
// Media tracks carry raw RTP; packetizing is left to whoever feeds them.
class RtcPeer final : public ITransport {
public:
    explicit RtcPeer(const config::Config& config);
    ~RtcPeer() override { close(); }

    auto createChannel(const std::string& label) -> std::expected<void, TransportError> override;
    auto addMediaSections() -> std::expected<void, TransportError> override;
    auto generateOffer() -> std::expected<void, TransportError> override;
    auto generateAnswer() -> std::expected<void, TransportError> override;
    auto setRemoteDescriptor(const signaling::Description& desc) -> std::expected<void, TransportError> override;
    bool awaitGatheringComplete(std::chrono::milliseconds timeout) override;
    auto localDescriptor() -> std::optional<signaling::Description> override;
    auto send(const Frame& frame) -> std::expected<void, TransportError> override;
    auto sendMedia(const std::string& mid, const Binary& packet) -> std::expected<void, TransportError> override;
    std::size_t bufferedAmount() const override;
    void close() override;

private:
    ::rtc::Configuration config_;
    std::size_t bufferedAmountLowThreshold_;
    std::shared_ptr<::rtc::PeerConnection> peerConnection_;
    std::shared_ptr<::rtc::DataChannel> dataChannel_;
    std::vector<std::shared_ptr<::rtc::Track>> tracks_;
    mutable std::mutex mutex_;
    std::promise<void> gatheringComplete_;
    std::shared_future<void> gatheringFuture_;
    std::atomic<bool> gatheringSignalled_{false};
    std::atomic<bool> channelOpenSignalled_{false};
    std::atomic<bool> closed_{false};
    std::unordered_map<std::string, int> midToIndexMap_;

    void start();
    void bindChannel(std::shared_ptr<::rtc::DataChannel> channel);
    void bindTrack(const std::shared_ptr<::rtc::Track>& track);
    void announceAnsweredTracks(::rtc::Description& answer);
    void populateMidToIndexMap(const ::rtc::Description& desc);
    template <typename Fn> auto guarded(const char* what, Fn&& fn) -> std::expected<void, TransportError>;
};

}
