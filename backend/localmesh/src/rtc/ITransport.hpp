#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Frame.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace localmesh::rtc {

enum class TransportError {
    Closed,
    ChannelUnavailable,
    Rejected
};

auto toString(TransportError error) -> std::string_view;

struct TrackInfo {
    std::string mid;
    std::string kind;

    bool operator==(const TrackInfo&) const = default;
};

enum class MediaDirection {
    SendOnly,
    RecvOnly,
    SendRecv,
    Inactive
};

// One media section as the remote description declares it.
struct RemoteMedia {
    std::string mid;
    MediaDirection direction = MediaDirection::Inactive;
};

// Locally created tracks the remote peer will send on. Those never show up as
// new remote tracks, so the answer is the only place they can be learned from.
auto tracksSentByRemote(const std::vector<TrackInfo>& localTracks, const std::vector<RemoteMedia>& remoteMedia)
    -> std::vector<TrackInfo>;

// Connectivity engine seen by the session: one peer connection carrying a
// single data channel and optional audio/video tracks. Callbacks may fire on
// any thread.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual auto createChannel(const std::string& label) -> std::expected<void, TransportError> = 0;
    // Adds one send-receive audio and one send-receive video section.
    virtual auto addMediaSections() -> std::expected<void, TransportError> = 0;
    // Both generate the description and install it as the local one.
    virtual auto generateOffer() -> std::expected<void, TransportError> = 0;
    virtual auto generateAnswer() -> std::expected<void, TransportError> = 0;
    virtual auto setRemoteDescriptor(const signaling::Description& desc) -> std::expected<void, TransportError> = 0;
    virtual bool awaitGatheringComplete(std::chrono::milliseconds timeout) = 0;
    virtual auto localDescriptor() -> std::optional<signaling::Description> = 0;
    virtual auto send(const Frame& frame) -> std::expected<void, TransportError> = 0;
    // One RTP packet on the track negotiated under mid.
    virtual auto sendMedia(const std::string& mid, const Binary& packet) -> std::expected<void, TransportError> = 0;
    virtual std::size_t bufferedAmount() const = 0;
    virtual void close() = 0;

    std::function<void(signaling::TransportState)> onStateChange;
    std::function<void()> onChannelOpen;
    std::function<void()> onChannelClosed;
    std::function<void(Frame)> onMessage;
    std::function<void(const TrackInfo&)> onTrack;
    std::function<void(const std::string& mid, Binary packet)> onTrackData;
    std::function<void()> onBufferedAmountLow;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

}
