#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace localmesh::signaling {

// Same order as ::rtc::PeerConnection::State.
enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class DescriptionType {
    Offer,
    Answer
};

struct IceCandidate {
    std::string candidate;
    std::string sdpMid;
    int sdpMLineIndex = 0;

    bool operator==(const IceCandidate&) const = default;
};

// A complete negotiation descriptor: the session description plus every
// candidate gathered for it.
struct Description {
    DescriptionType type = DescriptionType::Offer;
    std::string sdp;
    std::vector<IceCandidate> candidates;

    bool operator==(const Description&) const = default;
};

struct MalformedDescriptor {
    std::string reason;
};

auto toString(DescriptionType type) -> std::string_view;
auto toString(TransportState state) -> std::string_view;

}
