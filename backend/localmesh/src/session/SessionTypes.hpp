#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace localmesh::session {

enum class Role {
    Initiator,
    Responder
};

enum class ConnectionState {
    New,
    Negotiating,
    Connected,
    Disconnected,
    Failed
};

enum class SessionError {
    InvalidTransition,
    MalformedDescriptor,
    NegotiationFailed,
    ApplyFailed,
    GatheringTimedOut,
    ChannelNotOpen,
    EmptyMessage,
    TransferInProgress,
    FileUnavailable,
    TransportFailure,
    SessionClosed
};

struct SessionOptions {
    std::string channelLabel = "data";
    bool enableMedia = true;
    std::chrono::milliseconds gatheringTimeout{10000};
    std::size_t bufferedAmountHighWatermark = 1024 * 1024;
};

auto toString(Role role) -> std::string_view;
auto toString(ConnectionState state) -> std::string_view;
auto toString(SessionError error) -> std::string_view;

}
