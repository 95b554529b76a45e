#include "ITransport.hpp"

#include <algorithm>

auto localmesh::rtc::toString(TransportError error) -> std::string_view {
    switch (error) {
        case TransportError::Closed:
            return "transport closed";
        case TransportError::ChannelUnavailable:
            return "data channel not open";
        case TransportError::Rejected:
            return "rejected by transport";
    }
    return "unknown transport error";
}

auto localmesh::rtc::tracksSentByRemote(const std::vector<TrackInfo>& localTracks,
    const std::vector<RemoteMedia>& remoteMedia) -> std::vector<TrackInfo> {
    std::vector<TrackInfo> received;
    for (const auto& media : remoteMedia) {
        if (media.direction != MediaDirection::SendOnly && media.direction != MediaDirection::SendRecv)
            continue;
        auto local = std::find_if(localTracks.begin(), localTracks.end(),
                                  [&media](const TrackInfo& track) { return track.mid == media.mid; });
        if (local != localTracks.end())
            received.push_back(*local);
    }
    return received;
}
