#include "rtc/ITransport.hpp"

#include <cassert>
#include <vector>

using namespace localmesh;
using rtc::MediaDirection;

int main() {
    const std::vector<rtc::TrackInfo> local{{"0", "audio"}, {"1", "video"}};

    // Both sections answered send-receive: both tracks carry remote media.
    {
        const auto tracks = rtc::tracksSentByRemote(
            local, {{"0", MediaDirection::SendRecv}, {"1", MediaDirection::SendRecv}});
        assert(tracks == local);
    }

    // Receive-only and inactive answers mean nothing arrives on that track.
    {
        const auto tracks = rtc::tracksSentByRemote(
            local, {{"0", MediaDirection::RecvOnly}, {"1", MediaDirection::SendOnly}});
        assert(tracks.size() == 1);
        assert(tracks.front().mid == "1");
        assert(tracks.front().kind == "video");

        assert(rtc::tracksSentByRemote(local, {{"0", MediaDirection::Inactive}, {"1", MediaDirection::Inactive}})
                   .empty());
    }

    // The data channel section and unknown mids are not tracks of ours.
    {
        const auto tracks = rtc::tracksSentByRemote(
            local, {{"2", MediaDirection::SendRecv}, {"1", MediaDirection::SendRecv}, {"7", MediaDirection::SendOnly}});
        assert(tracks.size() == 1);
        assert(tracks.front().mid == "1");
    }

    // Results follow the order of the answer.
    {
        const auto tracks = rtc::tracksSentByRemote(
            local, {{"1", MediaDirection::SendRecv}, {"0", MediaDirection::SendRecv}});
        assert(tracks.size() == 2);
        assert(tracks[0].mid == "1");
        assert(tracks[1].mid == "0");
    }

    assert(rtc::tracksSentByRemote({}, {{"0", MediaDirection::SendRecv}}).empty());
    assert(rtc::tracksSentByRemote(local, {}).empty());
    return 0;
}
