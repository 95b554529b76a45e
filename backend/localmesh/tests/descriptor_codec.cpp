#include "signaling/DescriptorCodec.hpp"

#include <cassert>
#include <string>

using namespace localmesh::signaling;

namespace {

Description sample_offer() {
    Description desc;
    desc.type = DescriptionType::Offer;
    desc.sdp = "v=0\r\no=- 4611 2 IN IP4 127.0.0.1\r\ns=-\r\nt=0 0\r\na=group:BUNDLE 0\r\n"
               "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\na=mid:0\r\n";
    desc.candidates.push_back({"candidate:1 1 UDP 2122260223 192.168.1.10 50000 typ host", "0", 0});
    desc.candidates.push_back({"candidate:2 1 UDP 2122194687 10.0.0.4 50001 typ host", "0", 0});
    return desc;
}

}  // namespace

int main() {
    // Encoded descriptors decode to the same description.
    {
        const auto offer = sample_offer();
        const auto text = encodeDescriptor(offer);
        assert(text.find('\n') == std::string::npos);
        const auto decoded = decodeDescriptor(text);
        assert(decoded.has_value());
        assert(*decoded == offer);
    }

    // Whitespace picked up while copying is tolerated.
    {
        Description answer;
        answer.type = DescriptionType::Answer;
        answer.sdp = "v=0\r\n";
        const auto decoded = decodeDescriptor("  \n" + encodeDescriptor(answer) + "\r\n ");
        assert(decoded.has_value());
        assert(decoded->type == DescriptionType::Answer);
        assert(decoded->candidates.empty());
    }

    // A browser's JSON.stringify(pc.localDescription) has no candidate list.
    {
        const auto decoded = decodeDescriptor(R"({"type":"offer","sdp":"v=0\r\na=candidate:1 1 UDP 1 10.0.0.1 9 typ host\r\n"})");
        assert(decoded.has_value());
        assert(decoded->type == DescriptionType::Offer);
        assert(decoded->candidates.empty());
    }

    // Candidates without mid or mline index still decode.
    {
        const auto decoded = decodeDescriptor(R"({"type":"answer","sdp":"v=0","candidates":[{"candidate":"candidate:9"}]})");
        assert(decoded.has_value());
        assert(decoded->candidates.size() == 1);
        assert(decoded->candidates.front().candidate == "candidate:9");
        assert(decoded->candidates.front().sdpMid.empty());
    }

    // Malformed input is rejected with a reason.
    {
        const char* malformed[] = {
            "",
            "   ",
            "not json",
            "[1,2,3]",
            R"({"sdp":"v=0"})",
            R"({"type":"pranswer","sdp":"v=0"})",
            R"({"type":"offer"})",
            R"({"type":"offer","sdp":""})",
            R"({"type":"offer","sdp":42})",
            R"({"type":"offer","sdp":"v=0","candidates":{}})",
            R"({"type":"offer","sdp":"v=0","candidates":[{"sdpMid":"0"}]})",
            R"({"type":"offer","sdp":"v=0"} trailing)",
        };
        for (const auto* text : malformed) {
            const auto decoded = decodeDescriptor(text);
            assert(!decoded.has_value());
            assert(!decoded.error().reason.empty());
        }
    }

    assert(toString(DescriptionType::Offer) == "offer");
    assert(toString(TransportState::Failed) == "failed");

    return 0;
}
