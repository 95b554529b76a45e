#pragma once
#include <expected>
#include <string>
#include <string_view>
#include "SignalingTypes.hpp"

namespace localmesh::signaling {

// Descriptor <-> copy-paste blob:
//   {"type":"offer"|"answer","sdp":"...","candidates":[{"candidate":...,"sdpMid":...,"sdpMLineIndex":...}]}
// "candidates" is optional on input so that blobs produced by a browser's
// JSON.stringify(pc.localDescription) are accepted as well.
auto encodeDescriptor(const Description& desc) -> std::string;
auto decodeDescriptor(std::string_view text) -> std::expected<Description, MalformedDescriptor>;

}
