#pragma once
#include "WireMessage.hpp"

namespace localmesh::wire {

// Text frames carry {"t":"chat"|"file-meta"|"file-end", ...}; FileChunk is a
// raw binary frame.
auto encode(const WireMessage& message) -> rtc::Frame;

// Never fails: binary frames are always FileChunk, and a text frame that is
// not a well-formed envelope is shown verbatim as a chat message.
auto decode(rtc::Frame frame) -> WireMessage;

}
