#include "ChatLog.hpp"

using namespace localmesh::chat;

auto localmesh::chat::toString(Origin origin) -> std::string_view {
    return origin == Origin::Local ? "local" : "remote";
}

auto ChatLog::append(Origin origin, std::string text) -> ChatMessage {
    messages_.push_back(ChatMessage{
        .origin = origin,
        .text = std::move(text),
        .timestamp = std::chrono::system_clock::now()
    });
    return messages_.back();
}
