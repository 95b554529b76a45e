#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace localmesh::chat {

enum class Origin {
    Local,
    Remote
};

auto toString(Origin origin) -> std::string_view;

struct ChatMessage {
    Origin origin;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

// Append-only, in arrival order. Local messages are appended when sent,
// without waiting for the peer.
class ChatLog {
public:
    auto append(Origin origin, std::string text) -> ChatMessage;
    auto messages() const -> const std::vector<ChatMessage>& { return messages_; }
    std::size_t size() const { return messages_.size(); }

private:
    std::vector<ChatMessage> messages_;
};

}
