#pragma once
#include <functional>
#include "ChatLog.hpp"
#include "../transfer/FileTransfer.hpp"
#include "../wire/WireMessage.hpp"

namespace localmesh::chat {

// Routes decoded inbound messages: chat text to the log, file-* messages to
// the receiver.
class MessageDispatcher {
public:
    MessageDispatcher(ChatLog& chatLog, transfer::FileReceiver& receiver)
        : chatLog_(chatLog), receiver_(receiver) {}

    void dispatch(wire::WireMessage message);

    std::function<void(const ChatMessage&)> onChatMessage;
    std::function<void(const transfer::ReceivedFile&)> onFileReceived;

private:
    ChatLog& chatLog_;
    transfer::FileReceiver& receiver_;
};

}
