#include "MessageDispatcher.hpp"

#include <type_traits>

using namespace localmesh::chat;

void MessageDispatcher::dispatch(wire::WireMessage message) {
    std::visit([this](auto&& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, wire::Chat>) {
            auto appended = chatLog_.append(Origin::Remote, std::move(msg.text));
            if (onChatMessage)
                onChatMessage(appended);
        } else if constexpr (std::is_same_v<T, wire::FileMeta>) {
            receiver_.onMeta(std::move(msg));
        } else if constexpr (std::is_same_v<T, wire::FileChunk>) {
            receiver_.onChunk(std::move(msg.bytes));
        } else {
            auto file = receiver_.onEnd();
            if (file && onFileReceived)
                onFileReceived(*file);
        }
    }, std::move(message));
}
