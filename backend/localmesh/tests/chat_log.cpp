#include "chat/ChatLog.hpp"
#include "chat/MessageDispatcher.hpp"
#include "wire/WireCodec.hpp"

#include <cassert>
#include <string>

using namespace localmesh;

int main() {
    // Messages keep their append order whatever their origin.
    {
        chat::ChatLog log;
        assert(log.size() == 0);
        const auto a = log.append(chat::Origin::Local, "a");
        log.append(chat::Origin::Remote, "b");
        log.append(chat::Origin::Local, "c");

        assert(log.size() == 3);
        assert(a.text == "a");
        assert(log.messages()[0].text == "a");
        assert(log.messages()[1].text == "b");
        assert(log.messages()[1].origin == chat::Origin::Remote);
        assert(log.messages()[2].text == "c");
        assert(log.messages()[0].timestamp <= log.messages()[2].timestamp);
    }

    // Inbound chat frames are appended as remote messages and announced.
    {
        chat::ChatLog log;
        transfer::FileReceiver receiver;
        chat::MessageDispatcher dispatcher(log, receiver);
        std::string announced;
        dispatcher.onChatMessage = [&](const chat::ChatMessage& message) { announced += message.text; };

        dispatcher.dispatch(wire::decode(wire::encode(wire::Chat{"hi"})));
        dispatcher.dispatch(wire::decode(std::string("plain text from an old peer")));

        assert(log.size() == 2);
        assert(log.messages()[0].text == "hi");
        assert(log.messages()[1].text == "plain text from an old peer");
        assert(log.messages()[1].origin == chat::Origin::Remote);
        assert(announced == "hiplain text from an old peer");
    }

    assert(chat::toString(chat::Origin::Local) == "local");
    assert(chat::toString(chat::Origin::Remote) == "remote");
    return 0;
}
