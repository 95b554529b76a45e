#include "wire/WireCodec.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <variant>
#include <json/json.h>

using namespace localmesh;

namespace {

Json::Value parse(const rtc::Frame& frame) {
    const auto* text = std::get_if<std::string>(&frame);
    assert(text != nullptr);
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const bool ok = reader->parse(text->data(), text->data() + text->size(), &root, &errors);
    assert(ok);
    return root;
}

}  // namespace

int main() {
    // Chat is a text envelope.
    {
        const auto frame = wire::encode(wire::Chat{"hello"});
        const auto root = parse(frame);
        assert(root["t"].asString() == "chat");
        assert(root["text"].asString() == "hello");
        assert(std::get<wire::Chat>(wire::decode(frame)).text == "hello");
    }

    // File metadata uses "type" for the MIME type on the wire.
    {
        const wire::FileMeta meta{"report.pdf", 123456789012ULL, "application/pdf"};
        const auto frame = wire::encode(meta);
        const auto root = parse(frame);
        assert(root["t"].asString() == "file-meta");
        assert(root["meta"]["name"].asString() == "report.pdf");
        assert(root["meta"]["size"].asUInt64() == 123456789012ULL);
        assert(root["meta"]["type"].asString() == "application/pdf");
        assert(std::get<wire::FileMeta>(wire::decode(frame)) == meta);
    }

    {
        const auto frame = wire::encode(wire::FileEnd{});
        assert(parse(frame)["t"].asString() == "file-end");
        assert(std::holds_alternative<wire::FileEnd>(wire::decode(frame)));
    }

    // Chunks are raw binary frames, and any binary frame is a chunk.
    {
        rtc::Binary bytes{std::byte{0x00}, std::byte{0xff}, std::byte{0x7b}};
        const auto frame = wire::encode(wire::FileChunk{bytes});
        assert(std::holds_alternative<rtc::Binary>(frame));
        assert(std::get<rtc::Binary>(frame) == bytes);
        assert(std::get<wire::FileChunk>(wire::decode(rtc::Binary{})).bytes.empty());
        assert(std::get<wire::FileChunk>(wire::decode(bytes)).bytes == bytes);
    }

    // Unicode text survives.
    {
        const std::string text = "caf\xc3\xa9 \xf0\x9f\x98\x80";
        assert(std::get<wire::Chat>(wire::decode(wire::encode(wire::Chat{text}))).text == text);
    }

    // Anything that is not a well-formed envelope is shown verbatim.
    {
        const std::string cases[] = {
            "hello",
            "",
            "{\"t\":\"ping\"}",
            "{\"t\":\"chat\"}",
            "{\"text\":\"no tag\"}",
            "{\"t\":\"file-meta\",\"meta\":{\"name\":\"a\"}}",
            "{\"t\":\"file-meta\",\"meta\":{\"name\":\"a\",\"size\":-1}}",
            "{\"t\":\"file-meta\",\"meta\":{\"name\":7,\"size\":1}}",
            "[\"chat\"]",
        };
        for (const auto& text : cases) {
            const auto decoded = wire::decode(text);
            assert(std::holds_alternative<wire::Chat>(decoded));
            assert(std::get<wire::Chat>(decoded).text == text);
        }
    }

    // Missing name and type default to empty.
    {
        const auto decoded = wire::decode(std::string("{\"t\":\"file-meta\",\"meta\":{\"size\":10}}"));
        const auto& meta = std::get<wire::FileMeta>(decoded);
        assert(meta.size == 10);
        assert(meta.name.empty());
        assert(meta.mimeType.empty());
    }

    return 0;
}
