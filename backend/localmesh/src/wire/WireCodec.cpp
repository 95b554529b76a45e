#include "WireCodec.hpp"

#include <memory>
#include <optional>
#include <type_traits>
#include <json/json.h>
#include <spdlog/spdlog.h>

using namespace localmesh::wire;

namespace {

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

auto parseEnvelope(const std::string& text) -> std::optional<WireMessage> {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
        return std::nullopt;
    if (!root.isObject() || !root["t"].isString())
        return std::nullopt;

    const auto tag = root["t"].asString();
    if (tag == "chat") {
        if (!root["text"].isString())
            return std::nullopt;
        return Chat{root["text"].asString()};
    }
    if (tag == "file-meta") {
        const auto& meta = root["meta"];
        if (!meta.isObject() || !meta["size"].isUInt64())
            return std::nullopt;
        FileMeta fileMeta;
        fileMeta.size = meta["size"].asUInt64();
        if (meta.isMember("name")) {
            if (!meta["name"].isString()) return std::nullopt;
            fileMeta.name = meta["name"].asString();
        }
        if (meta.isMember("type")) {
            if (!meta["type"].isString()) return std::nullopt;
            fileMeta.mimeType = meta["type"].asString();
        }
        return fileMeta;
    }
    if (tag == "file-end")
        return FileEnd{};
    return std::nullopt;
}

}

auto localmesh::wire::encode(const WireMessage& message) -> rtc::Frame {
    return std::visit([](const auto& msg) -> rtc::Frame {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, FileChunk>) {
            return msg.bytes;
        } else {
            Json::Value root(Json::objectValue);
            if constexpr (std::is_same_v<T, Chat>) {
                root["t"] = "chat";
                root["text"] = msg.text;
            } else if constexpr (std::is_same_v<T, FileMeta>) {
                root["t"] = "file-meta";
                Json::Value meta(Json::objectValue);
                meta["name"] = msg.name;
                meta["size"] = Json::UInt64(msg.size);
                meta["type"] = msg.mimeType;
                root["meta"] = meta;
            } else {
                root["t"] = "file-end";
            }
            return writeCompact(root);
        }
    }, message);
}

auto localmesh::wire::decode(rtc::Frame frame) -> WireMessage {
    if (auto* bytes = std::get_if<rtc::Binary>(&frame))
        return FileChunk{std::move(*bytes)};

    auto& text = std::get<std::string>(frame);
    if (auto message = parseEnvelope(text))
        return std::move(*message);

    spdlog::warn("wire: text frame is not an envelope ({} bytes), showing it as chat", text.size());
    return Chat{std::move(text)};
}
