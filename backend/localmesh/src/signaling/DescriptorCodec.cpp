#include "DescriptorCodec.hpp"

#include <memory>
#include <json/json.h>

using namespace localmesh::signaling;

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos)
        return {};
    const auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

auto malformed(std::string reason) -> std::unexpected<MalformedDescriptor> {
    return std::unexpected(MalformedDescriptor{std::move(reason)});
}

}

auto localmesh::signaling::toString(DescriptionType type) -> std::string_view {
    switch (type) {
        case DescriptionType::Offer:
            return "offer";
        case DescriptionType::Answer:
            return "answer";
    }
    return "unknown";
}

auto localmesh::signaling::toString(TransportState state) -> std::string_view {
    switch (state) {
        case TransportState::New:
            return "new";
        case TransportState::Connecting:
            return "connecting";
        case TransportState::Connected:
            return "connected";
        case TransportState::Disconnected:
            return "disconnected";
        case TransportState::Failed:
            return "failed";
        case TransportState::Closed:
            return "closed";
    }
    return "unknown";
}

auto localmesh::signaling::encodeDescriptor(const Description& desc) -> std::string {
    Json::Value root(Json::objectValue);
    root["type"] = std::string(toString(desc.type));
    root["sdp"] = desc.sdp;

    Json::Value candidates(Json::arrayValue);
    for (const auto& candidate : desc.candidates) {
        Json::Value entry(Json::objectValue);
        entry["candidate"] = candidate.candidate;
        entry["sdpMid"] = candidate.sdpMid;
        entry["sdpMLineIndex"] = candidate.sdpMLineIndex;
        candidates.append(entry);
    }
    root["candidates"] = candidates;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

auto localmesh::signaling::decodeDescriptor(std::string_view text)
    -> std::expected<Description, MalformedDescriptor> {
    const auto body = trim(text);
    if (body.empty())
        return malformed("empty descriptor");

    Json::CharReaderBuilder builder;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors))
        return malformed("not valid JSON: " + errors);
    if (!root.isObject())
        return malformed("descriptor is not a JSON object");

    Description desc;
    const auto& type = root["type"];
    if (!type.isString())
        return malformed("missing \"type\"");
    if (type.asString() == "offer")
        desc.type = DescriptionType::Offer;
    else if (type.asString() == "answer")
        desc.type = DescriptionType::Answer;
    else
        return malformed("unsupported type \"" + type.asString() + "\"");

    const auto& sdp = root["sdp"];
    if (!sdp.isString() || sdp.asString().empty())
        return malformed("missing \"sdp\"");
    desc.sdp = sdp.asString();

    if (root.isMember("candidates")) {
        const auto& candidates = root["candidates"];
        if (!candidates.isArray())
            return malformed("\"candidates\" is not an array");
        for (const auto& entry : candidates) {
            if (!entry.isObject() || !entry["candidate"].isString())
                return malformed("candidate entry without \"candidate\"");
            IceCandidate candidate;
            candidate.candidate = entry["candidate"].asString();
            if (entry["sdpMid"].isString())
                candidate.sdpMid = entry["sdpMid"].asString();
            if (entry["sdpMLineIndex"].isInt())
                candidate.sdpMLineIndex = entry["sdpMLineIndex"].asInt();
            desc.candidates.push_back(std::move(candidate));
        }
    }

    return desc;
}
