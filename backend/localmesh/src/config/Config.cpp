#include "Config.hpp"
#include "../logging/Logging.hpp"

#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <json/json.h>

using namespace localmesh::config;

namespace {

constexpr long long kMaxGatheringTimeoutMs = 600000;

auto wrongType(const std::string& key, const char* expected) -> std::unexpected<std::string> {
    return std::unexpected("config key \"" + key + "\" must be " + expected);
}

auto validate(Config config) -> std::expected<Config, std::string> {
    if (config.listenAddress.empty())
        return std::unexpected("listen address must not be empty");
    if (config.channelLabel.empty())
        return std::unexpected("channel label must not be empty");
    if (config.portRangeBegin == 0 || config.portRangeBegin > config.portRangeEnd)
        return std::unexpected("invalid port range " + std::to_string(config.portRangeBegin) + "-" +
                               std::to_string(config.portRangeEnd));
    if (config.gatheringTimeout.count() <= 0 || config.gatheringTimeout.count() > kMaxGatheringTimeoutMs)
        return std::unexpected("gathering timeout must be between 1 and " + std::to_string(kMaxGatheringTimeoutMs) + " ms");
    if (config.maxMessageSize < 16 * 1024)
        return std::unexpected("max message size must hold one file chunk (16384 bytes)");
    if (!localmesh::logging::parseLogLevel(config.logLevel))
        return std::unexpected("unknown log level \"" + config.logLevel + "\"");
    return config;
}

auto parsePositive(std::string_view flag, const std::string& value, long long max)
    -> std::expected<long long, std::string> {
    try {
        std::size_t used = 0;
        const auto parsed = std::stoll(value, &used);
        if (used != value.size() || parsed <= 0 || parsed > max)
            throw std::out_of_range(value);
        return parsed;
    } catch (const std::logic_error&) {
        return std::unexpected(std::string(flag) + " expects an integer in 1.." + std::to_string(max) + ", got \"" +
                               value + "\"");
    }
}

}

auto localmesh::config::parseConfigJson(std::string_view json, Config base) -> std::expected<Config, std::string> {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors))
        return std::unexpected("config is not valid JSON: " + errors);
    if (!root.isObject())
        return std::unexpected(std::string("config root must be a JSON object"));

    Config config = std::move(base);

    auto readString = [&](const char* key, std::string& out) -> std::expected<void, std::string> {
        if (!root.isMember(key)) return {};
        if (!root[key].isString()) return wrongType(key, "a string");
        out = root[key].asString();
        return {};
    };
    auto readUnsigned = [&](const char* key, std::uint64_t max, auto& out) -> std::expected<void, std::string> {
        if (!root.isMember(key)) return {};
        if (!root[key].isUInt64() || root[key].asUInt64() > max) return wrongType(key, "a non-negative integer in range");
        out = static_cast<std::remove_reference_t<decltype(out)>>(root[key].asUInt64());
        return {};
    };

    std::string downloadDirectory = config.downloadDirectory.string();
    std::uint64_t gatheringTimeoutMs = static_cast<std::uint64_t>(config.gatheringTimeout.count());

    std::vector<std::expected<void, std::string>> results;
    results.push_back(readString("listenAddress", config.listenAddress));
    results.push_back(readString("channelLabel", config.channelLabel));
    results.push_back(readString("bindAddress", config.bindAddress));
    results.push_back(readString("downloadDirectory", downloadDirectory));
    results.push_back(readString("logLevel", config.logLevel));
    results.push_back(readUnsigned("gatheringTimeoutMs", kMaxGatheringTimeoutMs, gatheringTimeoutMs));
    results.push_back(readUnsigned("portRangeBegin", std::numeric_limits<std::uint16_t>::max(), config.portRangeBegin));
    results.push_back(readUnsigned("portRangeEnd", std::numeric_limits<std::uint16_t>::max(), config.portRangeEnd));
    results.push_back(readUnsigned("maxMessageSize", std::numeric_limits<std::uint32_t>::max(), config.maxMessageSize));
    results.push_back(readUnsigned("bufferedAmountHighWatermark", std::numeric_limits<std::uint32_t>::max(),
                                   config.bufferedAmountHighWatermark));
    if (root.isMember("enableMedia")) {
        if (!root["enableMedia"].isBool())
            results.push_back(wrongType("enableMedia", "a boolean"));
        else
            config.enableMedia = root["enableMedia"].asBool();
    }

    for (auto& result : results) {
        if (!result)
            return std::unexpected(result.error());
    }

    config.downloadDirectory = downloadDirectory;
    config.gatheringTimeout = std::chrono::milliseconds(gatheringTimeoutMs);
    return validate(std::move(config));
}

auto localmesh::config::loadConfigFile(const std::filesystem::path& path, Config base)
    -> std::expected<Config, std::string> {
    std::ifstream in(path);
    if (!in.is_open())
        return std::unexpected("cannot open config file " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto config = parseConfigJson(buffer.str(), std::move(base));
    if (!config)
        return std::unexpected(path.string() + ": " + config.error());
    return config;
}

auto localmesh::config::parseCommandLine(int argc, const char* const* argv) -> std::expected<Config, std::string> {
    std::vector<std::pair<std::string, std::string>> flags;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            flags.emplace_back("--help", "");
            continue;
        }
        if (arg.rfind("--", 0) != 0)
            return std::unexpected("unexpected argument \"" + arg + "\"");
        const auto eq = arg.find('=');
        if (eq != std::string::npos) {
            flags.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
        } else if (i + 1 < argc) {
            flags.emplace_back(arg, argv[++i]);
        } else {
            return std::unexpected("missing value for " + arg);
        }
    }

    Config config;
    for (const auto& [flag, value] : flags) {
        if (flag != "--config") continue;
        auto loaded = loadConfigFile(value, config);
        if (!loaded)
            return std::unexpected(loaded.error());
        config = std::move(*loaded);
    }

    for (const auto& [flag, value] : flags) {
        if (flag == "--config") {
            continue;
        } else if (flag == "--help") {
            config.help = true;
        } else if (flag == "--listen") {
            config.listenAddress = value;
        } else if (flag == "--downloads") {
            config.downloadDirectory = value;
        } else if (flag == "--log-level") {
            config.logLevel = value;
        } else if (flag == "--bind") {
            config.bindAddress = value;
        } else if (flag == "--label") {
            config.channelLabel = value;
        } else if (flag == "--media") {
            if (value != "true" && value != "false")
                return std::unexpected("--media expects true or false");
            config.enableMedia = value == "true";
        } else if (flag == "--gathering-timeout-ms") {
            auto ms = parsePositive(flag, value, kMaxGatheringTimeoutMs);
            if (!ms)
                return std::unexpected(ms.error());
            config.gatheringTimeout = std::chrono::milliseconds(*ms);
        } else {
            return std::unexpected("unknown option " + flag);
        }
    }

    return validate(std::move(config));
}

auto localmesh::config::usage() -> std::string {
    return "usage: localmeshd [options]\n"
           "  --config <file>               JSON configuration file\n"
           "  --listen <host:port>          control API address (default 127.0.0.1:50051)\n"
           "  --downloads <dir>             where received files are saved (default ./downloads)\n"
           "  --log-level <level>           trace|debug|info|warn|error|critical|off\n"
           "  --bind <address>              local address used for ICE candidates\n"
           "  --label <name>                data channel label (default \"data\")\n"
           "  --media <true|false>          negotiate audio/video tracks (default true)\n"
           "  --gathering-timeout-ms <ms>   bound on candidate gathering (default 10000, max 600000)\n"
           "  --help                        print this text\n";
}
