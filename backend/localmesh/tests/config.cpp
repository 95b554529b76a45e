#include "config/Config.hpp"
#include "logging/Logging.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace localmesh;

namespace {

std::expected<config::Config, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "localmeshd");
    return config::parseCommandLine(static_cast<int>(args.size()), args.data());
}

}  // namespace

int main() {
    // Defaults.
    {
        const auto config = parse({});
        assert(config.has_value());
        assert(config->listenAddress == "127.0.0.1:50051");
        assert(config->channelLabel == "data");
        assert(config->enableMedia);
        assert(config->gatheringTimeout == std::chrono::milliseconds(10000));
        assert(config->downloadDirectory == "downloads");
        assert(!config->help);
    }

    // Both --flag value and --flag=value are accepted.
    {
        const auto config = parse({"--listen", "0.0.0.0:6000", "--downloads=/tmp/in", "--log-level", "debug",
                                   "--label=mesh", "--media", "false", "--gathering-timeout-ms=2500"});
        assert(config.has_value());
        assert(config->listenAddress == "0.0.0.0:6000");
        assert(config->downloadDirectory == "/tmp/in");
        assert(config->logLevel == "debug");
        assert(config->channelLabel == "mesh");
        assert(!config->enableMedia);
        assert(config->gatheringTimeout == std::chrono::milliseconds(2500));
    }

    assert(parse({"-h"})->help);
    assert(!parse({"--bogus", "1"}).has_value());
    assert(!parse({"positional"}).has_value());
    assert(!parse({"--listen"}).has_value());
    assert(!parse({"--gathering-timeout-ms", "0"}).has_value());
    assert(!parse({"--gathering-timeout-ms", "12abc"}).has_value());
    // Same ceiling as the config file key.
    assert(parse({"--gathering-timeout-ms", "600000"}).has_value());
    assert(!parse({"--gathering-timeout-ms", "600001"}).has_value());
    assert(!parse({"--gathering-timeout-ms", "9223372036854775807"}).has_value());
    assert(!parse({"--gathering-timeout-ms", "99999999999999999999"}).has_value());
    assert(!config::parseConfigJson(R"({"gatheringTimeoutMs":600001})").has_value());
    assert(!parse({"--media", "maybe"}).has_value());
    assert(!parse({"--log-level", "chatty"}).has_value());
    assert(!parse({"--label="}).has_value());

    // JSON configuration.
    {
        const auto config = config::parseConfigJson(
            R"({"listenAddress":"[::1]:7000","portRangeBegin":40000,"portRangeEnd":40100,"enableMedia":false,"unknown":1})");
        assert(config.has_value());
        assert(config->listenAddress == "[::1]:7000");
        assert(config->portRangeBegin == 40000);
        assert(config->portRangeEnd == 40100);
        assert(!config->enableMedia);
    }
    {
        const auto config = config::parseConfigJson(R"({"portRangeBegin":"40000"})");
        assert(!config.has_value());
        assert(config.error().find("portRangeBegin") != std::string::npos);
    }
    assert(!config::parseConfigJson(R"({"portRangeBegin":70000})").has_value());
    assert(!config::parseConfigJson(R"({"portRangeBegin":5000,"portRangeEnd":4000})").has_value());
    assert(!config::parseConfigJson(R"({"maxMessageSize":1024})").has_value());
    assert(!config::parseConfigJson("[]").has_value());
    assert(!config::parseConfigJson("{").has_value());

    // Flags override the config file wherever they appear.
    {
        const auto dir = std::filesystem::temp_directory_path() / "localmesh_config_test";
        std::filesystem::create_directories(dir);
        const auto path = dir / "localmesh.json";
        {
            std::ofstream out(path);
            out << R"({"listenAddress":"10.0.0.1:1","channelLabel":"from-file","gatheringTimeoutMs":3000})";
        }
        const auto config = parse({"--listen", "10.0.0.2:2", "--config", path.c_str()});
        assert(config.has_value());
        assert(config->listenAddress == "10.0.0.2:2");
        assert(config->channelLabel == "from-file");
        assert(config->gatheringTimeout == std::chrono::milliseconds(3000));

        assert(!parse({"--config", (dir / "missing.json").c_str()}).has_value());
        std::filesystem::remove_all(dir);
    }

    // Log levels.
    assert(logging::parseLogLevel("info") == spdlog::level::info);
    assert(logging::parseLogLevel("warning") == spdlog::level::warn);
    assert(logging::parseLogLevel("off") == spdlog::level::off);
    assert(!logging::parseLogLevel("loud").has_value());

    assert(config::usage().find("--listen") != std::string::npos);
    return 0;
}
