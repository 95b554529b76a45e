#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace localmesh::config {

struct Config {
    std::string listenAddress = "127.0.0.1:50051";
    std::string channelLabel = "data";
    bool enableMedia = true;
    std::chrono::milliseconds gatheringTimeout{10000};
    std::string bindAddress;
    std::uint16_t portRangeBegin = 1024;
    std::uint16_t portRangeEnd = 65535;
    std::size_t maxMessageSize = 256 * 1024;
    std::size_t bufferedAmountHighWatermark = 1024 * 1024;
    std::filesystem::path downloadDirectory = "downloads";
    std::string logLevel = "info";
    bool help = false;
};

// Keys not listed in Config are ignored; a known key with the wrong JSON type
// is an error naming that key.
auto parseConfigJson(std::string_view json, Config base = {}) -> std::expected<Config, std::string>;
auto loadConfigFile(const std::filesystem::path& path, Config base = {}) -> std::expected<Config, std::string>;

// --config is applied first, then every other flag overrides the file.
auto parseCommandLine(int argc, const char* const* argv) -> std::expected<Config, std::string>;

auto usage() -> std::string;

}
