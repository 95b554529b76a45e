#include "Logging.hpp"

#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

auto localmesh::logging::parseLogLevel(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    const std::string level(name);
    if (level == "off")
        return spdlog::level::off;
    if (level == "warning")
        return spdlog::level::warn;
    // from_str maps unknown names to off
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off)
        return std::nullopt;
    return parsed;
}

void localmesh::logging::initLogging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("localmesh");
    if (!logger)
        logger = spdlog::stderr_color_mt("localmesh");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}
