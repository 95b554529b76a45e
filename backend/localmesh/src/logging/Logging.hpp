#pragma once
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

namespace localmesh::logging {

// Accepts spdlog's level names ("trace" ... "critical", "off", plus "warning").
auto parseLogLevel(std::string_view name) -> std::optional<spdlog::level::level_enum>;

// Installs the colored stderr logger "localmesh" as spdlog's default.
void initLogging(spdlog::level::level_enum level);

}
