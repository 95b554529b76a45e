#pragma once
#include <spdlog/spdlog.h>

namespace localmesh::rtc {

// Routes libdatachannel's internal log lines into the default spdlog logger.
void installRtcLogBridge(spdlog::level::level_enum level);

}
