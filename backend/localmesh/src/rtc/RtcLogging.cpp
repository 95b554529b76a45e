#include "RtcLogging.hpp"

#include <string>
#include <rtc/rtc.hpp>

namespace {

auto toRtcLevel(spdlog::level::level_enum level) -> ::rtc::LogLevel {
    switch (level) {
        case spdlog::level::trace:
            return ::rtc::LogLevel::Verbose;
        case spdlog::level::debug:
            return ::rtc::LogLevel::Debug;
        case spdlog::level::info:
            return ::rtc::LogLevel::Info;
        case spdlog::level::warn:
            return ::rtc::LogLevel::Warning;
        case spdlog::level::err:
            return ::rtc::LogLevel::Error;
        case spdlog::level::critical:
            return ::rtc::LogLevel::Fatal;
        default:
            return ::rtc::LogLevel::None;
    }
}

auto toSpdlogLevel(::rtc::LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case ::rtc::LogLevel::Verbose:
            return spdlog::level::trace;
        case ::rtc::LogLevel::Debug:
            return spdlog::level::debug;
        case ::rtc::LogLevel::Info:
            return spdlog::level::info;
        case ::rtc::LogLevel::Warning:
            return spdlog::level::warn;
        case ::rtc::LogLevel::Error:
            return spdlog::level::err;
        case ::rtc::LogLevel::Fatal:
            return spdlog::level::critical;
        default:
            return spdlog::level::off;
    }
}

}

void localmesh::rtc::installRtcLogBridge(spdlog::level::level_enum level) {
    ::rtc::InitLogger(toRtcLevel(level), [](::rtc::LogLevel rtcLevel, std::string message) {
        spdlog::log(toSpdlogLevel(rtcLevel), "libdatachannel: {}", message);
    });
}
