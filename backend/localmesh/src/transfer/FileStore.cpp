#include "FileStore.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace localmesh::transfer;

namespace {

std::string fallbackName() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return "received-" + std::to_string(now.count());
}

// The peer chooses the name: keep only its last path component.
std::string safeName(std::string name) {
    std::replace(name.begin(), name.end(), '\\', '/');
    auto base = std::filesystem::path(name).filename().string();
    if (base.empty() || base == "." || base == "..")
        return fallbackName();
    return base;
}

std::filesystem::path uniquePath(const std::filesystem::path& dir, const std::string& name) {
    auto candidate = dir / name;
    const auto stem = std::filesystem::path(name).stem().string();
    const auto extension = std::filesystem::path(name).extension().string();
    for (int n = 1; std::filesystem::exists(candidate); ++n)
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + extension);
    return candidate;
}

}

auto localmesh::transfer::saveReceivedFile(const std::filesystem::path& dir, const ReceivedFile& file)
    -> std::expected<std::filesystem::path, TransferError> {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("transfer: cannot create {}: {}", dir.string(), ec.message());
        return std::unexpected(TransferError::WriteFailed);
    }

    const auto path = uniquePath(dir, safeName(file.meta.name));
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return std::unexpected(TransferError::WriteFailed);
    out.write(reinterpret_cast<const char*>(file.bytes.data()), static_cast<std::streamsize>(file.bytes.size()));
    out.flush();
    if (!out) {
        spdlog::error("transfer: short write to {}", path.string());
        return std::unexpected(TransferError::WriteFailed);
    }

    spdlog::info("transfer: saved {} bytes to {}", file.bytes.size(), path.string());
    return path;
}
