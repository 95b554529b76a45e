#pragma once
#include <expected>
#include <filesystem>
#include "FileTransfer.hpp"

namespace localmesh::transfer {

// Writes a received file into dir without overwriting anything already there.
// Only the last component of the peer-supplied name is used.
auto saveReceivedFile(const std::filesystem::path& dir, const ReceivedFile& file)
    -> std::expected<std::filesystem::path, TransferError>;

}
