#include "FileTransfer.hpp"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace localmesh::transfer;

auto localmesh::transfer::toString(TransferError error) -> std::string_view {
    switch (error) {
        case TransferError::NotFound:
            return "file not found";
        case TransferError::NotRegularFile:
            return "not a regular file";
        case TransferError::ReadFailed:
            return "read failed";
        case TransferError::WriteFailed:
            return "write failed";
    }
    return "unknown transfer error";
}

auto FileSender::open(const std::filesystem::path& path, std::string mimeType) -> std::expected<FileSender, TransferError> {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status))
        return std::unexpected(TransferError::NotFound);
    if (!std::filesystem::is_regular_file(status))
        return std::unexpected(TransferError::NotRegularFile);

    const auto size = std::filesystem::file_size(path, ec);
    if (ec)
        return std::unexpected(TransferError::ReadFailed);

    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open())
        return std::unexpected(TransferError::ReadFailed);

    wire::FileMeta meta{
        .name = path.filename().string(),
        .size = size,
        .mimeType = mimeType.empty() ? std::string(kDefaultMimeType) : std::move(mimeType)
    };
    return FileSender(std::move(meta), std::move(stream));
}

auto FileSender::fromBuffer(std::string name, std::string mimeType, rtc::Binary bytes) -> FileSender {
    wire::FileMeta meta{
        .name = std::move(name),
        .size = bytes.size(),
        .mimeType = mimeType.empty() ? std::string(kDefaultMimeType) : std::move(mimeType)
    };
    return FileSender(std::move(meta), std::move(bytes));
}

auto FileSender::nextChunk() -> std::expected<std::optional<rtc::Binary>, TransferError> {
    if (done())
        return std::optional<rtc::Binary>{};

    const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, meta_.size - offset_));
    rtc::Binary chunk;
    if (source_) {
        chunk.resize(length);
        source_->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(source_->gcount()) != length)
            return std::unexpected(TransferError::ReadFailed);
    } else {
        const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_);
        chunk.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
    }

    offset_ += length;
    return std::optional<rtc::Binary>(std::move(chunk));
}

void FileReceiver::onMeta(wire::FileMeta meta) {
    if (current_)
        spdlog::warn("transfer: new file-meta abandons {} buffered bytes", current_->receivedBytes);
    spdlog::info("transfer: receiving \"{}\" ({} bytes, {})", meta.name, meta.size, meta.mimeType);
    current_.emplace();
    current_->expectedSize = meta.size;
    current_->meta = std::move(meta);
}

void FileReceiver::onChunk(rtc::Binary bytes) {
    if (!current_) {
        spdlog::debug("transfer: chunk without file-meta, buffering anyway");
        current_.emplace();
    }
    current_->receivedBytes += bytes.size();
    current_->chunks.push_back(std::move(bytes));
}

auto FileReceiver::onEnd() -> std::optional<ReceivedFile> {
    if (!current_) {
        spdlog::debug("transfer: file-end without an open transfer");
        return std::nullopt;
    }

    auto transfer = std::move(*current_);
    current_.reset();

    if (transfer.meta && transfer.receivedBytes != transfer.expectedSize)
        spdlog::warn("transfer: \"{}\" announced {} bytes, received {}",
                     transfer.meta->name, transfer.expectedSize, transfer.receivedBytes);

    ReceivedFile file;
    file.meta = transfer.meta.value_or(wire::FileMeta{});
    file.meta.size = transfer.receivedBytes;
    file.bytes.reserve(static_cast<std::size_t>(transfer.receivedBytes));
    for (auto& chunk : transfer.chunks)
        file.bytes.insert(file.bytes.end(), chunk.begin(), chunk.end());
    return file;
}

void FileReceiver::reset() {
    current_.reset();
}
