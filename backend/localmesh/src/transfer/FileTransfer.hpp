#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../wire/WireMessage.hpp"

namespace localmesh::transfer {

// Fixed on the sending side; receivers accept any chunk size.
inline constexpr std::size_t kChunkSize = 16 * 1024;

inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

enum class TransferError {
    NotFound,
    NotRegularFile,
    ReadFailed,
    WriteFailed
};

auto toString(TransferError error) -> std::string_view;

struct ReceivedFile {
    wire::FileMeta meta;
    rtc::Binary bytes;
};

// Produces the chunks of one outgoing file in offset order.
class FileSender {
public:
    static auto open(const std::filesystem::path& path, std::string mimeType) -> std::expected<FileSender, TransferError>;
    static auto fromBuffer(std::string name, std::string mimeType, rtc::Binary bytes) -> FileSender;

    const wire::FileMeta& meta() const { return meta_; }
    // Empty optional once every byte has been produced.
    auto nextChunk() -> std::expected<std::optional<rtc::Binary>, TransferError>;
    std::uint64_t bytesSent() const { return offset_; }
    bool done() const { return offset_ >= meta_.size; }

private:
    FileSender(wire::FileMeta meta, std::unique_ptr<std::istream> source)
        : meta_(std::move(meta)), source_(std::move(source)) {}
    FileSender(wire::FileMeta meta, rtc::Binary buffer)
        : meta_(std::move(meta)), buffer_(std::move(buffer)) {}

    wire::FileMeta meta_;
    // Exactly one of source_ (file on disk) and buffer_ (in memory) is used.
    std::unique_ptr<std::istream> source_;
    rtc::Binary buffer_;
    std::uint64_t offset_ = 0;
};

// Reassembles the single inbound transfer. A new meta abandons whatever the
// previous transfer had buffered.
class FileReceiver {
public:
    void onMeta(wire::FileMeta meta);
    void onChunk(rtc::Binary bytes);
    auto onEnd() -> std::optional<ReceivedFile>;
    void reset();

    bool inFlight() const { return current_.has_value(); }
    std::uint64_t receivedBytes() const { return current_ ? current_->receivedBytes : 0; }
    std::uint64_t expectedBytes() const { return current_ ? current_->expectedSize : 0; }

private:
    struct InFlightTransfer {
        std::optional<wire::FileMeta> meta;
        std::uint64_t expectedSize = 0;
        std::vector<rtc::Binary> chunks;
        std::uint64_t receivedBytes = 0;
    };

    std::optional<InFlightTransfer> current_;
};

}
