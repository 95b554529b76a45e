#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include "../rtc/Frame.hpp"

namespace localmesh::wire {

struct Chat {
    std::string text;

    bool operator==(const Chat&) const = default;
};

struct FileMeta {
    std::string name;
    std::uint64_t size = 0;
    std::string mimeType;

    bool operator==(const FileMeta&) const = default;
};

// Carried as a bare binary frame. There is no transfer id, so at most one
// file can be in flight per direction.
struct FileChunk {
    rtc::Binary bytes;

    bool operator==(const FileChunk&) const = default;
};

struct FileEnd {
    bool operator==(const FileEnd&) const = default;
};

using WireMessage = std::variant<Chat, FileMeta, FileChunk, FileEnd>;

}
