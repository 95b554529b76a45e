#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace localmesh::rtc {

using Binary = std::vector<std::byte>;

// One data-channel message. Same alternatives as ::rtc::message_variant.
using Frame = std::variant<Binary, std::string>;

}
