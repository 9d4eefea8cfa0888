#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace eematrix {

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

// Matrix identifiers are opaque strings at this layer; no grammar validation is done here.
using UserId = std::string;
using DeviceId = std::string;
using RoomId = std::string;

}  // namespace eematrix
