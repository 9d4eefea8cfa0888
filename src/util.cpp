#include <oxenc/base64.h>
#include <sodium/utils.h>

#include <eematrix/util.hpp>
#include <iterator>
#include <stdexcept>

namespace eematrix {

void sodium_zero_buffer(void* ptr, size_t size) {
    if (ptr)
        sodium_memzero(ptr, size);
}

std::string to_base64_unpadded(ustring_view bytes) {
    std::string b64 = oxenc::to_base64(bytes.begin(), bytes.end());
    while (!b64.empty() && b64.back() == '=')
        b64.pop_back();
    return b64;
}

ustring from_base64(std::string_view b64) {
    if (!oxenc::is_base64(b64))
        throw std::invalid_argument{"Invalid base64 value"};

    ustring bytes;
    bytes.reserve(oxenc::from_base64_size(b64.size()));
    oxenc::from_base64(b64.begin(), b64.end(), std::back_inserter(bytes));
    return bytes;
}

}  // namespace eematrix
