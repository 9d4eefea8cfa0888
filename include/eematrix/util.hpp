#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

#include "types.hpp"

namespace eematrix {

// Helper function to go to/from char pointers to unsigned char pointers:
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline const char* from_unsigned(const unsigned char* x) {
    return reinterpret_cast<const char*>(x);
}
// Helper function to switch between basic_string_view<C> and ustring_view
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {from_unsigned(v.data()), v.size()};
}
template <size_t N>
inline ustring_view to_unsigned_sv(const std::array<unsigned char, N>& v) {
    return {v.data(), N};
}

// Calls sodium_memzero to zero a buffer
void sodium_zero_buffer(void* ptr, size_t size);

// Wrapper around a type that uses `sodium_memzero` to zero the container on destruction; may only
// be used with trivially destructible types.
template <typename T, typename = std::enable_if_t<std::is_trivially_destructible_v<T>>>
struct sodium_cleared : T {
    using T::T;

    sodium_cleared() = default;
    sodium_cleared(const T& x) : T{x} {}
    sodium_cleared(const sodium_cleared&) = default;
    sodium_cleared& operator=(const sodium_cleared&) = default;

    ~sodium_cleared() { sodium_zero_buffer(this, sizeof(*this)); }
};

/// Encodes bytes as unpadded base64, the encoding Matrix uses for keys and exported sessions.
std::string to_base64_unpadded(ustring_view bytes);

/// Decodes padded or unpadded base64.  Throws std::invalid_argument if the input isn't base64.
ustring from_base64(std::string_view b64);

}  // namespace eematrix
