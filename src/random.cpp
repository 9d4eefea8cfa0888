#include "eematrix/random.hpp"

#include <sodium/randombytes.h>

namespace eematrix::random {

ustring random(size_t size) {
    ustring result;
    result.resize(size);
    randombytes_buf(result.data(), size);

    return result;
}

}  // namespace eematrix::random
