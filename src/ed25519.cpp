#include "eematrix/ed25519.hpp"

#include <sodium/crypto_sign_ed25519.h>

#include <stdexcept>

#include "eematrix/util.hpp"

namespace eematrix::ed25519 {

using uc32 = std::array<unsigned char, 32>;
using cleared_uc64 = sodium_cleared<std::array<unsigned char, 64>>;

uc32 pubkey_for_seed(ustring_view ed25519_seed) {
    if (ed25519_seed.size() != 32)
        throw std::invalid_argument{"Invalid ed25519_seed: expected 32 bytes"};

    uc32 ed_pk;
    cleared_uc64 ed_sk;
    crypto_sign_ed25519_seed_keypair(ed_pk.data(), ed_sk.data(), ed25519_seed.data());
    return ed_pk;
}

}  // namespace eematrix::ed25519
