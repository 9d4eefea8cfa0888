#pragma once

#include <array>

#include "types.hpp"

namespace eematrix::ed25519 {

/// API: ed25519/pubkey_for_seed
///
/// Returns the Ed25519 public key that belongs to the given 32-byte seed.  Cross-signing private
/// keys travel as seeds, so this is how an imported private key gets checked against a published
/// public key.
///
/// Inputs:
/// - `ed25519_seed` -- the 32-byte seed.
///
/// Outputs:
/// - The 32-byte public key.  Throws std::invalid_argument if the seed isn't 32 bytes.
std::array<unsigned char, 32> pubkey_for_seed(ustring_view ed25519_seed);

}  // namespace eematrix::ed25519
