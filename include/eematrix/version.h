#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>

/// libeematrix-crypto version triplet (major, minor, patch)
extern const uint16_t EEMATRIX_CRYPTO_VERSION[3];

/// Printable full libeematrix-crypto name and version string, such as `libeematrix-crypto v0.3.0`.
extern const char* EEMATRIX_CRYPTO_VERSION_FULL;

/// Just the version component as a string, e.g. `v0.3.0`.
extern const char* EEMATRIX_CRYPTO_VERSION_STR;

#ifdef __cplusplus
}  // extern "C"
#endif
