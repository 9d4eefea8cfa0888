#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eematrix::store {

/// Base type for all errors coming out of the crypto store (CryptoStoreError).
struct store_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
/// Thrown for any failure reported by a storage backend; the backend's message is kept but the
/// backend's own exception type is not propagated.
struct backend_error : store_error {
    using store_error::store_error;
};
/// Thrown when the account is requested but the backend has never stored one.
struct account_unset : store_error {
    account_unset() : store_error{"The account hasn't been set up in the store"} {}
};
/// Thrown when a named value can't be encoded or decoded.
struct serialization_error : store_error {
    using store_error::store_error;
};
/// Thrown when a room key export can't be turned into a usable inbound group session.
struct invalid_room_key : store_error {
    using store_error::store_error;
};

/// Base type for failures while importing private cross-signing keys or the backup key.
struct secret_import_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
/// The key material we were given isn't a valid key.
struct invalid_secret_key : secret_import_error {
    using secret_import_error::secret_import_error;
};
/// The public key of the imported private key doesn't match the public key that was uploaded to
/// the server.
struct mismatched_public_keys : secret_import_error {
    mismatched_public_keys() :
            secret_import_error{
                    "The public key of the imported private key doesn't match to the public key "
                    "that was uploaded to the server"} {}
};
/// The new version of the identity couldn't be stored.
struct secret_import_store_error : secret_import_error {
    using secret_import_error::secret_import_error;
};

/// Which of the three cross-signing keys an error or operation refers to.
enum class KeyUsage { master, self_signing, user_signing };

std::string_view to_string(KeyUsage usage);

/// Base type for failures while exporting a SecretsBundle.  A bundle can only be exported once all
/// three private cross-signing keys are present.
struct secrets_bundle_export_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
/// One specific cross-signing key is missing; `usage` names which.
struct missing_cross_signing_key : secrets_bundle_export_error {
    KeyUsage usage;
    explicit missing_cross_signing_key(KeyUsage usage);
};
/// The store doesn't contain any cross-signing keys at all.
struct missing_cross_signing_keys : secrets_bundle_export_error {
    missing_cross_signing_keys() :
            secrets_bundle_export_error{"The store doesn't contain any cross-signing keys"} {}
};
/// A backup key is stored, but without the version of the backup it belongs to.
struct missing_backup_version : secrets_bundle_export_error {
    missing_backup_version() :
            secrets_bundle_export_error{
                    "The store contains a backup key, but no backup version"} {}
};
/// The store itself had an error while assembling the bundle.
struct secrets_bundle_store_error : secrets_bundle_export_error {
    using secrets_bundle_export_error::secrets_bundle_export_error;
};

/// Thrown by a lagging room key subscription: the subscriber fell so far behind that `skipped`
/// batches were discarded.  The subscription is closed afterwards.
struct stream_lagged : std::runtime_error {
    size_t skipped;
    explicit stream_lagged(size_t skipped) :
            std::runtime_error{
                    "Subscriber lagged too far behind; " + std::to_string(skipped) +
                    " updates were dropped"},
            skipped{skipped} {}
};

}  // namespace eematrix::store
