#pragma once

#include <array>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "../types.hpp"
#include "../util.hpp"
#include "error.hpp"
#include "identities.hpp"

namespace eematrix::store {

namespace secret_name {
    inline constexpr std::string_view CROSS_SIGNING_MASTER_KEY = "m.cross_signing.master";
    inline constexpr std::string_view CROSS_SIGNING_SELF_SIGNING_KEY =
            "m.cross_signing.self_signing";
    inline constexpr std::string_view CROSS_SIGNING_USER_SIGNING_KEY =
            "m.cross_signing.user_signing";
    inline constexpr std::string_view RECOVERY_KEY = "m.megolm_backup.v1";

    // Maps a cross-signing secret name to the key it names; nullopt for any other name.
    std::optional<KeyUsage> cross_signing_usage(std::string_view name);
}  // namespace secret_name

/// A secret that another of our devices sent us, waiting in the secret inbox.
struct GossippedSecret {
    std::string secret_name;
    UserId sender;
    DeviceId sender_device;
    std::string request_id;
    std::string secret;
};

/// The private key of a Megolm backup (m.megolm_backup.v1.curve25519-aes-sha2).
class BackupDecryptionKey {
  public:
    static constexpr size_t KEY_SIZE = 32;

    /// Generates a new random key.
    BackupDecryptionKey();

    /// Parses an unpadded base64 key; throws `invalid_secret_key` if it isn't 32 bytes of base64.
    static BackupDecryptionKey from_base64(std::string_view b64);

    std::string to_base64() const;

    bool operator==(const BackupDecryptionKey& other) const { return key_ == other.key_; }

  private:
    sodium_cleared<std::array<unsigned char, KEY_SIZE>> key_;
};

/// The backup key material kept in the store.  Either may be missing.
struct BackupKeys {
    std::optional<BackupDecryptionKey> decryption_key;
    std::optional<std::string> backup_version;
};

/// Exported private cross-signing keys, each an unpadded base64 Ed25519 seed.
struct CrossSigningKeyExport {
    std::optional<std::string> master_key;
    std::optional<std::string> self_signing_key;
    std::optional<std::string> user_signing_key;
};

/// Which private cross-signing keys we have.
struct CrossSigningStatus {
    bool has_master = false;
    bool has_self_signing = false;
    bool has_user_signing = false;

    bool is_complete() const { return has_master && has_self_signing && has_user_signing; }
};

/// The three private cross-signing keys of a secrets bundle.
struct CrossSigningSecrets {
    std::string master_key;
    std::string user_signing_key;
    std::string self_signing_key;
};

/// Backup secret of a secrets bundle.  Only the m.megolm_backup.v1.curve25519-aes-sha2 algorithm
/// exists.
struct BackupSecrets {
    static constexpr std::string_view ALGORITHM = "m.megolm_backup.v1.curve25519-aes-sha2";

    BackupDecryptionKey key;
    std::string backup_version;
};

/// Everything a new device needs to bootstrap trust: the cross-signing private keys and,
/// optionally, the backup key.  Imported as a whole or not at all.
struct SecretsBundle {
    CrossSigningSecrets cross_signing;
    std::optional<BackupSecrets> backup;
};

void to_json(nlohmann::json& j, const SecretsBundle& bundle);
void from_json(const nlohmann::json& j, SecretsBundle& bundle);

/// Which public keys of a published identity differ from our private keys.
struct IdentityDiff {
    bool master_differs = false;
    bool self_signing_differs = false;
    bool user_signing_differs = false;

    bool none_differ() const {
        return !master_differs && !self_signing_differs && !user_signing_differs;
    }
};

/// Our private cross-signing keys.  Each key is an Ed25519 seed; the public half is derived on
/// import.
class PrivateCrossSigningIdentity {
  public:
    explicit PrivateCrossSigningIdentity(UserId user_id);

    const UserId& user_id() const { return user_id_; }
    bool empty() const { return !master_ && !self_signing_ && !user_signing_; }
    bool shared() const { return shared_; }
    void mark_as_shared() { shared_ = true; }

    CrossSigningStatus status() const;

    /// Drops all private keys.
    void reset();

    /// API: secrets/PrivateCrossSigningIdentity::export_secret
    ///
    /// Returns the unpadded base64 seed of the cross-signing key with the given secret name, or
    /// nullopt if we don't have that key (or the name isn't a cross-signing secret).
    std::optional<std::string> export_secret(std::string_view name) const;

    /// API: secrets/PrivateCrossSigningIdentity::import_secrets
    ///
    /// Imports any of the given private keys after checking that each one's public key matches
    /// the corresponding key of `public_identity`.  Nothing is imported unless every given key
    /// matches.
    ///
    /// Throws `invalid_secret_key` for undecodable keys and `mismatched_public_keys` if a public
    /// key differs.
    void import_secrets(
            const OwnUserIdentityData& public_identity,
            std::optional<std::string_view> master_key,
            std::optional<std::string_view> self_signing_key,
            std::optional<std::string_view> user_signing_key);

    /// Imports a single gossipped cross-signing key, checked like `import_secrets`.
    void import_secret(
            const OwnUserIdentityData& public_identity,
            std::string_view name,
            std::string_view value);

    /// API: secrets/PrivateCrossSigningIdentity::import_secrets_unchecked
    ///
    /// Imports the given private keys without comparing them to any public identity.  Only for
    /// secrets that come from a source that is already trusted.
    void import_secrets_unchecked(
            std::optional<std::string_view> master_key,
            std::optional<std::string_view> self_signing_key,
            std::optional<std::string_view> user_signing_key);

    /// Compares our public keys with a published identity.  Keys we don't have count as
    /// differing.
    IdentityDiff get_public_identity_diff(const OwnUserIdentityData& public_identity) const;

    /// Builds our public identity from the private keys; nullopt unless we have all three.
    std::optional<OwnUserIdentityData> to_public_identity() const;

  private:
    struct KeyPair {
        sodium_cleared<std::array<unsigned char, 32>> seed;
        std::array<unsigned char, 32> pubkey;

        std::string public_b64() const;
        std::string seed_b64() const;
    };

    static KeyPair decode(std::string_view seed_b64);

    UserId user_id_;
    bool shared_ = false;
    std::optional<KeyPair> master_;
    std::optional<KeyPair> self_signing_;
    std::optional<KeyPair> user_signing_;
};

}  // namespace eematrix::store
