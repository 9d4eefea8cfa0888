#include "eematrix/store/secrets.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "eematrix/ed25519.hpp"
#include "eematrix/random.hpp"

namespace eematrix::store {

std::optional<KeyUsage> secret_name::cross_signing_usage(std::string_view name) {
    if (name == CROSS_SIGNING_MASTER_KEY)
        return KeyUsage::master;
    if (name == CROSS_SIGNING_SELF_SIGNING_KEY)
        return KeyUsage::self_signing;
    if (name == CROSS_SIGNING_USER_SIGNING_KEY)
        return KeyUsage::user_signing;
    return std::nullopt;
}

BackupDecryptionKey::BackupDecryptionKey() {
    auto raw = random::random(KEY_SIZE);
    std::copy(raw.begin(), raw.end(), key_.begin());
    sodium_zero_buffer(raw.data(), raw.size());
}

BackupDecryptionKey BackupDecryptionKey::from_base64(std::string_view b64) {
    ustring raw;
    try {
        raw = eematrix::from_base64(b64);
    } catch (const std::invalid_argument& e) {
        throw invalid_secret_key{std::string{"Invalid backup decryption key: "} + e.what()};
    }
    if (raw.size() != KEY_SIZE) {
        sodium_zero_buffer(raw.data(), raw.size());
        throw invalid_secret_key{
                "Invalid backup decryption key: expected " + std::to_string(KEY_SIZE) +
                " bytes, got " + std::to_string(raw.size())};
    }
    BackupDecryptionKey key;
    std::copy(raw.begin(), raw.end(), key.key_.begin());
    sodium_zero_buffer(raw.data(), raw.size());
    return key;
}

std::string BackupDecryptionKey::to_base64() const {
    return to_base64_unpadded(to_unsigned_sv(key_));
}

void to_json(nlohmann::json& j, const SecretsBundle& bundle) {
    j = nlohmann::json{
            {"cross_signing",
             {{"master_key", bundle.cross_signing.master_key},
              {"self_signing_key", bundle.cross_signing.self_signing_key},
              {"user_signing_key", bundle.cross_signing.user_signing_key}}}};
    if (bundle.backup)
        j["backup"] = {
                {"algorithm", std::string{BackupSecrets::ALGORITHM}},
                {"key", bundle.backup->key.to_base64()},
                {"backup_version", bundle.backup->backup_version}};
}

void from_json(const nlohmann::json& j, SecretsBundle& bundle) {
    const auto& cs = j.at("cross_signing");
    cs.at("master_key").get_to(bundle.cross_signing.master_key);
    cs.at("self_signing_key").get_to(bundle.cross_signing.self_signing_key);
    cs.at("user_signing_key").get_to(bundle.cross_signing.user_signing_key);

    bundle.backup.reset();
    if (auto it = j.find("backup"); it != j.end() && !it->is_null()) {
        auto algorithm = it->at("algorithm").get<std::string>();
        if (algorithm != BackupSecrets::ALGORITHM)
            throw std::invalid_argument{"Unsupported backup algorithm " + algorithm};
        bundle.backup = BackupSecrets{
                BackupDecryptionKey::from_base64(it->at("key").get<std::string>()),
                it->at("backup_version").get<std::string>()};
    }
}

std::string PrivateCrossSigningIdentity::KeyPair::public_b64() const {
    return to_base64_unpadded(to_unsigned_sv(pubkey));
}

std::string PrivateCrossSigningIdentity::KeyPair::seed_b64() const {
    return to_base64_unpadded(to_unsigned_sv(seed));
}

PrivateCrossSigningIdentity::KeyPair PrivateCrossSigningIdentity::decode(
        std::string_view seed_b64) {
    ustring raw;
    try {
        raw = eematrix::from_base64(seed_b64);
    } catch (const std::invalid_argument& e) {
        throw invalid_secret_key{std::string{"Invalid cross-signing key: "} + e.what()};
    }
    if (raw.size() != 32) {
        sodium_zero_buffer(raw.data(), raw.size());
        throw invalid_secret_key{
                "Invalid cross-signing key: expected 32 bytes, got " +
                std::to_string(raw.size())};
    }

    KeyPair kp;
    std::copy(raw.begin(), raw.end(), kp.seed.begin());
    kp.pubkey = ed25519::pubkey_for_seed(raw);
    sodium_zero_buffer(raw.data(), raw.size());
    return kp;
}

PrivateCrossSigningIdentity::PrivateCrossSigningIdentity(UserId user_id) :
        user_id_{std::move(user_id)} {}

CrossSigningStatus PrivateCrossSigningIdentity::status() const {
    return CrossSigningStatus{
            master_.has_value(), self_signing_.has_value(), user_signing_.has_value()};
}

void PrivateCrossSigningIdentity::reset() {
    master_.reset();
    self_signing_.reset();
    user_signing_.reset();
    shared_ = false;
}

std::optional<std::string> PrivateCrossSigningIdentity::export_secret(
        std::string_view name) const {
    auto usage = secret_name::cross_signing_usage(name);
    if (!usage)
        return std::nullopt;
    const std::optional<KeyPair>* kp = nullptr;
    switch (*usage) {
        case KeyUsage::master: kp = &master_; break;
        case KeyUsage::self_signing: kp = &self_signing_; break;
        case KeyUsage::user_signing: kp = &user_signing_; break;
    }
    if (!kp || !*kp)
        return std::nullopt;
    return (*kp)->seed_b64();
}

void PrivateCrossSigningIdentity::import_secrets(
        const OwnUserIdentityData& public_identity,
        std::optional<std::string_view> master_key,
        std::optional<std::string_view> self_signing_key,
        std::optional<std::string_view> user_signing_key) {
    // Decode and check everything before touching our keys so a failure imports nothing.
    std::optional<KeyPair> master, self_signing, user_signing;
    if (master_key) {
        master = decode(*master_key);
        if (master->public_b64() != public_identity.master_key)
            throw mismatched_public_keys{};
    }
    if (self_signing_key) {
        self_signing = decode(*self_signing_key);
        if (self_signing->public_b64() != public_identity.self_signing_key)
            throw mismatched_public_keys{};
    }
    if (user_signing_key) {
        user_signing = decode(*user_signing_key);
        if (user_signing->public_b64() != public_identity.user_signing_key)
            throw mismatched_public_keys{};
    }

    if (master)
        master_ = std::move(master);
    if (self_signing)
        self_signing_ = std::move(self_signing);
    if (user_signing)
        user_signing_ = std::move(user_signing);
}

void PrivateCrossSigningIdentity::import_secret(
        const OwnUserIdentityData& public_identity,
        std::string_view name,
        std::string_view value) {
    auto usage = secret_name::cross_signing_usage(name);
    if (!usage)
        throw std::invalid_argument{std::string{name} + " is not a cross-signing secret"};
    switch (*usage) {
        case KeyUsage::master:
            import_secrets(public_identity, value, std::nullopt, std::nullopt);
            break;
        case KeyUsage::self_signing:
            import_secrets(public_identity, std::nullopt, value, std::nullopt);
            break;
        case KeyUsage::user_signing:
            import_secrets(public_identity, std::nullopt, std::nullopt, value);
            break;
    }
}

void PrivateCrossSigningIdentity::import_secrets_unchecked(
        std::optional<std::string_view> master_key,
        std::optional<std::string_view> self_signing_key,
        std::optional<std::string_view> user_signing_key) {
    std::optional<KeyPair> master, self_signing, user_signing;
    if (master_key)
        master = decode(*master_key);
    if (self_signing_key)
        self_signing = decode(*self_signing_key);
    if (user_signing_key)
        user_signing = decode(*user_signing_key);

    if (master)
        master_ = std::move(master);
    if (self_signing)
        self_signing_ = std::move(self_signing);
    if (user_signing)
        user_signing_ = std::move(user_signing);
}

IdentityDiff PrivateCrossSigningIdentity::get_public_identity_diff(
        const OwnUserIdentityData& public_identity) const {
    IdentityDiff diff;
    diff.master_differs = !master_ || master_->public_b64() != public_identity.master_key;
    diff.self_signing_differs =
            !self_signing_ || self_signing_->public_b64() != public_identity.self_signing_key;
    diff.user_signing_differs =
            !user_signing_ || user_signing_->public_b64() != public_identity.user_signing_key;
    return diff;
}

std::optional<OwnUserIdentityData> PrivateCrossSigningIdentity::to_public_identity() const {
    if (!master_ || !self_signing_ || !user_signing_)
        return std::nullopt;
    OwnUserIdentityData identity;
    identity.user_id = user_id_;
    identity.master_key = master_->public_b64();
    identity.self_signing_key = self_signing_->public_b64();
    identity.user_signing_key = user_signing_->public_b64();
    return identity;
}

}  // namespace eematrix::store
