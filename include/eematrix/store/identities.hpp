#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../types.hpp"

namespace eematrix::store {

/// How the local user has chosen to trust a device, independent of cross-signing.
enum class LocalTrust { unset, verified, blacklisted, ignored };

/// A device as published in a `/keys/query` response, plus our local trust in it.
struct DeviceData {
    UserId user_id;
    DeviceId device_id;
    std::vector<std::string> algorithms;
    // key id ("curve25519:DEVICEID", "ed25519:DEVICEID") -> unpadded base64 public key
    std::map<std::string, std::string> keys;
    std::optional<std::string> display_name;
    LocalTrust local_trust = LocalTrust::unset;
    bool deleted = false;

    std::optional<std::string> curve25519_key() const;
    std::optional<std::string> ed25519_key() const;
};

/// Our own cross-signing identity as published on the server.
struct OwnUserIdentityData {
    UserId user_id;
    std::string master_key;
    std::string self_signing_key;
    std::string user_signing_key;
    bool verified = false;

    void mark_as_verified() { verified = true; }
};

/// Another user's cross-signing identity.  They never publish a user-signing key to us.
struct OtherUserIdentityData {
    UserId user_id;
    std::string master_key;
    std::string self_signing_key;
    // The master key we pinned when first seeing this identity, if any.
    std::optional<std::string> pinned_master_key;
};

/// Either our own identity or somebody else's.
class UserIdentityData {
  public:
    UserIdentityData(OwnUserIdentityData own) : data_{std::move(own)} {}
    UserIdentityData(OtherUserIdentityData other) : data_{std::move(other)} {}

    const UserId& user_id() const;
    const std::string& master_key() const;
    const std::string& self_signing_key() const;

    bool is_own() const { return std::holds_alternative<OwnUserIdentityData>(data_); }
    const OwnUserIdentityData* own() const { return std::get_if<OwnUserIdentityData>(&data_); }
    OwnUserIdentityData* own() { return std::get_if<OwnUserIdentityData>(&data_); }
    const OtherUserIdentityData* other() const {
        return std::get_if<OtherUserIdentityData>(&data_);
    }

  private:
    std::variant<OwnUserIdentityData, OtherUserIdentityData> data_;
};

/// A device with the identities needed to reason about its trust attached: the identity of the
/// device owner and our own identity.  The trust computation itself lives outside the store.
struct Device {
    DeviceData inner;
    std::optional<OwnUserIdentityData> own_identity;
    std::optional<UserIdentityData> device_owner_identity;

    const UserId& user_id() const { return inner.user_id; }
    const DeviceId& device_id() const { return inner.device_id; }
};

/// A user identity with our own identity attached.
struct UserIdentity {
    UserIdentityData inner;
    std::optional<OwnUserIdentityData> own_identity;

    const UserId& user_id() const { return inner.user_id(); }
};

/// All devices of one user, with identities attached as for `Device`.
struct UserDevices {
    std::map<DeviceId, DeviceData> inner;
    std::optional<OwnUserIdentityData> own_identity;
    std::optional<UserIdentityData> device_owner_identity;

    std::optional<Device> get(const DeviceId& device_id) const;
    std::vector<Device> devices() const;
};

}  // namespace eematrix::store
