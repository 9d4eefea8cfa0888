#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../types.hpp"
#include "identities.hpp"
#include "olm.hpp"
#include "room_history.hpp"
#include "secrets.hpp"

namespace eematrix::store {

/// A user whose device list we follow; `dirty` means it needs a `/keys/query`.
struct TrackedUser {
    UserId user_id;
    bool dirty;
};

/// Identity deltas produced by a key query, partitioned by what happened to each identity.
struct IdentityChanges {
    std::vector<UserIdentityData> new_;
    std::vector<UserIdentityData> changed;
    std::vector<UserIdentityData> unchanged;

    bool empty() const { return new_.empty() && changed.empty(); }

    struct Maps {
        std::map<UserId, UserIdentityData> new_;
        std::map<UserId, UserIdentityData> changed;
        std::map<UserId, UserIdentityData> unchanged;
    };
    /// Re-keys the three partitions by user id.
    Maps into_maps() const;
};

/// Device deltas produced by a key query.
struct DeviceChanges {
    std::vector<DeviceData> new_;
    std::vector<DeviceData> changed;
    std::vector<DeviceData> deleted;

    bool empty() const { return new_.empty() && changed.empty() && deleted.empty(); }
};

/// A withheld declaration we received for a session.
struct RoomKeyWithheldEntry {
    RoomId room_id;
    std::string session_id;
    RoomKeyWithheldContent content;
};

/// A set of changes to be written to the backend in one go.
struct Changes {
    std::optional<PrivateCrossSigningIdentity> private_identity;
    std::optional<std::string> backup_version;
    std::optional<BackupDecryptionKey> backup_decryption_key;
    std::vector<Session> sessions;
    std::vector<InboundGroupSession> inbound_group_sessions;
    IdentityChanges identities;
    DeviceChanges devices;
    std::vector<RoomKeyWithheldEntry> withheld_session_info;
    std::vector<GossippedSecret> secrets;
    std::vector<StoredRoomKeyBundleData> received_room_key_bundles;

    bool empty() const;
};

/// Uncommitted mutations accumulated by one StoreTransaction.  The account lives here while the
/// transaction owns it; everything else is written alongside it on commit.
struct PendingChanges {
    std::optional<Account> account;
    Changes changes;

    bool empty() const { return !account && changes.empty(); }
};

/// Notification that a room key was received or updated.
struct RoomKeyInfo {
    std::string algorithm;
    RoomId room_id;
    std::string sender_key;
    std::string session_id;

    static RoomKeyInfo from(const InboundGroupSession& session);
};

/// Notification that a withheld declaration was received.
struct RoomKeyWithheldInfo {
    RoomId room_id;
    std::string session_id;
    RoomKeyWithheldContent withheld_event;
};

/// Number of stored inbound group sessions, and how many of those are backed up.
struct RoomKeyCounts {
    size_t total = 0;
    size_t backed_up = 0;
};

/// room id -> sender key -> session ids
using ImportedRoomKeyMap = std::map<RoomId, std::map<std::string, std::set<std::string>>>;

/// Outcome of a room key import.
struct RoomKeyImportResult {
    // Number of keys that were actually written.
    size_t imported_count = 0;
    // Number of keys that were in the input, including skipped ones.
    size_t total_count = 0;
    // The keys that were written, for reconciliation by the caller.
    ImportedRoomKeyMap keys;
};

/// Devices grouped by user, then device id.
using DeviceMap = std::map<UserId, std::map<DeviceId, Device>>;

/// Caller-facing device updates with identities attached.
struct DeviceUpdates {
    DeviceMap new_;
    DeviceMap changed;
};

/// Caller-facing identity updates with our own identity attached.
struct IdentityUpdates {
    std::map<UserId, UserIdentity> new_;
    std::map<UserId, UserIdentity> changed;
    std::map<UserId, UserIdentity> unchanged;
};

/// Outcome of waiting for a pending key query.
enum class UserKeyQueryResult {
    /// A query was pending and completed while we waited.
    WasPending,
    /// There was no pending query for the user.
    WasNotPending,
    /// A query was pending but did not complete before the timeout; the user's devices may be
    /// stale.
    TimeoutExpired,
};

}  // namespace eematrix::store
