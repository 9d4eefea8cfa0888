#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../types.hpp"
#include "changes.hpp"
#include "identities.hpp"
#include "olm.hpp"
#include "room_history.hpp"
#include "secrets.hpp"

namespace eematrix::store {

/// A (room id, session id) pair naming one inbound group session.
using RoomAndSessionId = std::pair<RoomId, std::string>;

/// Storage capability consumed by the store.
///
/// A backend persists accounts, sessions, room keys, device and identity records, the tracked user
/// list, secrets and small named values, and offers a leased lock that callers may build a
/// cross-process lock on.  Backends report failure by throwing; the store wraps anything a backend
/// throws into a `backend_error` and never inspects it further.
///
/// Backends must be safe to call from multiple threads at once, and must serialize their own writes
/// per logical key.
class CryptoStore {
  public:
    virtual ~CryptoStore() = default;

    /// Loads the account, or nullopt if none was ever saved.
    virtual std::optional<Account> load_account() = 0;

    /// Loads the private cross-signing identity, if any was saved.
    virtual std::optional<PrivateCrossSigningIdentity> load_identity() = 0;

    /// Persists everything in `changes` atomically.
    virtual void save_changes(const Changes& changes) = 0;

    /// Persists the account (if set) and the other changes of a transaction atomically.
    virtual void save_pending_changes(const PendingChanges& changes) = 0;

    /// Persists room keys; if `backed_up_to_version` is set they are recorded as already backed up
    /// to that backup version.
    virtual void save_inbound_group_sessions(
            const std::vector<InboundGroupSession>& sessions,
            std::optional<std::string_view> backed_up_to_version) = 0;

    /// All Olm sessions established with the device that owns `sender_key`.
    virtual std::optional<std::vector<Session>> get_sessions(std::string_view sender_key) = 0;

    virtual std::optional<InboundGroupSession> get_inbound_group_session(
            std::string_view room_id, std::string_view session_id) = 0;

    /// All room keys, in (room id, session id) order.
    virtual std::vector<InboundGroupSession> get_inbound_group_sessions() = 0;

    virtual RoomKeyCounts inbound_group_session_counts(
            std::optional<std::string_view> backup_version) = 0;

    /// Up to `limit` room keys that still need to be uploaded to the given backup version.
    virtual std::vector<InboundGroupSession> inbound_group_sessions_for_backup(
            std::string_view backup_version, size_t limit) = 0;

    virtual void mark_inbound_group_sessions_as_backed_up(
            std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions) = 0;

    /// Forgets which room keys were backed up, e.g. because a new backup version was created.
    virtual void reset_backup_state() = 0;

    virtual BackupKeys load_backup_keys() = 0;

    virtual std::optional<RoomKeyWithheldContent> get_withheld_info(
            std::string_view room_id, std::string_view session_id) = 0;

    virtual std::optional<DeviceData> get_device(
            std::string_view user_id, std::string_view device_id) = 0;

    virtual std::map<DeviceId, DeviceData> get_user_devices(std::string_view user_id) = 0;

    virtual std::optional<UserIdentityData> get_user_identity(std::string_view user_id) = 0;

    virtual std::vector<TrackedUser> load_tracked_users() = 0;

    /// Upserts (user id, dirty) records.
    virtual void save_tracked_users(const std::vector<std::pair<UserId, bool>>& users) = 0;

    virtual std::optional<ustring> get_custom_value(std::string_view key) = 0;
    virtual void set_custom_value(std::string_view key, ustring value) = 0;
    virtual void remove_custom_value(std::string_view key) = 0;

    /// Gossipped secrets with the given name waiting in the inbox, oldest first.
    virtual std::vector<GossippedSecret> get_secrets_from_inbox(std::string_view secret_name) = 0;
    virtual void delete_secrets_from_inbox(std::string_view secret_name) = 0;

    virtual std::optional<StoredRoomKeyBundleData> get_received_room_key_bundle_data(
            std::string_view room_id, std::string_view user_id) = 0;

    /// API: crypto_store/CryptoStore::try_take_leased_lock
    ///
    /// Attempts to take the lease named `key` for `holder`.  The lease is granted if nobody holds
    /// it, if the previous lease expired, or if `holder` already holds it (which renews it).
    ///
    /// Inputs:
    /// - `lease_duration` -- how long the lease stays valid without renewal.
    /// - `key` -- the lock name.
    /// - `holder` -- an identifier for the process taking the lock.
    ///
    /// Outputs:
    /// - true if the lease is now held by `holder`.
    virtual bool try_take_leased_lock(
            std::chrono::milliseconds lease_duration,
            std::string_view key,
            std::string_view holder) = 0;
};

}  // namespace eematrix::store
