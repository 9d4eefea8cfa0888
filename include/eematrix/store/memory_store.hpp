#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "crypto_store.hpp"

namespace eematrix::store {

/// An in-memory CryptoStore.  Nothing survives the object; used for tests and for clients that
/// don't need persistence.
class MemoryStore : public CryptoStore {
  public:
    MemoryStore() = default;

    MemoryStore(MemoryStore&&) = delete;
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(MemoryStore&&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<Account> load_account() override;
    std::optional<PrivateCrossSigningIdentity> load_identity() override;
    void save_changes(const Changes& changes) override;
    void save_pending_changes(const PendingChanges& changes) override;
    void save_inbound_group_sessions(
            const std::vector<InboundGroupSession>& sessions,
            std::optional<std::string_view> backed_up_to_version) override;
    std::optional<std::vector<Session>> get_sessions(std::string_view sender_key) override;
    std::optional<InboundGroupSession> get_inbound_group_session(
            std::string_view room_id, std::string_view session_id) override;
    std::vector<InboundGroupSession> get_inbound_group_sessions() override;
    RoomKeyCounts inbound_group_session_counts(
            std::optional<std::string_view> backup_version) override;
    std::vector<InboundGroupSession> inbound_group_sessions_for_backup(
            std::string_view backup_version, size_t limit) override;
    void mark_inbound_group_sessions_as_backed_up(
            std::string_view backup_version,
            const std::vector<RoomAndSessionId>& sessions) override;
    void reset_backup_state() override;
    BackupKeys load_backup_keys() override;
    std::optional<RoomKeyWithheldContent> get_withheld_info(
            std::string_view room_id, std::string_view session_id) override;
    std::optional<DeviceData> get_device(
            std::string_view user_id, std::string_view device_id) override;
    std::map<DeviceId, DeviceData> get_user_devices(std::string_view user_id) override;
    std::optional<UserIdentityData> get_user_identity(std::string_view user_id) override;
    std::vector<TrackedUser> load_tracked_users() override;
    void save_tracked_users(const std::vector<std::pair<UserId, bool>>& users) override;
    std::optional<ustring> get_custom_value(std::string_view key) override;
    void set_custom_value(std::string_view key, ustring value) override;
    void remove_custom_value(std::string_view key) override;
    std::vector<GossippedSecret> get_secrets_from_inbox(std::string_view secret_name) override;
    void delete_secrets_from_inbox(std::string_view secret_name) override;
    std::optional<StoredRoomKeyBundleData> get_received_room_key_bundle_data(
            std::string_view room_id, std::string_view user_id) override;
    bool try_take_leased_lock(
            std::chrono::milliseconds lease_duration,
            std::string_view key,
            std::string_view holder) override;

  private:
    struct StoredGroupSession {
        InboundGroupSession session;
        // The backup version the session was uploaded to, if any.
        std::optional<std::string> backed_up_to;
    };

    struct Lease {
        std::string holder;
        std::chrono::steady_clock::time_point expiry;
    };

    void save_changes_locked(const Changes& changes);

    std::mutex mutex_;

    std::optional<Account> account_;
    std::optional<PrivateCrossSigningIdentity> identity_;
    BackupKeys backup_keys_;
    std::map<std::string, std::vector<Session>, std::less<>> sessions_;
    std::map<RoomAndSessionId, StoredGroupSession> group_sessions_;
    std::map<RoomAndSessionId, RoomKeyWithheldContent> withheld_;
    std::map<UserId, std::map<DeviceId, DeviceData>, std::less<>> devices_;
    std::map<UserId, UserIdentityData, std::less<>> identities_;
    std::map<UserId, bool> tracked_users_;
    std::map<std::string, ustring, std::less<>> custom_values_;
    std::vector<GossippedSecret> secret_inbox_;
    std::map<std::pair<RoomId, UserId>, StoredRoomKeyBundleData> room_key_bundles_;
    std::map<std::string, Lease, std::less<>> leases_;
};

}  // namespace eematrix::store
