#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "broadcast.hpp"
#include "crypto_store.hpp"
#include "log.hpp"

namespace eematrix::store {

/// Capacities of the notification channels.
struct StoreOptions {
    size_t room_keys_received_capacity = 10;
    size_t room_keys_withheld_capacity = 10;
    size_t identities_capacity = 10;
    size_t secrets_capacity = 10;
    size_t historic_room_key_capacity = 10;
};

/// One identities/devices delta as written to the backend, together with our own identity as it
/// was right after the write.
struct IdentityUpdateBatch {
    std::optional<OwnUserIdentityData> own_identity;
    IdentityChanges identities;
    DeviceChanges devices;
};

/// Decorates a CryptoStore backend: every backend failure is wrapped in `backend_error`, and every
/// successful write is fanned out to the notification channels.
class CryptoStoreWrapper {
  public:
    CryptoStoreWrapper(
            UserId user_id,
            DeviceId device_id,
            std::shared_ptr<CryptoStore> store,
            const StoreOptions& options = {});

    CryptoStoreWrapper(CryptoStoreWrapper&&) = delete;
    CryptoStoreWrapper(const CryptoStoreWrapper&) = delete;
    CryptoStoreWrapper& operator=(CryptoStoreWrapper&&) = delete;
    CryptoStoreWrapper& operator=(const CryptoStoreWrapper&) = delete;

    // If set then we log things by calling this callback
    logger_callable logger;

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) {
        if (logger)
            logger(lvl, std::move(msg));
    }

    const std::shared_ptr<CryptoStore>& backend() const { return store_; }

    std::optional<Account> load_account();
    std::optional<PrivateCrossSigningIdentity> load_identity();

    /// Persists `changes`, then notifies subscribers of whatever the changes contain.
    void save_changes(const Changes& changes);
    void save_pending_changes(const PendingChanges& changes);
    void save_inbound_group_sessions(
            const std::vector<InboundGroupSession>& sessions,
            std::optional<std::string_view> backed_up_to_version);

    std::optional<std::vector<Session>> get_sessions(std::string_view sender_key);
    std::optional<InboundGroupSession> get_inbound_group_session(
            std::string_view room_id, std::string_view session_id);
    std::vector<InboundGroupSession> get_inbound_group_sessions();
    RoomKeyCounts inbound_group_session_counts(std::optional<std::string_view> backup_version);
    std::vector<InboundGroupSession> inbound_group_sessions_for_backup(
            std::string_view backup_version, size_t limit);
    void mark_inbound_group_sessions_as_backed_up(
            std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions);
    void reset_backup_state();
    BackupKeys load_backup_keys();
    std::optional<RoomKeyWithheldContent> get_withheld_info(
            std::string_view room_id, std::string_view session_id);
    std::optional<DeviceData> get_device(std::string_view user_id, std::string_view device_id);
    std::map<DeviceId, DeviceData> get_user_devices(std::string_view user_id);
    std::optional<UserIdentityData> get_user_identity(std::string_view user_id);
    std::vector<TrackedUser> load_tracked_users();
    void save_tracked_users(const std::vector<std::pair<UserId, bool>>& users);
    std::optional<ustring> get_custom_value(std::string_view key);
    void set_custom_value(std::string_view key, ustring value);
    void remove_custom_value(std::string_view key);
    std::vector<GossippedSecret> get_secrets_from_inbox(std::string_view secret_name);
    void delete_secrets_from_inbox(std::string_view secret_name);
    std::optional<StoredRoomKeyBundleData> get_received_room_key_bundle_data(
            std::string_view room_id, std::string_view user_id);
    bool try_take_leased_lock(
            std::chrono::milliseconds lease_duration,
            std::string_view key,
            std::string_view holder);

    Subscription<std::vector<RoomKeyInfo>> room_keys_received_stream() {
        return room_keys_received_.subscribe();
    }
    Subscription<std::vector<RoomKeyWithheldInfo>> room_keys_withheld_received_stream() {
        return room_keys_withheld_.subscribe();
    }
    Subscription<IdentityUpdateBatch> identities_stream() { return identities_.subscribe(); }
    Subscription<GossippedSecret> secrets_stream() { return secrets_.subscribe(); }
    Subscription<RoomKeyBundleInfo> historic_room_key_stream() {
        return historic_room_keys_.subscribe();
    }

  private:
    // Runs a backend call, converting anything it throws other than a store_error into a
    // backend_error.
    template <typename F>
    auto call(const char* what, F&& f) -> decltype(f());

    void notify(const Changes& changes);

    UserId user_id_;
    DeviceId device_id_;
    std::shared_ptr<CryptoStore> store_;

    Broadcast<std::vector<RoomKeyInfo>> room_keys_received_;
    Broadcast<std::vector<RoomKeyWithheldInfo>> room_keys_withheld_;
    Broadcast<IdentityUpdateBatch> identities_;
    Broadcast<GossippedSecret> secrets_;
    Broadcast<RoomKeyBundleInfo> historic_room_keys_;
};

}  // namespace eematrix::store
