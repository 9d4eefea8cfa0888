#include "eematrix/store/crypto_store_wrapper.hpp"

#include "eematrix/store/error.hpp"

namespace eematrix::store {

CryptoStoreWrapper::CryptoStoreWrapper(
        UserId user_id,
        DeviceId device_id,
        std::shared_ptr<CryptoStore> store,
        const StoreOptions& options) :
        user_id_{std::move(user_id)},
        device_id_{std::move(device_id)},
        store_{std::move(store)},
        room_keys_received_{
                "room keys received", options.room_keys_received_capacity, LagPolicy::error},
        room_keys_withheld_{
                "room keys withheld", options.room_keys_withheld_capacity, LagPolicy::drop},
        identities_{"identities", options.identities_capacity, LagPolicy::drop},
        secrets_{"secrets", options.secrets_capacity, LagPolicy::drop},
        historic_room_keys_{
                "historic room keys", options.historic_room_key_capacity, LagPolicy::drop} {
    if (!store_)
        throw std::invalid_argument{"CryptoStoreWrapper requires a backend"};

    auto forward = [this](LogLevel lvl, std::string msg) { log(lvl, std::move(msg)); };
    room_keys_received_.logger = forward;
    room_keys_withheld_.logger = forward;
    identities_.logger = forward;
    secrets_.logger = forward;
    historic_room_keys_.logger = forward;
}

template <typename F>
auto CryptoStoreWrapper::call(const char* what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const store_error&) {
        throw;
    } catch (const std::exception& e) {
        throw backend_error{std::string{what} + " failed: " + e.what()};
    }
}

void CryptoStoreWrapper::notify(const Changes& changes) {
    if (!changes.inbound_group_sessions.empty()) {
        std::vector<RoomKeyInfo> infos;
        infos.reserve(changes.inbound_group_sessions.size());
        for (const auto& session : changes.inbound_group_sessions)
            infos.push_back(RoomKeyInfo::from(session));
        room_keys_received_.send(infos);
    }

    if (!changes.withheld_session_info.empty()) {
        std::vector<RoomKeyWithheldInfo> infos;
        infos.reserve(changes.withheld_session_info.size());
        for (const auto& entry : changes.withheld_session_info)
            infos.push_back(RoomKeyWithheldInfo{entry.room_id, entry.session_id, entry.content});
        room_keys_withheld_.send(infos);
    }

    if (!changes.identities.empty() || !changes.identities.unchanged.empty() ||
        !changes.devices.empty()) {
        IdentityUpdateBatch batch;
        if (auto own = get_user_identity(user_id_); own && own->own())
            batch.own_identity = *own->own();
        batch.identities = changes.identities;
        batch.devices = changes.devices;
        identities_.send(batch);
    }

    for (const auto& secret : changes.secrets)
        secrets_.send(secret);

    for (const auto& bundle : changes.received_room_key_bundles)
        historic_room_keys_.send(RoomKeyBundleInfo{bundle.sender_user, bundle.bundle_data.room_id});
}

std::optional<Account> CryptoStoreWrapper::load_account() {
    return call("load_account", [&] { return store_->load_account(); });
}

std::optional<PrivateCrossSigningIdentity> CryptoStoreWrapper::load_identity() {
    return call("load_identity", [&] { return store_->load_identity(); });
}

void CryptoStoreWrapper::save_changes(const Changes& changes) {
    call("save_changes", [&] { store_->save_changes(changes); });
    notify(changes);
}

void CryptoStoreWrapper::save_pending_changes(const PendingChanges& changes) {
    call("save_pending_changes", [&] { store_->save_pending_changes(changes); });
    notify(changes.changes);
}

void CryptoStoreWrapper::save_inbound_group_sessions(
        const std::vector<InboundGroupSession>& sessions,
        std::optional<std::string_view> backed_up_to_version) {
    call("save_inbound_group_sessions",
         [&] { store_->save_inbound_group_sessions(sessions, backed_up_to_version); });

    if (sessions.empty())
        return;
    std::vector<RoomKeyInfo> infos;
    infos.reserve(sessions.size());
    for (const auto& session : sessions)
        infos.push_back(RoomKeyInfo::from(session));
    room_keys_received_.send(infos);
}

std::optional<std::vector<Session>> CryptoStoreWrapper::get_sessions(std::string_view sender_key) {
    return call("get_sessions", [&] { return store_->get_sessions(sender_key); });
}

std::optional<InboundGroupSession> CryptoStoreWrapper::get_inbound_group_session(
        std::string_view room_id, std::string_view session_id) {
    return call("get_inbound_group_session", [&] {
        return store_->get_inbound_group_session(room_id, session_id);
    });
}

std::vector<InboundGroupSession> CryptoStoreWrapper::get_inbound_group_sessions() {
    return call("get_inbound_group_sessions", [&] { return store_->get_inbound_group_sessions(); });
}

RoomKeyCounts CryptoStoreWrapper::inbound_group_session_counts(
        std::optional<std::string_view> backup_version) {
    return call("inbound_group_session_counts", [&] {
        return store_->inbound_group_session_counts(backup_version);
    });
}

std::vector<InboundGroupSession> CryptoStoreWrapper::inbound_group_sessions_for_backup(
        std::string_view backup_version, size_t limit) {
    return call("inbound_group_sessions_for_backup", [&] {
        return store_->inbound_group_sessions_for_backup(backup_version, limit);
    });
}

void CryptoStoreWrapper::mark_inbound_group_sessions_as_backed_up(
        std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions) {
    call("mark_inbound_group_sessions_as_backed_up", [&] {
        store_->mark_inbound_group_sessions_as_backed_up(backup_version, sessions);
    });
}

void CryptoStoreWrapper::reset_backup_state() {
    call("reset_backup_state", [&] { store_->reset_backup_state(); });
}

BackupKeys CryptoStoreWrapper::load_backup_keys() {
    return call("load_backup_keys", [&] { return store_->load_backup_keys(); });
}

std::optional<RoomKeyWithheldContent> CryptoStoreWrapper::get_withheld_info(
        std::string_view room_id, std::string_view session_id) {
    return call("get_withheld_info", [&] {
        return store_->get_withheld_info(room_id, session_id);
    });
}

std::optional<DeviceData> CryptoStoreWrapper::get_device(
        std::string_view user_id, std::string_view device_id) {
    return call("get_device", [&] { return store_->get_device(user_id, device_id); });
}

std::map<DeviceId, DeviceData> CryptoStoreWrapper::get_user_devices(std::string_view user_id) {
    return call("get_user_devices", [&] { return store_->get_user_devices(user_id); });
}

std::optional<UserIdentityData> CryptoStoreWrapper::get_user_identity(std::string_view user_id) {
    return call("get_user_identity", [&] { return store_->get_user_identity(user_id); });
}

std::vector<TrackedUser> CryptoStoreWrapper::load_tracked_users() {
    return call("load_tracked_users", [&] { return store_->load_tracked_users(); });
}

void CryptoStoreWrapper::save_tracked_users(const std::vector<std::pair<UserId, bool>>& users) {
    call("save_tracked_users", [&] { store_->save_tracked_users(users); });
}

std::optional<ustring> CryptoStoreWrapper::get_custom_value(std::string_view key) {
    return call("get_custom_value", [&] { return store_->get_custom_value(key); });
}

void CryptoStoreWrapper::set_custom_value(std::string_view key, ustring value) {
    call("set_custom_value", [&] { store_->set_custom_value(key, std::move(value)); });
}

void CryptoStoreWrapper::remove_custom_value(std::string_view key) {
    call("remove_custom_value", [&] { store_->remove_custom_value(key); });
}

std::vector<GossippedSecret> CryptoStoreWrapper::get_secrets_from_inbox(
        std::string_view secret_name) {
    return call("get_secrets_from_inbox", [&] {
        return store_->get_secrets_from_inbox(secret_name);
    });
}

void CryptoStoreWrapper::delete_secrets_from_inbox(std::string_view secret_name) {
    call("delete_secrets_from_inbox", [&] { store_->delete_secrets_from_inbox(secret_name); });
}

std::optional<StoredRoomKeyBundleData> CryptoStoreWrapper::get_received_room_key_bundle_data(
        std::string_view room_id, std::string_view user_id) {
    return call("get_received_room_key_bundle_data", [&] {
        return store_->get_received_room_key_bundle_data(room_id, user_id);
    });
}

bool CryptoStoreWrapper::try_take_leased_lock(
        std::chrono::milliseconds lease_duration, std::string_view key, std::string_view holder) {
    return call("try_take_leased_lock", [&] {
        return store_->try_take_leased_lock(lease_duration, key, holder);
    });
}

}  // namespace eematrix::store
