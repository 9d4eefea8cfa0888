#include "eematrix/store/memory_store.hpp"

#include <algorithm>

namespace eematrix::store {

std::optional<Account> MemoryStore::load_account() {
    std::lock_guard lock{mutex_};
    if (!account_)
        return std::nullopt;
    return account_->deep_clone();
}

std::optional<PrivateCrossSigningIdentity> MemoryStore::load_identity() {
    std::lock_guard lock{mutex_};
    return identity_;
}

void MemoryStore::save_changes(const Changes& changes) {
    std::lock_guard lock{mutex_};
    save_changes_locked(changes);
}

void MemoryStore::save_pending_changes(const PendingChanges& changes) {
    std::lock_guard lock{mutex_};
    if (changes.account)
        account_ = changes.account->deep_clone();
    save_changes_locked(changes.changes);
}

void MemoryStore::save_changes_locked(const Changes& changes) {
    if (changes.private_identity)
        identity_ = changes.private_identity;
    if (changes.backup_version)
        backup_keys_.backup_version = changes.backup_version;
    if (changes.backup_decryption_key)
        backup_keys_.decryption_key = changes.backup_decryption_key;

    for (const auto& session : changes.sessions) {
        auto& list = sessions_[session.sender_key];
        auto it = std::find_if(list.begin(), list.end(), [&](const Session& s) {
            return s.session_id == session.session_id;
        });
        if (it != list.end())
            *it = session;
        else
            list.push_back(session);
    }

    for (const auto& session : changes.inbound_group_sessions) {
        RoomAndSessionId id{session.room_id(), session.session_id()};
        std::optional<std::string> backed_up_to;
        if (session.backed_up()) {
            // Keep the version it was uploaded to; otherwise assume the current backup.
            if (auto it = group_sessions_.find(id);
                it != group_sessions_.end() && it->second.backed_up_to)
                backed_up_to = it->second.backed_up_to;
            else
                backed_up_to = backup_keys_.backup_version.value_or("");
        }
        group_sessions_.insert_or_assign(std::move(id), StoredGroupSession{session, backed_up_to});
    }

    for (const auto* part :
         {&changes.identities.new_, &changes.identities.changed, &changes.identities.unchanged})
        for (const auto& identity : *part)
            identities_.insert_or_assign(identity.user_id(), identity);

    for (const auto* part : {&changes.devices.new_, &changes.devices.changed})
        for (const auto& device : *part)
            devices_[device.user_id].insert_or_assign(device.device_id, device);
    for (const auto& device : changes.devices.deleted)
        if (auto it = devices_.find(device.user_id); it != devices_.end())
            it->second.erase(device.device_id);

    for (const auto& entry : changes.withheld_session_info)
        withheld_.insert_or_assign(
                RoomAndSessionId{entry.room_id, entry.session_id}, entry.content);

    for (const auto& secret : changes.secrets)
        secret_inbox_.push_back(secret);

    for (const auto& bundle : changes.received_room_key_bundles)
        room_key_bundles_.insert_or_assign(
                std::make_pair(bundle.bundle_data.room_id, bundle.sender_user), bundle);
}

void MemoryStore::save_inbound_group_sessions(
        const std::vector<InboundGroupSession>& sessions,
        std::optional<std::string_view> backed_up_to_version) {
    std::lock_guard lock{mutex_};
    for (const auto& session : sessions) {
        std::optional<std::string> backed_up_to;
        if (backed_up_to_version)
            backed_up_to = std::string{*backed_up_to_version};
        group_sessions_.insert_or_assign(
                RoomAndSessionId{session.room_id(), session.session_id()},
                StoredGroupSession{session, std::move(backed_up_to)});
    }
}

std::optional<std::vector<Session>> MemoryStore::get_sessions(std::string_view sender_key) {
    std::lock_guard lock{mutex_};
    auto it = sessions_.find(sender_key);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second;
}

namespace {
    InboundGroupSession with_backup_state(
            const InboundGroupSession& session, const std::optional<std::string>& backed_up_to) {
        InboundGroupSession copy = session;
        if (backed_up_to)
            copy.mark_as_backed_up();
        else
            copy.reset_backup_state();
        return copy;
    }
}  // namespace

std::optional<InboundGroupSession> MemoryStore::get_inbound_group_session(
        std::string_view room_id, std::string_view session_id) {
    std::lock_guard lock{mutex_};
    auto it = group_sessions_.find(RoomAndSessionId{room_id, session_id});
    if (it == group_sessions_.end())
        return std::nullopt;
    return with_backup_state(it->second.session, it->second.backed_up_to);
}

std::vector<InboundGroupSession> MemoryStore::get_inbound_group_sessions() {
    std::lock_guard lock{mutex_};
    std::vector<InboundGroupSession> result;
    result.reserve(group_sessions_.size());
    for (const auto& [id, stored] : group_sessions_)
        result.push_back(with_backup_state(stored.session, stored.backed_up_to));
    return result;
}

RoomKeyCounts MemoryStore::inbound_group_session_counts(
        std::optional<std::string_view> backup_version) {
    std::lock_guard lock{mutex_};
    RoomKeyCounts counts;
    counts.total = group_sessions_.size();
    if (backup_version)
        for (const auto& [id, stored] : group_sessions_)
            if (stored.backed_up_to && *stored.backed_up_to == *backup_version)
                counts.backed_up++;
    return counts;
}

std::vector<InboundGroupSession> MemoryStore::inbound_group_sessions_for_backup(
        std::string_view backup_version, size_t limit) {
    std::lock_guard lock{mutex_};
    std::vector<InboundGroupSession> result;
    for (const auto& [id, stored] : group_sessions_) {
        if (result.size() >= limit)
            break;
        if (!stored.backed_up_to || *stored.backed_up_to != backup_version)
            result.push_back(with_backup_state(stored.session, std::nullopt));
    }
    return result;
}

void MemoryStore::mark_inbound_group_sessions_as_backed_up(
        std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions) {
    std::lock_guard lock{mutex_};
    for (const auto& id : sessions)
        if (auto it = group_sessions_.find(id); it != group_sessions_.end())
            it->second.backed_up_to = std::string{backup_version};
}

void MemoryStore::reset_backup_state() {
    std::lock_guard lock{mutex_};
    for (auto& [id, stored] : group_sessions_)
        stored.backed_up_to.reset();
}

BackupKeys MemoryStore::load_backup_keys() {
    std::lock_guard lock{mutex_};
    return backup_keys_;
}

std::optional<RoomKeyWithheldContent> MemoryStore::get_withheld_info(
        std::string_view room_id, std::string_view session_id) {
    std::lock_guard lock{mutex_};
    auto it = withheld_.find(RoomAndSessionId{room_id, session_id});
    if (it == withheld_.end())
        return std::nullopt;
    return it->second;
}

std::optional<DeviceData> MemoryStore::get_device(
        std::string_view user_id, std::string_view device_id) {
    std::lock_guard lock{mutex_};
    auto user = devices_.find(user_id);
    if (user == devices_.end())
        return std::nullopt;
    auto it = user->second.find(std::string{device_id});
    if (it == user->second.end())
        return std::nullopt;
    return it->second;
}

std::map<DeviceId, DeviceData> MemoryStore::get_user_devices(std::string_view user_id) {
    std::lock_guard lock{mutex_};
    auto it = devices_.find(user_id);
    if (it == devices_.end())
        return {};
    return it->second;
}

std::optional<UserIdentityData> MemoryStore::get_user_identity(std::string_view user_id) {
    std::lock_guard lock{mutex_};
    auto it = identities_.find(user_id);
    if (it == identities_.end())
        return std::nullopt;
    return it->second;
}

std::vector<TrackedUser> MemoryStore::load_tracked_users() {
    std::lock_guard lock{mutex_};
    std::vector<TrackedUser> users;
    users.reserve(tracked_users_.size());
    for (const auto& [user_id, dirty] : tracked_users_)
        users.push_back(TrackedUser{user_id, dirty});
    return users;
}

void MemoryStore::save_tracked_users(const std::vector<std::pair<UserId, bool>>& users) {
    std::lock_guard lock{mutex_};
    for (const auto& [user_id, dirty] : users)
        tracked_users_.insert_or_assign(user_id, dirty);
}

std::optional<ustring> MemoryStore::get_custom_value(std::string_view key) {
    std::lock_guard lock{mutex_};
    auto it = custom_values_.find(key);
    if (it == custom_values_.end())
        return std::nullopt;
    return it->second;
}

void MemoryStore::set_custom_value(std::string_view key, ustring value) {
    std::lock_guard lock{mutex_};
    custom_values_.insert_or_assign(std::string{key}, std::move(value));
}

void MemoryStore::remove_custom_value(std::string_view key) {
    std::lock_guard lock{mutex_};
    if (auto it = custom_values_.find(key); it != custom_values_.end())
        custom_values_.erase(it);
}

std::vector<GossippedSecret> MemoryStore::get_secrets_from_inbox(std::string_view secret_name) {
    std::lock_guard lock{mutex_};
    std::vector<GossippedSecret> result;
    for (const auto& secret : secret_inbox_)
        if (secret.secret_name == secret_name)
            result.push_back(secret);
    return result;
}

void MemoryStore::delete_secrets_from_inbox(std::string_view secret_name) {
    std::lock_guard lock{mutex_};
    secret_inbox_.erase(
            std::remove_if(
                    secret_inbox_.begin(),
                    secret_inbox_.end(),
                    [&](const GossippedSecret& s) { return s.secret_name == secret_name; }),
            secret_inbox_.end());
}

std::optional<StoredRoomKeyBundleData> MemoryStore::get_received_room_key_bundle_data(
        std::string_view room_id, std::string_view user_id) {
    std::lock_guard lock{mutex_};
    auto it = room_key_bundles_.find(std::make_pair(RoomId{room_id}, UserId{user_id}));
    if (it == room_key_bundles_.end())
        return std::nullopt;
    return it->second;
}

bool MemoryStore::try_take_leased_lock(
        std::chrono::milliseconds lease_duration, std::string_view key, std::string_view holder) {
    std::lock_guard lock{mutex_};
    auto now = std::chrono::steady_clock::now();
    auto it = leases_.find(key);
    if (it != leases_.end() && it->second.holder != holder && it->second.expiry > now)
        return false;

    Lease lease{std::string{holder}, now + lease_duration};
    if (it != leases_.end())
        it->second = std::move(lease);
    else
        leases_.emplace(std::string{key}, std::move(lease));
    return true;
}

}  // namespace eematrix::store
