#include "eematrix/store/store.hpp"

#include <stdexcept>

#include "eematrix/store/updates.hpp"

namespace eematrix::store {

namespace {

    constexpr std::string_view ONLY_ALLOW_TRUSTED_DEVICES = "only_allow_trusted_devices";

    // Store failures during secret handling are reported as part of the secret error hierarchy.
    template <typename F>
    auto as_secret_import_error(F&& f) -> decltype(f()) {
        try {
            return f();
        } catch (const store_error& e) {
            throw secret_import_store_error{e.what()};
        }
    }

    InboundGroupSession to_session(const ExportedRoomKey& key) {
        return InboundGroupSession::from_export(key);
    }
    InboundGroupSession to_session(const HistoricRoomKey& key) {
        return InboundGroupSession::from_historic(key);
    }

}  // namespace

StoreTransaction::StoreTransaction(Store& store, std::unique_lock<std::shared_mutex> lock) :
        store_{&store}, lock_{std::move(lock)} {}

void StoreTransaction::require_open() const {
    if (!lock_.owns_lock())
        throw std::logic_error{"The transaction has already been committed"};
}

Account& StoreTransaction::account() {
    require_open();
    if (!changes_.account)
        changes_.account = store_->cache_.take_account();
    return *changes_.account;
}

void StoreTransaction::commit() {
    require_open();
    // Hold the cache exclusively until the end of this function, then never again.
    auto lock = std::move(lock_);

    if (changes_.empty())
        return;

    // The copy is made before writing so the cache gets exactly what was persisted.
    std::optional<Account> updated_account;
    if (changes_.account)
        updated_account = changes_.account->deep_clone();

    store_->store_->save_pending_changes(changes_);

    if (updated_account)
        store_->cache_.set_account(std::move(*updated_account));
}

std::optional<ExportedRoomKey> ExportedRoomKeyStream::next() {
    while (pos_ < sessions_.size()) {
        const auto& session = sessions_[pos_++];
        if (!predicate_ || predicate_(session))
            return session.export_key();
    }
    return std::nullopt;
}

bool CrossProcessStoreLock::try_lock_once(std::chrono::milliseconds lease_duration) {
    return store_->try_take_leased_lock(lease_duration, key_, holder_);
}

Store::Store(
        StaticAccountData account,
        std::shared_ptr<CryptoStore> store,
        const StoreOptions& options) :
        static_account_{std::move(account)},
        store_{std::make_shared<CryptoStoreWrapper>(
                static_account_.user_id, static_account_.device_id, std::move(store), options)},
        cache_{store_} {
    add_child_logger(*store_);
    add_child_logger(key_query_manager_);
}

StoreCacheGuard Store::cache() {
    return StoreCacheGuard{std::shared_lock{cache_mutex_}, cache_};
}

StoreTransaction Store::transaction() {
    return StoreTransaction{*this, std::unique_lock{cache_mutex_}};
}

void Store::save_changes(const Changes& changes) {
    store_->save_changes(changes);
}

void Store::save_sessions(std::vector<Session> sessions) {
    Changes changes;
    changes.sessions = std::move(sessions);
    save_changes(changes);
}

std::optional<std::vector<Session>> Store::get_sessions(std::string_view sender_key) {
    return store_->get_sessions(sender_key);
}

void Store::save_inbound_group_sessions(std::vector<InboundGroupSession> sessions) {
    Changes changes;
    changes.inbound_group_sessions = std::move(sessions);
    save_changes(changes);
}

SessionOrdering Store::compare_group_session(const InboundGroupSession& session) {
    auto old = store_->get_inbound_group_session(session.room_id(), session.session_id());
    if (!old)
        return SessionOrdering::Better;
    return session.compare(*old);
}

std::optional<InboundGroupSession> Store::get_inbound_group_session(
        std::string_view room_id, std::string_view session_id) {
    return store_->get_inbound_group_session(room_id, session_id);
}

std::vector<InboundGroupSession> Store::get_inbound_group_sessions() {
    return store_->get_inbound_group_sessions();
}

RoomKeyCounts Store::inbound_group_session_counts(std::optional<std::string_view> backup_version) {
    return store_->inbound_group_session_counts(backup_version);
}

std::vector<InboundGroupSession> Store::inbound_group_sessions_for_backup(
        std::string_view backup_version, size_t limit) {
    return store_->inbound_group_sessions_for_backup(backup_version, limit);
}

void Store::mark_inbound_group_sessions_as_backed_up(
        std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions) {
    store_->mark_inbound_group_sessions_as_backed_up(backup_version, sessions);
}

void Store::reset_backup_state() {
    store_->reset_backup_state();
}

std::optional<DeviceData> Store::get_device_data(
        std::string_view user_id, std::string_view device_id) {
    return store_->get_device(user_id, device_id);
}

std::map<DeviceId, DeviceData> Store::get_device_data_for_user(std::string_view user_id) {
    return store_->get_user_devices(user_id);
}

std::map<DeviceId, DeviceData> Store::get_device_data_for_user_filtered(std::string_view user_id) {
    auto devices = get_device_data_for_user(user_id);
    if (user_id == this->user_id())
        devices.erase(device_id());
    return devices;
}

std::optional<Device> Store::get_device_from_curve_key(
        std::string_view user_id, std::string_view curve_key) {
    for (auto& [id, device] : get_device_data_for_user(user_id))
        if (device.curve25519_key() == curve_key)
            return wrap_device_data(std::move(device));
    return std::nullopt;
}

std::optional<OwnUserIdentityData> Store::own_identity() {
    auto identity = store_->get_user_identity(user_id());
    if (!identity || !identity->own())
        return std::nullopt;
    return *identity->own();
}

UserDevices Store::get_user_devices(std::string_view user_id) {
    UserDevices devices;
    devices.inner = get_device_data_for_user(user_id);
    devices.own_identity = own_identity();
    devices.device_owner_identity = store_->get_user_identity(user_id);
    return devices;
}

std::optional<Device> Store::get_device(std::string_view user_id, std::string_view device_id) {
    auto data = get_device_data(user_id, device_id);
    if (!data)
        return std::nullopt;
    return wrap_device_data(std::move(*data));
}

Device Store::wrap_device_data(DeviceData device_data) {
    auto owner = store_->get_user_identity(device_data.user_id);
    return Device{std::move(device_data), own_identity(), std::move(owner)};
}

std::optional<UserIdentity> Store::get_identity(std::string_view user_id) {
    auto identity = store_->get_user_identity(user_id);
    if (!identity)
        return std::nullopt;
    return UserIdentity{std::move(*identity), own_identity()};
}

void Store::update_tracked_users(const std::vector<UserId>& users) {
    auto cache = this->cache();
    key_query_manager_.synced(*cache).update_tracked_users(users);
}

void Store::mark_tracked_users_as_changed(const std::vector<UserId>& users) {
    auto cache = this->cache();
    key_query_manager_.synced(*cache).mark_tracked_users_as_changed(users);
}

void Store::mark_tracked_users_as_up_to_date(
        const std::vector<UserId>& users, SequenceNumber sequence_number) {
    auto cache = this->cache();
    key_query_manager_.synced(*cache).mark_tracked_users_as_up_to_date(users, sequence_number);
}

std::pair<std::set<UserId>, SequenceNumber> Store::users_for_key_query() {
    auto cache = this->cache();
    return key_query_manager_.synced(*cache).users_for_key_query();
}

std::set<UserId> Store::tracked_users() {
    auto cache = this->cache();
    return key_query_manager_.synced(*cache).tracked_users();
}

void Store::mark_user_as_changed(const UserId& user) {
    auto cache = this->cache();
    key_query_manager_.synced(*cache).mark_user_as_changed(user);
}

UserKeyQueryResult Store::wait_if_user_key_query_pending(
        std::chrono::milliseconds timeout, const UserId& user) {
    return key_query_manager_.wait_if_user_key_query_pending(cache(), timeout, user);
}

PrivateCrossSigningIdentity& Store::identity_locked() {
    if (!identity_) {
        identity_ = store_->load_identity();
        if (!identity_)
            identity_.emplace(user_id());
    }
    return *identity_;
}

PrivateCrossSigningIdentity Store::private_identity() {
    std::lock_guard lock{identity_mutex_};
    return identity_locked();
}

std::optional<std::string> Store::export_secret(std::string_view secret_name) {
    if (secret_name::cross_signing_usage(secret_name)) {
        std::lock_guard lock{identity_mutex_};
        return identity_locked().export_secret(secret_name);
    }

    if (secret_name == secret_name::RECOVERY_KEY) {
        auto keys = load_backup_keys();
        if (keys.decryption_key)
            return keys.decryption_key->to_base64();
        return std::nullopt;
    }

    log(LogLevel::warning, "Unknown secret was requested: " + std::string{secret_name});
    return std::nullopt;
}

std::optional<CrossSigningKeyExport> Store::export_cross_signing_keys() {
    CrossSigningKeyExport keys;
    keys.master_key = export_secret(secret_name::CROSS_SIGNING_MASTER_KEY);
    keys.self_signing_key = export_secret(secret_name::CROSS_SIGNING_SELF_SIGNING_KEY);
    keys.user_signing_key = export_secret(secret_name::CROSS_SIGNING_USER_SIGNING_KEY);

    if (!keys.master_key && !keys.self_signing_key && !keys.user_signing_key)
        return std::nullopt;
    return keys;
}

CrossSigningStatus Store::import_cross_signing_keys(const CrossSigningKeyExport& export_) {
    auto public_identity = as_secret_import_error([&] { return own_identity(); });

    if (public_identity) {
        Changes changes;
        CrossSigningStatus status;
        {
            std::lock_guard lock{identity_mutex_};
            auto& identity = as_secret_import_error(
                    [&]() -> PrivateCrossSigningIdentity& { return identity_locked(); });

            identity.import_secrets(
                    *public_identity,
                    export_.master_key,
                    export_.self_signing_key,
                    export_.user_signing_key);

            status = identity.status();
            auto diff = identity.get_public_identity_diff(*public_identity);
            changes.private_identity = identity;

            if (diff.none_differ()) {
                public_identity->mark_as_verified();
                changes.identities.changed.push_back(*public_identity);
            }
        }

        log(LogLevel::info,
            "Successfully imported the private cross-signing keys (master: " +
                    std::to_string(status.has_master) +
                    ", self-signing: " + std::to_string(status.has_self_signing) +
                    ", user-signing: " + std::to_string(status.has_user_signing) + ")");

        as_secret_import_error([&] { save_changes(changes); });
    } else {
        log(LogLevel::warning,
            "No public identity found while importing cross-signing keys, a /keys/query needs "
            "to be done");
    }

    std::lock_guard lock{identity_mutex_};
    return as_secret_import_error([&] { return identity_locked().status(); });
}

SecretsBundle Store::export_secrets_bundle() {
    std::optional<CrossSigningKeyExport> cross_signing;
    BackupKeys backup_keys;
    try {
        cross_signing = export_cross_signing_keys();
        backup_keys = load_backup_keys();
    } catch (const store_error& e) {
        throw secrets_bundle_store_error{e.what()};
    }

    if (!cross_signing)
        throw missing_cross_signing_keys{};
    if (!cross_signing->master_key)
        throw missing_cross_signing_key{KeyUsage::master};
    if (!cross_signing->user_signing_key)
        throw missing_cross_signing_key{KeyUsage::user_signing};
    if (!cross_signing->self_signing_key)
        throw missing_cross_signing_key{KeyUsage::self_signing};

    SecretsBundle bundle;
    bundle.cross_signing.master_key = std::move(*cross_signing->master_key);
    bundle.cross_signing.user_signing_key = std::move(*cross_signing->user_signing_key);
    bundle.cross_signing.self_signing_key = std::move(*cross_signing->self_signing_key);

    if (backup_keys.decryption_key) {
        if (!backup_keys.backup_version)
            throw missing_backup_version{};
        bundle.backup = BackupSecrets{
                std::move(*backup_keys.decryption_key), std::move(*backup_keys.backup_version)};
    }

    return bundle;
}

void Store::import_secrets_bundle(const SecretsBundle& bundle) {
    Changes changes;

    if (bundle.backup) {
        changes.backup_decryption_key = bundle.backup->key;
        changes.backup_version = bundle.backup->backup_version;
    }

    {
        std::lock_guard lock{identity_mutex_};
        auto& identity = as_secret_import_error(
                [&]() -> PrivateCrossSigningIdentity& { return identity_locked(); });

        identity.import_secrets_unchecked(
                bundle.cross_signing.master_key,
                bundle.cross_signing.self_signing_key,
                bundle.cross_signing.user_signing_key);

        auto public_identity = identity.to_public_identity();
        if (!public_identity)
            throw secret_import_error{
                    "Unable to derive a public identity from the imported cross-signing keys"};
        public_identity->mark_as_verified();

        changes.private_identity = identity;
        changes.identities.new_.push_back(std::move(*public_identity));
    }

    as_secret_import_error([&] { save_changes(changes); });
}

void Store::import_secret(const GossippedSecret& secret) {
    if (secret_name::cross_signing_usage(secret.secret_name)) {
        auto public_identity = as_secret_import_error([&] { return own_identity(); });
        if (!public_identity) {
            log(LogLevel::warning,
                "No public identity found while importing " + secret.secret_name +
                        ", a /keys/query needs to be done");
            return;
        }

        Changes changes;
        {
            std::lock_guard lock{identity_mutex_};
            auto& identity = as_secret_import_error(
                    [&]() -> PrivateCrossSigningIdentity& { return identity_locked(); });
            identity.import_secret(*public_identity, secret.secret_name, secret.secret);
            changes.private_identity = identity;
        }
        log(LogLevel::info, "Successfully imported the secret " + secret.secret_name);
        as_secret_import_error([&] { save_changes(changes); });
    } else if (secret.secret_name == secret_name::RECOVERY_KEY) {
        // Stays in the secret inbox until the caller checks it against the current backup.
    } else {
        log(LogLevel::warning, "Tried to import an unknown secret " + secret.secret_name);
    }
}

std::vector<GossippedSecret> Store::get_secrets_from_inbox(std::string_view secret_name) {
    return store_->get_secrets_from_inbox(secret_name);
}

void Store::delete_secrets_from_inbox(std::string_view secret_name) {
    store_->delete_secrets_from_inbox(secret_name);
}

BackupKeys Store::load_backup_keys() {
    return store_->load_backup_keys();
}

void Store::remove_value(std::string_view key) {
    store_->remove_custom_value(key);
}

bool Store::get_only_allow_trusted_devices() {
    return get_value<int>(ONLY_ALLOW_TRUSTED_DEVICES).value_or(0) != 0;
}

void Store::set_only_allow_trusted_devices(bool block_untrusted_devices) {
    set_value<int>(ONLY_ALLOW_TRUSTED_DEVICES, block_untrusted_devices ? 1 : 0);
}

template <typename Key>
RoomKeyImportResult Store::import_sessions_impl(
        const std::vector<const Key*>& room_keys,
        std::optional<std::string_view> from_backup_version,
        const std::optional<SenderData>& sender_data,
        const ProgressCallback& progress) {
    std::vector<InboundGroupSession> sessions;
    // Position in `sessions` of every key accepted so far, so a key repeated within one import is
    // compared against its earlier copy rather than the store.
    std::map<RoomAndSessionId, size_t> accepted;

    RoomKeyImportResult result;
    result.total_count = room_keys.size();

    for (size_t i = 0; i < room_keys.size(); i++) {
        const Key& key = *room_keys[i];
        try {
            auto session = to_session(key);
            if (sender_data)
                session.set_sender_data(*sender_data);

            RoomAndSessionId id{session.room_id(), session.session_id()};
            bool better = true;
            auto earlier = accepted.find(id);
            if (earlier != accepted.end())
                better = session.compare(sessions[earlier->second]) == SessionOrdering::Better;
            else if (auto old = store_->get_inbound_group_session(id.first, id.second))
                better = session.compare(*old) == SessionOrdering::Better;

            if (better) {
                if (from_backup_version)
                    session.mark_as_backed_up();

                result.keys[session.room_id()][session.sender_key()].insert(session.session_id());

                if (earlier != accepted.end()) {
                    sessions[earlier->second] = std::move(session);
                } else {
                    accepted.emplace(std::move(id), sessions.size());
                    sessions.push_back(std::move(session));
                }
            }
        } catch (const invalid_room_key& e) {
            log(LogLevel::warning,
                "Couldn't import a room key for room " + key.room_id + " with session id " +
                        key.session_id + " from sender " + key.sender_key + ": " + e.what());
        }

        if (progress)
            progress(i + 1, room_keys.size());
    }

    result.imported_count = sessions.size();

    store_->save_inbound_group_sessions(sessions, from_backup_version);

    log(LogLevel::info,
        "Successfully imported room keys: " + std::to_string(result.imported_count) + " of " +
                std::to_string(result.total_count));

    return result;
}

RoomKeyImportResult Store::import_room_keys(
        const std::vector<ExportedRoomKey>& keys,
        std::optional<std::string_view> from_backup_version,
        const ProgressCallback& progress) {
    std::vector<const ExportedRoomKey*> room_keys;
    room_keys.reserve(keys.size());
    for (const auto& key : keys)
        room_keys.push_back(&key);
    return import_sessions_impl(room_keys, from_backup_version, std::nullopt, progress);
}

RoomKeyImportResult Store::import_exported_room_keys(
        const std::vector<ExportedRoomKey>& keys, const ProgressCallback& progress) {
    return import_room_keys(keys, std::nullopt, progress);
}

std::vector<ExportedRoomKey> Store::export_room_keys(const SessionPredicate& predicate) {
    std::vector<ExportedRoomKey> exported;
    for (const auto& session : store_->get_inbound_group_sessions())
        if (!predicate || predicate(session))
            exported.push_back(session.export_key());
    return exported;
}

ExportedRoomKeyStream Store::export_room_keys_stream(SessionPredicate predicate) {
    return ExportedRoomKeyStream{store_->get_inbound_group_sessions(), std::move(predicate)};
}

RoomKeyBundle Store::build_room_key_bundle(std::string_view room_id) {
    RoomKeyBundle bundle;
    for (const auto& session : store_->get_inbound_group_sessions()) {
        if (session.room_id() != room_id)
            continue;

        if (session.shared_history()) {
            bundle.room_keys.push_back(HistoricRoomKey::from_export(session.export_key()));
        } else {
            RoomKeyWithheldContent withheld;
            withheld.algorithm = std::string{session.algorithm()};
            withheld.code = WithheldCode::unauthorised;
            withheld.room_id = session.room_id();
            withheld.session_id = session.session_id();
            withheld.sender_key = session.sender_key();
            withheld.from_device = device_id();
            bundle.withheld.push_back(std::move(withheld));
        }
    }
    return bundle;
}

void Store::receive_room_key_bundle(
        std::string_view room_id,
        std::string_view sender_user,
        const SenderData& sender_data,
        const RoomKeyBundle& bundle,
        const ProgressCallback& progress) {
    std::vector<const HistoricRoomKey*> good, bad;
    for (const auto& key : bundle.room_keys)
        (key.room_id == room_id ? good : bad).push_back(&key);

    if (good.empty() && bad.empty()) {
        log(LogLevel::warning,
            "Received a completely empty room key bundle from " + std::string{sender_user});
        return;
    }

    if (good.empty()) {
        std::string bad_keys;
        for (const auto* key : bad) {
            if (!bad_keys.empty())
                bad_keys += ", ";
            bad_keys += key->room_id + "/" + key->session_id;
        }
        log(LogLevel::warning,
            "Received a room key bundle for the wrong room, ignoring all room keys from the "
            "bundle: " +
                    bad_keys);
        return;
    }

    if (!bad.empty())
        log(LogLevel::warning,
            "The room key bundle contained " + std::to_string(bad.size()) +
                    " room keys that were meant for a different room");

    import_sessions_impl(good, std::nullopt, sender_data, progress);
}

std::optional<StoredRoomKeyBundleData> Store::get_received_room_key_bundle_data(
        std::string_view room_id, std::string_view user_id) {
    return store_->get_received_room_key_bundle_data(room_id, user_id);
}

CrossProcessStoreLock Store::create_store_lock(std::string key, std::string holder) {
    return CrossProcessStoreLock{store_, std::move(key), std::move(holder)};
}

Subscription<std::vector<RoomKeyInfo>> Store::room_keys_received_stream() {
    return store_->room_keys_received_stream();
}

Subscription<std::vector<RoomKeyWithheldInfo>> Store::room_keys_withheld_received_stream() {
    return store_->room_keys_withheld_received_stream();
}

MappedSubscription<IdentityUpdateBatch, IdentityUpdates> Store::user_identities_stream() {
    return {store_->identities_stream(), [](IdentityUpdateBatch batch) {
                return collect_identity_updates(batch.own_identity, batch.identities);
            }};
}

MappedSubscription<IdentityUpdateBatch, DeviceUpdates> Store::devices_stream() {
    return {store_->identities_stream(), [](IdentityUpdateBatch batch) {
                return collect_device_updates(batch.own_identity, batch.identities, batch.devices);
            }};
}

Subscription<IdentityUpdateBatch> Store::identities_stream_raw() {
    return store_->identities_stream();
}

Subscription<GossippedSecret> Store::secrets_stream() {
    return store_->secrets_stream();
}

Subscription<RoomKeyBundleInfo> Store::historic_room_key_stream() {
    return store_->historic_room_key_stream();
}

}  // namespace eematrix::store
