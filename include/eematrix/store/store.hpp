#pragma once

#include <oxenc/bt_serialize.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../store.h"
#include "../types.hpp"
#include "broadcast.hpp"
#include "caches.hpp"
#include "changes.hpp"
#include "crypto_store.hpp"
#include "crypto_store_wrapper.hpp"
#include "error.hpp"
#include "identities.hpp"
#include "key_query.hpp"
#include "log.hpp"
#include "olm.hpp"
#include "room_history.hpp"
#include "secrets.hpp"

namespace eematrix::store {

class Store;

/// Called once per input item of a room key import with (processed so far, total).
using ProgressCallback = std::function<void(size_t processed, size_t total)>;

/// Selects room keys for export.
using SessionPredicate = std::function<bool(const InboundGroupSession&)>;

/// Exclusive write access to the store's cache.  Only one transaction exists at a time, and no
/// StoreCacheGuard can be held while it does.
///
/// Changes collected in a transaction are written to the backend on `commit()`; a transaction that
/// is destroyed without committing discards them.
class StoreTransaction {
  public:
    StoreTransaction(StoreTransaction&&) = default;
    StoreTransaction& operator=(StoreTransaction&&) = default;
    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    /// API: store/StoreTransaction::account
    ///
    /// Returns the account for modification.  The first call moves it out of the cache into this
    /// transaction; until commit nobody else can see it.  Throws `account_unset` if the backend
    /// has no account.
    Account& account();

    /// Other changes to write together with the account.
    Changes& changes() { return changes_.changes; }

    Store& store() const { return *store_; }

    /// API: store/StoreTransaction::commit
    ///
    /// Writes the pending changes to the backend and, only once that succeeded, puts a copy of the
    /// modified account back into the cache.  Does nothing if there are no changes.  The
    /// transaction is finished afterwards, whether or not the write succeeded.
    void commit();

  private:
    friend class Store;

    StoreTransaction(Store& store, std::unique_lock<std::shared_mutex> lock);

    void require_open() const;

    Store* store_;
    std::unique_lock<std::shared_mutex> lock_;
    PendingChanges changes_;
};

/// Lazily exports the room keys matched by a predicate, one at a time.  The predicate runs before
/// a key is exported, so filtered out sessions are never exported.
class ExportedRoomKeyStream {
  public:
    ExportedRoomKeyStream(std::vector<InboundGroupSession> sessions, SessionPredicate predicate) :
            sessions_{std::move(sessions)}, predicate_{std::move(predicate)} {}

    /// Returns the next matching key, or nullopt at the end.
    std::optional<ExportedRoomKey> next();

  private:
    std::vector<InboundGroupSession> sessions_;
    size_t pos_ = 0;
    SessionPredicate predicate_;
};

/// A lock named `key` that processes sharing a backend can take turns holding, built on the
/// backend's leased lock.
class CrossProcessStoreLock {
  public:
    CrossProcessStoreLock(
            std::shared_ptr<CryptoStoreWrapper> store, std::string key, std::string holder) :
            store_{std::move(store)}, key_{std::move(key)}, holder_{std::move(holder)} {}

    const std::string& key() const { return key_; }
    const std::string& holder() const { return holder_; }

    /// Makes a single attempt to take (or renew) the lease; returns true if we now hold it.
    bool try_lock_once(std::chrono::milliseconds lease_duration);

  private:
    std::shared_ptr<CryptoStoreWrapper> store_;
    std::string key_;
    std::string holder_;
};

/// The crypto store: a caching, concurrency-safe layer over a CryptoStore backend.
///
/// A Store is shared by many threads.  Reads go through `cache()`; modifications of the account go
/// through `transaction()`.  The key query bookkeeping, room key import/export, secret handling and
/// change notifications are all reached from here.
class Store {
  public:
    /// API: store/Store::Store
    ///
    /// Constructs a store on top of `store`.
    ///
    /// Inputs:
    /// - `account` -- the never-changing data of our account.
    /// - `store` -- the backend.
    /// - `options` -- capacities of the notification channels.
    Store(StaticAccountData account,
          std::shared_ptr<CryptoStore> store,
          const StoreOptions& options = {});

    Store(Store&&) = delete;
    Store(const Store&) = delete;
    Store& operator=(Store&&) = delete;
    Store& operator=(const Store&) = delete;

    // If set then we log things by calling this callback
    logger_callable logger;

    // Invokes the `logger` callback if set, does nothing if there is no logger.
    void log(LogLevel lvl, std::string msg) {
        if (logger)
            logger(lvl, std::move(msg));
    }

    const UserId& user_id() const { return static_account_.user_id; }
    const DeviceId& device_id() const { return static_account_.device_id; }
    const StaticAccountData& static_account() const { return static_account_; }

    CryptoStoreWrapper& crypto_store() const { return *store_; }

    /// Shared access to the cache; blocks while a transaction is open.
    StoreCacheGuard cache();

    /// Opens a transaction; blocks while another transaction or any cache guard is alive.
    StoreTransaction transaction();

    /// Opens a transaction, passes it to `f`, and commits it if `f` returns normally.  Returns what
    /// `f` returns.
    template <typename F>
    auto with_transaction(F&& f) -> decltype(f(std::declval<StoreTransaction&>())) {
        auto txn = transaction();
        if constexpr (std::is_void_v<decltype(f(txn))>) {
            f(txn);
            txn.commit();
        } else {
            auto result = f(txn);
            txn.commit();
            return result;
        }
    }

    /// Writes `changes` directly to the backend, outside of any transaction.
    void save_changes(const Changes& changes);

    // Olm sessions

    void save_sessions(std::vector<Session> sessions);
    std::optional<std::vector<Session>> get_sessions(std::string_view sender_key);

    // Room keys

    void save_inbound_group_sessions(std::vector<InboundGroupSession> sessions);

    /// Compares `session` with the stored version of it; Better if none is stored.
    SessionOrdering compare_group_session(const InboundGroupSession& session);

    std::optional<InboundGroupSession> get_inbound_group_session(
            std::string_view room_id, std::string_view session_id);
    std::vector<InboundGroupSession> get_inbound_group_sessions();
    RoomKeyCounts inbound_group_session_counts(std::optional<std::string_view> backup_version);
    std::vector<InboundGroupSession> inbound_group_sessions_for_backup(
            std::string_view backup_version, size_t limit);
    void mark_inbound_group_sessions_as_backed_up(
            std::string_view backup_version, const std::vector<RoomAndSessionId>& sessions);
    void reset_backup_state();

    // Devices and identities

    std::optional<DeviceData> get_device_data(std::string_view user_id, std::string_view device_id);
    std::map<DeviceId, DeviceData> get_device_data_for_user(std::string_view user_id);

    /// Like `get_device_data_for_user`, without our own device.
    std::map<DeviceId, DeviceData> get_device_data_for_user_filtered(std::string_view user_id);

    /// Finds the device of `user_id` whose Curve25519 key is `curve_key`.
    std::optional<Device> get_device_from_curve_key(
            std::string_view user_id, std::string_view curve_key);

    UserDevices get_user_devices(std::string_view user_id);
    std::optional<Device> get_device(std::string_view user_id, std::string_view device_id);

    /// Attaches the device owner's identity and our own identity to `device_data`.
    Device wrap_device_data(DeviceData device_data);

    std::optional<UserIdentity> get_identity(std::string_view user_id);

    // Key queries

    void update_tracked_users(const std::vector<UserId>& users);
    void mark_tracked_users_as_changed(const std::vector<UserId>& users);
    void mark_tracked_users_as_up_to_date(
            const std::vector<UserId>& users, SequenceNumber sequence_number);
    std::pair<std::set<UserId>, SequenceNumber> users_for_key_query();
    std::set<UserId> tracked_users();
    void mark_user_as_changed(const UserId& user);
    UserKeyQueryResult wait_if_user_key_query_pending(
            std::chrono::milliseconds timeout, const UserId& user);

    // Secrets

    /// API: store/Store::export_secret
    ///
    /// Exports a cross-signing private key or the backup decryption key as unpadded base64.
    ///
    /// Inputs:
    /// - `secret_name` -- one of the names in `secret_name`.
    ///
    /// Outputs:
    /// - The secret, or nullopt if we don't have it.  Unknown names are logged and return nullopt.
    std::optional<std::string> export_secret(std::string_view secret_name);

    /// Exports whichever cross-signing private keys we have; nullopt if we have none.
    std::optional<CrossSigningKeyExport> export_cross_signing_keys();

    /// API: store/Store::import_cross_signing_keys
    ///
    /// Imports private cross-signing keys after checking them against our public identity.  If
    /// all three keys match, our public identity is marked as verified.  Without a known public
    /// identity nothing is imported (a key query is needed first).
    ///
    /// Outputs:
    /// - Which private keys we have afterwards.  Throws a `secret_import_error` on bad or
    ///   mismatching keys.
    CrossSigningStatus import_cross_signing_keys(const CrossSigningKeyExport& export_);

    /// API: store/Store::export_secrets_bundle
    ///
    /// Exports the three private cross-signing keys and, if we have it, the backup key.
    ///
    /// Throws `missing_cross_signing_keys` if we have no key at all, `missing_cross_signing_key`
    /// naming the first missing key, or `missing_backup_version` if the backup key is stored
    /// without its version.
    SecretsBundle export_secrets_bundle();

    /// API: store/Store::import_secrets_bundle
    ///
    /// Imports a secrets bundle as a whole, without checking the keys against the server.  Only
    /// for bundles from an already trusted source, e.g. one of our devices during login.  Records
    /// the resulting identity as our own verified identity.
    void import_secrets_bundle(const SecretsBundle& bundle);

    /// Imports a gossipped secret.  Cross-signing keys are checked against our public identity;
    /// the backup key stays in the inbox for the caller to pick up.
    void import_secret(const GossippedSecret& secret);

    std::vector<GossippedSecret> get_secrets_from_inbox(std::string_view secret_name);
    void delete_secrets_from_inbox(std::string_view secret_name);
    BackupKeys load_backup_keys();

    /// Current state of our private cross-signing identity.
    PrivateCrossSigningIdentity private_identity();

    // Named values

    /// API: store/Store::get_value
    ///
    /// Loads and bt-decodes the value stored under `key`.  Throws `serialization_error` if the
    /// stored bytes don't decode as a `T`.
    template <typename T>
    std::optional<T> get_value(std::string_view key) {
        auto raw = store_->get_custom_value(key);
        if (!raw)
            return std::nullopt;
        try {
            return oxenc::bt_deserialize<T>(from_unsigned_sv(*raw));
        } catch (const std::exception& e) {
            throw serialization_error{
                    "Unable to decode value '" + std::string{key} + "': " + e.what()};
        }
    }

    /// Bt-encodes `value` and stores it under `key`.
    template <typename T>
    void set_value(std::string_view key, const T& value) {
        std::string encoded;
        try {
            encoded = oxenc::bt_serialize(value);
        } catch (const std::exception& e) {
            throw serialization_error{
                    "Unable to encode value '" + std::string{key} + "': " + e.what()};
        }
        store_->set_custom_value(key, ustring{to_unsigned_sv(encoded)});
    }

    void remove_value(std::string_view key);

    /// Whether room keys should only be shared with trusted devices; false unless set.
    bool get_only_allow_trusted_devices();
    void set_only_allow_trusted_devices(bool block_untrusted_devices);

    // Room key import and export

    /// API: store/Store::import_room_keys
    ///
    /// Imports room keys, e.g. from a key backup.  A key is only written if we don't have the
    /// session yet or the imported copy is Better than ours; keys that can't be converted are
    /// logged and skipped.  All accepted keys are written in one batch.
    ///
    /// Inputs:
    /// - `keys` -- the keys to import.
    /// - `from_backup_version` -- set if the keys came from that backup version; they're then
    ///   recorded as already backed up.
    /// - `progress` -- called after every input key with (keys processed, total keys).
    ///
    /// Outputs:
    /// - The number of keys written, the number of input keys, and which keys were written.
    RoomKeyImportResult import_room_keys(
            const std::vector<ExportedRoomKey>& keys,
            std::optional<std::string_view> from_backup_version,
            const ProgressCallback& progress = nullptr);

    /// Imports keys from a key export file; same as `import_room_keys` without a backup version.
    RoomKeyImportResult import_exported_room_keys(
            const std::vector<ExportedRoomKey>& keys, const ProgressCallback& progress = nullptr);

    /// Exports all stored room keys matching `predicate`.
    std::vector<ExportedRoomKey> export_room_keys(const SessionPredicate& predicate);

    /// Like `export_room_keys`, exporting each key only when it's pulled from the stream.
    ExportedRoomKeyStream export_room_keys_stream(SessionPredicate predicate);

    /// API: store/Store::build_room_key_bundle
    ///
    /// Assembles the history bundle for `room_id`: sessions flagged as shared history are
    /// exported, every other session of the room is declared withheld as `m.unauthorised`.
    RoomKeyBundle build_room_key_bundle(std::string_view room_id);

    /// API: store/Store::receive_room_key_bundle
    ///
    /// Imports the keys of a downloaded history bundle.  Only keys for `room_id` are imported; the
    /// rest are logged and ignored.  A bundle without any usable key is not an error.
    ///
    /// Inputs:
    /// - `room_id` -- the room the bundle was announced for.
    /// - `sender_user` -- the user that sent the bundle.
    /// - `sender_data` -- what we know about the sending device; recorded on the imported keys.
    /// - `bundle` -- the downloaded bundle.
    /// - `progress` -- as for `import_room_keys`.
    void receive_room_key_bundle(
            std::string_view room_id,
            std::string_view sender_user,
            const SenderData& sender_data,
            const RoomKeyBundle& bundle,
            const ProgressCallback& progress = nullptr);

    std::optional<StoredRoomKeyBundleData> get_received_room_key_bundle_data(
            std::string_view room_id, std::string_view user_id);

    // Locks

    CrossProcessStoreLock create_store_lock(std::string key, std::string holder);

    // Notifications

    Subscription<std::vector<RoomKeyInfo>> room_keys_received_stream();
    Subscription<std::vector<RoomKeyWithheldInfo>> room_keys_withheld_received_stream();
    MappedSubscription<IdentityUpdateBatch, IdentityUpdates> user_identities_stream();
    MappedSubscription<IdentityUpdateBatch, DeviceUpdates> devices_stream();
    Subscription<IdentityUpdateBatch> identities_stream_raw();
    Subscription<GossippedSecret> secrets_stream();
    Subscription<RoomKeyBundleInfo> historic_room_key_stream();

  private:
    friend class StoreTransaction;

    template <typename T>
    void add_child_logger(T& child) {
        child.logger = [this](LogLevel lvl, std::string msg) { log(lvl, std::move(msg)); };
    }

    template <typename Key>
    RoomKeyImportResult import_sessions_impl(
            const std::vector<const Key*>& room_keys,
            std::optional<std::string_view> from_backup_version,
            const std::optional<SenderData>& sender_data,
            const ProgressCallback& progress);

    std::optional<OwnUserIdentityData> own_identity();

    StaticAccountData static_account_;
    std::shared_ptr<CryptoStoreWrapper> store_;

    std::shared_mutex cache_mutex_;
    StoreCache cache_;

    KeyQueryManager key_query_manager_;

    // Our private cross-signing keys; loaded from the backend on first use.
    std::mutex identity_mutex_;
    std::optional<PrivateCrossSigningIdentity> identity_;
    PrivateCrossSigningIdentity& identity_locked();
};

inline Store& unbox(crypto_store_object* store) {
    assert(store && store->internals);
    return *static_cast<Store*>(store->internals);
}

inline bool set_error(crypto_store_object* store, std::string_view e) {
    if (e.size() > 255)
        e.remove_suffix(e.size() - 255);
    std::memcpy(store->_error_buf, e.data(), e.size());
    store->_error_buf[e.size()] = 0;
    store->last_error = store->_error_buf;
    return false;
}

inline bool set_error_value(char* error, std::string_view e) {
    if (!error)
        return false;

    std::string msg = {e.data(), e.size()};
    if (msg.size() > 255)
        msg.resize(255);
    std::memcpy(error, msg.c_str(), msg.size() + 1);
    return false;
}

}  // namespace eematrix::store
