#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <utility>

#include "../types.hpp"
#include "crypto_store_wrapper.hpp"
#include "olm.hpp"

namespace eematrix::store {

class KeyQueryManager;
class SyncedKeyQueryManager;

/// Counter stamped on users when they are marked dirty and handed out with each key query batch.
/// Only ever compared with other values of the same counter.
class SequenceNumber {
  public:
    constexpr SequenceNumber() = default;
    constexpr explicit SequenceNumber(uint64_t value) : value_{value} {}

    constexpr uint64_t value() const { return value_; }
    void increment() { value_++; }

    constexpr bool operator==(const SequenceNumber& o) const { return value_ == o.value_; }
    constexpr bool operator!=(const SequenceNumber& o) const { return value_ != o.value_; }
    constexpr bool operator<(const SequenceNumber& o) const { return value_ < o.value_; }
    constexpr bool operator>(const SequenceNumber& o) const { return value_ > o.value_; }

  private:
    uint64_t value_ = 0;
};

/// Completion flag shared by everybody waiting on the key query of one user.
struct KeysQueryWaiter {
    std::atomic<bool> completed{false};
};

/// The dirty users together with the sequence number of their most recent dirty-marking, and the
/// waiters registered for them.  Not synchronized; owned and locked by the KeyQueryManager.
class UsersForKeyQuery {
  public:
    /// Marks `user` as needing a key query, stamped with the next sequence number.
    void insert_user(const UserId& user);

    /// API: caches/UsersForKeyQuery::maybe_remove_user
    ///
    /// Clears the dirty mark of `user` after a key query, unless it was marked dirty again after
    /// the batch the query was built from.  Completes any waiter for the user when the mark is
    /// cleared.
    ///
    /// Inputs:
    /// - `user` -- the user whose query completed.
    /// - `query_sequence` -- the sequence number returned with the batch.
    ///
    /// Outputs:
    /// - true if the user is now clean, false if it stays dirty.
    bool maybe_remove_user(const UserId& user, SequenceNumber query_sequence);

    /// Returns all dirty users and a sequence number identifying this batch.
    std::pair<std::set<UserId>, SequenceNumber> fetch_users_to_query();

    /// Returns the waiter for `user`, creating it if needed, or nullptr if the user has no
    /// pending query.
    std::shared_ptr<KeysQueryWaiter> maybe_register_waiting_task(const UserId& user);

    bool contains(const UserId& user) const { return user_map_.count(user) > 0; }

  private:
    SequenceNumber next_sequence_number_;
    std::map<UserId, SequenceNumber> user_map_;
    std::map<UserId, std::weak_ptr<KeysQueryWaiter>> tasks_awaiting_key_query_;
};

/// Read access to the cached account; holds the account lock for as long as it lives.  Changes to
/// the account go through StoreTransaction::account().
class AccountGuard {
  public:
    AccountGuard(std::unique_lock<std::mutex> lock, const Account& account) :
            lock_{std::move(lock)}, account_{&account} {}

    const Account& operator*() const { return *account_; }
    const Account* operator->() const { return account_; }

  private:
    std::unique_lock<std::mutex> lock_;
    const Account* account_;
};

/// In-memory view of the store: the account, the tracked users, and whether the tracked users
/// have been loaded from the backend yet.
///
/// Access goes through a StoreCacheGuard (shared) or a StoreTransaction (exclusive) obtained from
/// the Store.
class StoreCache {
  public:
    explicit StoreCache(std::shared_ptr<CryptoStoreWrapper> store) : store_{std::move(store)} {}

    StoreCache(StoreCache&&) = delete;
    StoreCache(const StoreCache&) = delete;
    StoreCache& operator=(StoreCache&&) = delete;
    StoreCache& operator=(const StoreCache&) = delete;

    CryptoStoreWrapper& store() const { return *store_; }

    /// API: caches/StoreCache::account
    ///
    /// Returns the account, loading it from the backend on first use.  Throws `account_unset` if
    /// the backend has none.
    AccountGuard account();

    /// Moves the account out of the cache (loading it first if needed), leaving the slot empty.
    Account take_account();

    /// Puts a committed account back into the cache.
    void set_account(Account account);

    /// Snapshot of the tracked users; only meaningful once they've been loaded.
    std::set<UserId> tracked_users() const;

  private:
    friend class KeyQueryManager;
    friend class SyncedKeyQueryManager;

    // Loads the account into the empty slot; account_mutex_ must be held.
    void load_account_locked();

    std::shared_ptr<CryptoStoreWrapper> store_;

    std::mutex account_mutex_;
    std::optional<Account> account_;

    mutable std::shared_mutex tracked_users_mutex_;
    std::set<UserId> tracked_users_;

    // Guards the one-time load of the tracked users from the backend.
    std::shared_mutex loaded_tracked_users_mutex_;
    bool loaded_tracked_users_ = false;
};

/// Shared read access to the StoreCache.  Many guards can exist at once; a transaction waits until
/// all of them are gone.
class StoreCacheGuard {
  public:
    StoreCacheGuard(std::shared_lock<std::shared_mutex> lock, StoreCache& cache) :
            lock_{std::move(lock)}, cache_{&cache} {}

    StoreCacheGuard(StoreCacheGuard&&) = default;
    StoreCacheGuard& operator=(StoreCacheGuard&&) = default;

    StoreCache& operator*() const { return *cache_; }
    StoreCache* operator->() const { return cache_; }

    /// Gives up the shared lock early.  The guard must not be dereferenced afterwards.
    void release() {
        if (lock_.owns_lock())
            lock_.unlock();
    }

  private:
    std::shared_lock<std::shared_mutex> lock_;
    StoreCache* cache_;
};

}  // namespace eematrix::store
