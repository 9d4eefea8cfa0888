#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "caches.hpp"
#include "changes.hpp"
#include "log.hpp"

namespace eematrix::store {

class SyncedKeyQueryManager;

/// Tracks which users need a `/keys/query` and lets callers wait for a pending query to finish.
///
/// Lock order: the tracked-users loaded flag, then this manager's mutex, then the cache's tracked
/// user set.  Never block on the notification while holding a cache lock.
class KeyQueryManager {
  public:
    KeyQueryManager() = default;

    KeyQueryManager(KeyQueryManager&&) = delete;
    KeyQueryManager(const KeyQueryManager&) = delete;
    KeyQueryManager& operator=(KeyQueryManager&&) = delete;
    KeyQueryManager& operator=(const KeyQueryManager&) = delete;

    // If set then we log things by calling this callback
    logger_callable logger;

    void log(LogLevel lvl, std::string msg) {
        if (logger)
            logger(lvl, std::move(msg));
    }

    /// Makes sure the tracked users are loaded, then returns an accessor bound to `cache`.
    SyncedKeyQueryManager synced(StoreCache& cache);

    /// API: key_query/KeyQueryManager::ensure_sync_tracked_users
    ///
    /// Loads the tracked users from the backend into the cache the first time it's called;
    /// concurrent callers wait for that one load instead of issuing their own.  Users stored as
    /// dirty are registered as needing a key query.
    void ensure_sync_tracked_users(StoreCache& cache);

    /// API: key_query/KeyQueryManager::wait_if_user_key_query_pending
    ///
    /// Waits until the pending key query for `user` has completed, or the timeout expires.
    ///
    /// Inputs:
    /// - `cache` -- used only to make sure the tracked users are loaded; released before waiting.
    /// - `timeout` -- the longest we'll wait.
    /// - `user` -- the user whose devices the caller wants to be up to date.
    ///
    /// Outputs:
    /// - WasNotPending if no query was pending, WasPending if it completed while waiting,
    ///   TimeoutExpired otherwise.
    UserKeyQueryResult wait_if_user_key_query_pending(
            StoreCacheGuard cache, std::chrono::milliseconds timeout, const UserId& user);

  private:
    friend class SyncedKeyQueryManager;

    std::mutex mutex_;
    // Notified every time a batch of users was marked up to date.
    std::condition_variable users_for_key_query_cv_;
    UsersForKeyQuery users_for_key_query_;
};

/// A KeyQueryManager together with a cache whose tracked users are known to be loaded.  Short
/// lived: obtain one with `KeyQueryManager::synced()` under a cache guard or transaction.
class SyncedKeyQueryManager {
  public:
    /// Starts tracking the given users; new ones are marked dirty and persisted, users that are
    /// already tracked are left alone.
    void update_tracked_users(const std::vector<UserId>& users);

    /// Marks already tracked users dirty, e.g. after a device list change notification.  Users
    /// that aren't tracked are ignored.
    void mark_tracked_users_as_changed(const std::vector<UserId>& users);

    /// API: key_query/SyncedKeyQueryManager::mark_tracked_users_as_up_to_date
    ///
    /// Records that a key query for `users` completed.  A user only becomes clean if it wasn't
    /// marked dirty again after `sequence_number` was handed out; either way the new state is
    /// persisted.  Wakes everybody waiting in `wait_if_user_key_query_pending`.
    ///
    /// Inputs:
    /// - `users` -- the users included in the answered query.
    /// - `sequence_number` -- the value returned by `users_for_key_query()` with that batch.
    void mark_tracked_users_as_up_to_date(
            const std::vector<UserId>& users, SequenceNumber sequence_number);

    /// Returns the users that need a key query and the sequence number of this batch.
    std::pair<std::set<UserId>, SequenceNumber> users_for_key_query();

    std::set<UserId> tracked_users();

    /// Tracks `user` and marks it dirty regardless of whether it was tracked before.
    void mark_user_as_changed(const UserId& user);

  private:
    friend class KeyQueryManager;

    SyncedKeyQueryManager(KeyQueryManager& manager, StoreCache& cache) :
            manager_{manager}, cache_{cache} {}

    KeyQueryManager& manager_;
    StoreCache& cache_;
};

}  // namespace eematrix::store
