#include "eematrix/store/key_query.hpp"

#include <algorithm>

namespace eematrix::store {

namespace {
    // Longer waits overflow the deadline computed from the steady clock.
    constexpr std::chrono::milliseconds MAX_WAIT = std::chrono::hours{24 * 365};
}  // namespace

SyncedKeyQueryManager KeyQueryManager::synced(StoreCache& cache) {
    ensure_sync_tracked_users(cache);
    return SyncedKeyQueryManager{*this, cache};
}

void KeyQueryManager::ensure_sync_tracked_users(StoreCache& cache) {
    {
        std::shared_lock loaded{cache.loaded_tracked_users_mutex_};
        if (cache.loaded_tracked_users_)
            return;
    }

    std::unique_lock loaded{cache.loaded_tracked_users_mutex_};
    // Somebody else may have finished loading while we waited for the exclusive lock.
    if (cache.loaded_tracked_users_)
        return;

    auto tracked_users = cache.store().load_tracked_users();

    std::lock_guard query_lock{mutex_};
    std::unique_lock tracked_lock{cache.tracked_users_mutex_};
    for (const auto& user : tracked_users) {
        cache.tracked_users_.insert(user.user_id);
        if (user.dirty)
            users_for_key_query_.insert_user(user.user_id);
    }

    cache.loaded_tracked_users_ = true;
    log(LogLevel::debug, "Loaded " + std::to_string(tracked_users.size()) + " tracked users");
}

UserKeyQueryResult KeyQueryManager::wait_if_user_key_query_pending(
        StoreCacheGuard cache, std::chrono::milliseconds timeout, const UserId& user) {
    ensure_sync_tracked_users(*cache);
    cache.release();

    std::unique_lock lock{mutex_};
    auto waiter = users_for_key_query_.maybe_register_waiting_task(user);
    if (!waiter)
        return UserKeyQueryResult::WasNotPending;

    // The predicate is checked with the mutex held before every sleep, so a completion signalled
    // between the registration above and the wait can't be missed.
    bool completed = users_for_key_query_cv_.wait_for(
            lock, std::min(timeout, MAX_WAIT), [&waiter] { return waiter->completed.load(); });
    if (completed)
        return UserKeyQueryResult::WasPending;

    lock.unlock();
    log(LogLevel::warning,
        "The user " + user +
                " has a pending `/keys/query` request which did not finish yet, some devices "
                "might be missing.");
    return UserKeyQueryResult::TimeoutExpired;
}

void SyncedKeyQueryManager::update_tracked_users(const std::vector<UserId>& users) {
    std::vector<std::pair<UserId, bool>> store_updates;

    std::lock_guard query_lock{manager_.mutex_};
    {
        std::unique_lock tracked_lock{cache_.tracked_users_mutex_};
        for (const auto& user : users) {
            if (cache_.tracked_users_.insert(user).second) {
                manager_.users_for_key_query_.insert_user(user);
                store_updates.emplace_back(user, true);
            }
        }
    }

    if (!store_updates.empty())
        cache_.store().save_tracked_users(store_updates);
}

void SyncedKeyQueryManager::mark_tracked_users_as_changed(const std::vector<UserId>& users) {
    std::vector<std::pair<UserId, bool>> store_updates;

    std::lock_guard query_lock{manager_.mutex_};
    {
        std::shared_lock tracked_lock{cache_.tracked_users_mutex_};
        for (const auto& user : users) {
            if (cache_.tracked_users_.count(user)) {
                manager_.users_for_key_query_.insert_user(user);
                store_updates.emplace_back(user, true);
            }
        }
    }

    if (!store_updates.empty())
        cache_.store().save_tracked_users(store_updates);
}

void SyncedKeyQueryManager::mark_tracked_users_as_up_to_date(
        const std::vector<UserId>& users, SequenceNumber sequence_number) {
    std::vector<std::pair<UserId, bool>> store_updates;

    std::lock_guard query_lock{manager_.mutex_};
    {
        std::shared_lock tracked_lock{cache_.tracked_users_mutex_};
        for (const auto& user : users) {
            if (cache_.tracked_users_.count(user)) {
                bool clean =
                        manager_.users_for_key_query_.maybe_remove_user(user, sequence_number);
                store_updates.emplace_back(user, !clean);
            }
        }
    }

    // Waiters were completed above; wake them now so a failed save below doesn't strand them.
    // They resume once we release the mutex.
    manager_.users_for_key_query_cv_.notify_all();

    if (!store_updates.empty())
        cache_.store().save_tracked_users(store_updates);
}

std::pair<std::set<UserId>, SequenceNumber> SyncedKeyQueryManager::users_for_key_query() {
    std::lock_guard query_lock{manager_.mutex_};
    return manager_.users_for_key_query_.fetch_users_to_query();
}

std::set<UserId> SyncedKeyQueryManager::tracked_users() {
    return cache_.tracked_users();
}

void SyncedKeyQueryManager::mark_user_as_changed(const UserId& user) {
    std::lock_guard query_lock{manager_.mutex_};
    manager_.users_for_key_query_.insert_user(user);
    {
        std::unique_lock tracked_lock{cache_.tracked_users_mutex_};
        cache_.tracked_users_.insert(user);
    }
    cache_.store().save_tracked_users({{user, true}});
}

}  // namespace eematrix::store
