#include "eematrix/store/caches.hpp"

#include "eematrix/store/error.hpp"

namespace eematrix::store {

void UsersForKeyQuery::insert_user(const UserId& user) {
    user_map_.insert_or_assign(user, next_sequence_number_);
    next_sequence_number_.increment();
}

bool UsersForKeyQuery::maybe_remove_user(const UserId& user, SequenceNumber query_sequence) {
    if (auto it = user_map_.find(user); it != user_map_.end()) {
        // Marked dirty again after the batch was drawn: the query result may already be stale.
        if (it->second > query_sequence)
            return false;
        user_map_.erase(it);
    }

    if (auto it = tasks_awaiting_key_query_.find(user); it != tasks_awaiting_key_query_.end()) {
        if (auto waiter = it->second.lock())
            waiter->completed.store(true);
        tasks_awaiting_key_query_.erase(it);
    }
    return true;
}

std::pair<std::set<UserId>, SequenceNumber> UsersForKeyQuery::fetch_users_to_query() {
    auto sequence_number = next_sequence_number_;
    next_sequence_number_.increment();

    std::set<UserId> users;
    for (const auto& [user, seq] : user_map_)
        users.insert(user);
    return {std::move(users), sequence_number};
}

std::shared_ptr<KeysQueryWaiter> UsersForKeyQuery::maybe_register_waiting_task(const UserId& user) {
    if (!contains(user))
        return nullptr;

    auto& slot = tasks_awaiting_key_query_[user];
    auto waiter = slot.lock();
    if (!waiter) {
        waiter = std::make_shared<KeysQueryWaiter>();
        slot = waiter;
    }
    return waiter;
}

void StoreCache::load_account_locked() {
    if (account_)
        return;
    account_ = store_->load_account();
    if (!account_)
        throw account_unset{};
}

AccountGuard StoreCache::account() {
    std::unique_lock lock{account_mutex_};
    load_account_locked();
    return AccountGuard{std::move(lock), *account_};
}

Account StoreCache::take_account() {
    std::lock_guard lock{account_mutex_};
    load_account_locked();
    Account account = std::move(*account_);
    account_.reset();
    return account;
}

void StoreCache::set_account(Account account) {
    std::lock_guard lock{account_mutex_};
    account_ = std::move(account);
}

std::set<UserId> StoreCache::tracked_users() const {
    std::shared_lock lock{tracked_users_mutex_};
    return tracked_users_;
}

}  // namespace eematrix::store
