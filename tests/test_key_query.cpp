#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

#include "utils.hpp"

using namespace eematrix::test;

TEST_CASE("Sequence numbers", "[key_query][sequence]") {
    UsersForKeyQuery users;

    users.insert_user(BOB);
    CHECK(users.contains(BOB));

    auto [batch, seq] = users.fetch_users_to_query();
    CHECK(batch == make_set(BOB));

    // A clean removal completes and drops the user.
    CHECK(users.maybe_remove_user(BOB, seq));
    CHECK_FALSE(users.contains(BOB));

    // Removing a user that isn't dirty at all is not an error.
    CHECK(users.maybe_remove_user(CAROL, seq));

    // Each batch gets a fresh sequence number.
    auto [batch2, seq2] = users.fetch_users_to_query();
    CHECK(batch2.empty());
    CHECK(seq2 > seq);
}

TEST_CASE("Waiter registration", "[key_query][sequence]") {
    UsersForKeyQuery users;
    CHECK(users.maybe_register_waiting_task(BOB) == nullptr);

    users.insert_user(BOB);
    auto w1 = users.maybe_register_waiting_task(BOB);
    auto w2 = users.maybe_register_waiting_task(BOB);
    REQUIRE(w1);
    CHECK(w1 == w2);
    CHECK_FALSE(w1->completed.load());

    auto [batch, seq] = users.fetch_users_to_query();
    CHECK(users.maybe_remove_user(BOB, seq));
    CHECK(w1->completed.load());
}

TEST_CASE("Tracking users", "[store][key_query]") {
    auto backend = seeded_backend();
    auto store = make_store(backend);

    CHECK(store->tracked_users().empty());
    CHECK(store->users_for_key_query().first.empty());

    store->update_tracked_users({BOB, CAROL});
    CHECK(store->tracked_users() == make_set(BOB, CAROL));
    CHECK(store->users_for_key_query().first == make_set(BOB, CAROL));

    // Tracking an already tracked user neither re-marks nor re-persists it.
    auto [batch, seq] = store->users_for_key_query();
    store->mark_tracked_users_as_up_to_date({BOB, CAROL}, seq);
    int saves = backend->save_tracked_users_calls.load();
    store->update_tracked_users({BOB});
    CHECK(backend->save_tracked_users_calls.load() == saves);
    CHECK(store->users_for_key_query().first.empty());

    // The backend reflects the clean state.
    auto persisted = backend->load_tracked_users();
    REQUIRE(persisted.size() == 2);
    for (const auto& u : persisted)
        CHECK_FALSE(u.dirty);
}

TEST_CASE("Changed users must be tracked", "[store][key_query]") {
    auto backend = seeded_backend();
    auto store = make_store(backend);

    store->update_tracked_users({BOB});
    auto [batch, seq] = store->users_for_key_query();
    store->mark_tracked_users_as_up_to_date({BOB}, seq);
    int saves = backend->save_tracked_users_calls.load();

    store->mark_tracked_users_as_changed({CAROL});
    CHECK(store->tracked_users() == make_set(BOB));
    CHECK(store->users_for_key_query().first.empty());
    CHECK(backend->save_tracked_users_calls.load() == saves);

    store->mark_tracked_users_as_changed({BOB, CAROL});
    CHECK(store->users_for_key_query().first == make_set(BOB));

    // mark_user_as_changed starts tracking unconditionally.
    store->mark_user_as_changed(CAROL);
    CHECK(store->tracked_users() == make_set(BOB, CAROL));
    CHECK(store->users_for_key_query().first == make_set(BOB, CAROL));
}

TEST_CASE("Dirty marks racing a key query", "[store][key_query]") {
    auto store = make_store(seeded_backend());

    store->update_tracked_users({BOB});
    auto [batch, seq] = store->users_for_key_query();
    REQUIRE(batch == make_set(BOB));

    // Bob's devices change while the query for `batch` is in flight.
    store->mark_tracked_users_as_changed({BOB});

    store->mark_tracked_users_as_up_to_date({BOB}, seq);
    auto [batch2, seq2] = store->users_for_key_query();
    CHECK(batch2 == make_set(BOB));
    CHECK(seq2 > seq);

    store->mark_tracked_users_as_up_to_date({BOB}, seq2);
    CHECK(store->users_for_key_query().first.empty());
}

TEST_CASE("Tracked users load from the backend once", "[store][key_query]") {
    auto backend = seeded_backend();
    backend->save_tracked_users({{BOB, true}, {CAROL, false}});
    backend->load_delay = 100ms;

    auto store = make_store(backend);

    std::vector<std::thread> threads;
    std::vector<std::set<eematrix::UserId>> seen(8);
    for (size_t i = 0; i < seen.size(); i++)
        threads.emplace_back([&store, &seen, i] { seen[i] = store->tracked_users(); });
    for (auto& t : threads)
        t.join();

    CHECK(backend->load_tracked_users_calls.load() == 1);
    for (const auto& s : seen)
        CHECK(s == make_set(BOB, CAROL));

    // Users stored as dirty need a query after loading; clean ones don't.
    CHECK(store->users_for_key_query().first == make_set(BOB));
    CHECK(backend->load_tracked_users_calls.load() == 1);
}

TEST_CASE("Waiting for a pending key query", "[store][key_query][wait]") {
    auto store = make_store(seeded_backend());

    std::vector<std::pair<LogLevel, std::string>> logs;
    std::mutex logs_mutex;
    store->logger = [&](LogLevel lvl, std::string msg) {
        std::lock_guard lock{logs_mutex};
        logs.emplace_back(lvl, std::move(msg));
    };

    SECTION("No query pending") {
        CHECK(store->wait_if_user_key_query_pending(1s, BOB) ==
              UserKeyQueryResult::WasNotPending);
        store->update_tracked_users({BOB});
        auto [batch, seq] = store->users_for_key_query();
        store->mark_tracked_users_as_up_to_date({BOB}, seq);
        CHECK(store->wait_if_user_key_query_pending(1s, BOB) ==
              UserKeyQueryResult::WasNotPending);
    }

    SECTION("Query completes while waiting") {
        store->update_tracked_users({BOB});
        auto [batch, seq] = store->users_for_key_query();

        UserKeyQueryResult result = UserKeyQueryResult::TimeoutExpired;
        std::thread waiter{
                [&] { result = store->wait_if_user_key_query_pending(5s, BOB); }};

        std::this_thread::sleep_for(200ms);
        store->mark_tracked_users_as_up_to_date({BOB}, seq);
        waiter.join();

        CHECK(result == UserKeyQueryResult::WasPending);
    }

    SECTION("Query for another user doesn't wake us") {
        store->update_tracked_users({BOB, CAROL});
        auto [batch, seq] = store->users_for_key_query();

        UserKeyQueryResult result = UserKeyQueryResult::WasPending;
        std::thread waiter{
                [&] { result = store->wait_if_user_key_query_pending(500ms, BOB); }};

        std::this_thread::sleep_for(100ms);
        store->mark_tracked_users_as_up_to_date({CAROL}, seq);
        waiter.join();

        CHECK(result == UserKeyQueryResult::TimeoutExpired);
    }

    SECTION("Timeout") {
        store->update_tracked_users({BOB});
        CHECK(store->wait_if_user_key_query_pending(50ms, BOB) ==
              UserKeyQueryResult::TimeoutExpired);

        std::lock_guard lock{logs_mutex};
        bool warned = false;
        for (const auto& [lvl, msg] : logs)
            if (lvl == LogLevel::warning && msg.find(BOB) != std::string::npos)
                warned = true;
        CHECK(warned);
    }
}

TEST_CASE("Waiting doesn't block other store users", "[store][key_query][wait]") {
    auto store = make_store(seeded_backend());
    store->update_tracked_users({BOB});

    std::atomic<bool> done{false};
    std::thread waiter{[&] {
        store->wait_if_user_key_query_pending(2s, BOB);
        done = true;
    }};

    std::this_thread::sleep_for(50ms);
    // A transaction needs the cache exclusively; it must not wait for the key query.
    auto txn = store->transaction();
    txn.account().update_uploaded_key_count(5);
    txn.commit();
    CHECK_FALSE(done.load());

    auto [batch, seq] = store->users_for_key_query();
    store->mark_tracked_users_as_up_to_date({BOB}, seq);
    waiter.join();
    CHECK(done.load());
}

TEST_CASE("Waiting without a practical timeout", "[store][key_query][wait]") {
    auto store = make_store(seeded_backend());
    store->update_tracked_users({BOB});
    auto [batch, seq] = store->users_for_key_query();

    UserKeyQueryResult result = UserKeyQueryResult::TimeoutExpired;
    std::thread waiter{[&] {
        result = store->wait_if_user_key_query_pending(std::chrono::milliseconds::max(), BOB);
    }};

    std::this_thread::sleep_for(100ms);
    store->mark_tracked_users_as_up_to_date({BOB}, seq);
    waiter.join();

    CHECK(result == UserKeyQueryResult::WasPending);
}

TEST_CASE("Waiters wake when persisting a key query result fails", "[store][key_query][wait]") {
    auto backend = seeded_backend();
    auto store = make_store(backend);
    store->update_tracked_users({BOB});
    auto [batch, seq] = store->users_for_key_query();

    UserKeyQueryResult result = UserKeyQueryResult::TimeoutExpired;
    auto started = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration waited{};
    std::thread waiter{[&] {
        result = store->wait_if_user_key_query_pending(10s, BOB);
        waited = std::chrono::steady_clock::now() - started;
    }};

    std::this_thread::sleep_for(100ms);
    backend->fail_tracked_user_writes = true;
    CHECK_THROWS_AS(store->mark_tracked_users_as_up_to_date({BOB}, seq), backend_error);
    waiter.join();

    CHECK(result == UserKeyQueryResult::WasPending);
    CHECK(waited < 5s);
}
