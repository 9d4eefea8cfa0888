#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "utils.hpp"

using namespace eematrix::test;

namespace {

SenderData verified_bob() {
    SenderData data;
    data.kind = SenderData::Kind::sender_verified;
    data.user_id = BOB;
    data.device_id = "BOBDEVICE";
    return data;
}

}  // namespace

TEST_CASE("Building a room key bundle", "[store][bundle]") {
    auto store = make_store(seeded_backend());

    auto shared1 = random_session();
    auto shared2 = random_session();
    auto secret = random_session();
    auto elsewhere = random_session();

    store->save_inbound_group_sessions(
            {shared1.session(ROOM, 0, true),
             shared2.session(ROOM, 3, true),
             secret.session(ROOM, 0, false),
             elsewhere.session(OTHER_ROOM, 0, true)});

    auto bundle = store->build_room_key_bundle(ROOM);
    REQUIRE(bundle.room_keys.size() == 2);
    REQUIRE(bundle.withheld.size() == 1);

    std::set<std::string> ids;
    for (const auto& key : bundle.room_keys) {
        CHECK(key.room_id == ROOM);
        ids.insert(key.session_id);
    }
    CHECK(ids == make_set(shared1.session_id(), shared2.session_id()));

    const auto& withheld = bundle.withheld.front();
    CHECK(withheld.code == WithheldCode::unauthorised);
    CHECK(withheld.session_id == secret.session_id());
    CHECK(withheld.room_id == ROOM);
    CHECK(withheld.from_device == ALICE_DEVICE);
    CHECK(withheld.algorithm == MEGOLM_V1_AES_SHA2);

    CHECK(store->build_room_key_bundle("!empty:example.org").empty());

    // Bundles travel as JSON.
    nlohmann::json j = bundle;
    auto parsed = j.get<RoomKeyBundle>();
    CHECK(parsed.room_keys.size() == 2);
    CHECK(parsed.withheld.size() == 1);
    CHECK(parsed.withheld.front().code == WithheldCode::unauthorised);
}

TEST_CASE("Receiving a room key bundle", "[store][bundle]") {
    auto sender = make_store(seeded_backend());
    auto shared1 = random_session();
    auto shared2 = random_session();
    sender->save_inbound_group_sessions(
            {shared1.session(ROOM, 0, true), shared2.session(ROOM, 0, true)});
    auto bundle = sender->build_room_key_bundle(ROOM);

    auto store = make_store(seeded_backend());
    std::vector<std::pair<LogLevel, std::string>> logs;
    store->logger = [&logs](LogLevel lvl, std::string msg) {
        logs.emplace_back(lvl, std::move(msg));
    };
    auto warnings = [&logs] {
        size_t n = 0;
        for (const auto& [lvl, msg] : logs)
            if (lvl == LogLevel::warning)
                n++;
        return n;
    };

    SECTION("All keys for the right room") {
        size_t last_progress = 0;
        store->receive_room_key_bundle(
                ROOM, BOB, verified_bob(), bundle, [&](size_t done, size_t total) {
                    CHECK(total == 2);
                    last_progress = done;
                });
        CHECK(last_progress == 2);

        auto imported = store->get_inbound_group_session(ROOM, shared1.session_id());
        REQUIRE(imported);
        CHECK(imported->shared_history());
        CHECK(imported->imported());
        CHECK(imported->sender_data() == verified_bob());
        CHECK(store->inbound_group_session_counts(std::nullopt).total == 2);
        CHECK(warnings() == 0);
    }

    SECTION("Bundle for the wrong room") {
        store->receive_room_key_bundle(OTHER_ROOM, BOB, verified_bob(), bundle);
        CHECK(store->inbound_group_session_counts(std::nullopt).total == 0);
        CHECK(warnings() == 1);
    }

    SECTION("Mixed bundle") {
        auto stray = random_session();
        bundle.room_keys.push_back(HistoricRoomKey::from_export(stray.export_at(OTHER_ROOM)));

        store->receive_room_key_bundle(ROOM, BOB, verified_bob(), bundle);
        CHECK(store->inbound_group_session_counts(std::nullopt).total == 2);
        CHECK_FALSE(store->get_inbound_group_session(OTHER_ROOM, stray.session_id()));
        CHECK(warnings() == 1);
    }

    SECTION("Empty bundle") {
        CHECK_NOTHROW(store->receive_room_key_bundle(ROOM, BOB, verified_bob(), RoomKeyBundle{}));
        CHECK(store->inbound_group_session_counts(std::nullopt).total == 0);
        CHECK(warnings() == 1);
    }

    SECTION("Receiving doesn't downgrade better keys") {
        store->save_inbound_group_sessions({shared1.session(ROOM, 0, false)});
        auto later = shared1.session(ROOM, 9, true).export_key();
        RoomKeyBundle worse;
        worse.room_keys.push_back(HistoricRoomKey::from_export(later));

        store->receive_room_key_bundle(ROOM, BOB, verified_bob(), worse);
        auto kept = store->get_inbound_group_session(ROOM, shared1.session_id());
        REQUIRE(kept);
        CHECK(kept->first_known_index() == 0);
        CHECK_FALSE(kept->shared_history());
    }
}

TEST_CASE("Bundle announcements", "[store][bundle][broadcast]") {
    auto store = make_store(seeded_backend());
    auto sub = store->historic_room_key_stream();

    StoredRoomKeyBundleData data;
    data.sender_user = BOB;
    data.sender_data = verified_bob();
    data.bundle_data.room_id = ROOM;
    data.bundle_data.file = R"({"url":"mxc://example.org/bundle"})";

    CHECK_FALSE(store->get_received_room_key_bundle_data(ROOM, BOB));

    Changes changes;
    changes.received_room_key_bundles.push_back(data);
    store->save_changes(changes);

    auto stored = store->get_received_room_key_bundle_data(ROOM, BOB);
    REQUIRE(stored);
    CHECK(stored->bundle_data.file == data.bundle_data.file);
    CHECK(stored->sender_data == verified_bob());
    CHECK_FALSE(store->get_received_room_key_bundle_data(ROOM, CAROL));

    auto info = sub.next(1s);
    REQUIRE(info);
    CHECK(info->sender == BOB);
    CHECK(info->room_id == ROOM);
}
