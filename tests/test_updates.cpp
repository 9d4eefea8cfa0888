#include <catch2/catch_test_macros.hpp>

#include "eematrix/store/updates.hpp"
#include "utils.hpp"

using namespace eematrix::test;

TEST_CASE("Device updates carry identities", "[updates]") {
    auto cs = random_cross_signing();

    IdentityChanges identities;
    identities.new_.push_back(make_other_identity(BOB));
    identities.unchanged.push_back(make_other_identity(CAROL));

    DeviceChanges devices;
    devices.new_.push_back(make_device(BOB, "BOB1"));
    devices.new_.push_back(make_device(BOB, "BOB2"));
    devices.changed.push_back(make_device(CAROL, "CAROL1"));
    devices.changed.push_back(make_device("@dave:example.org", "DAVE1"));
    devices.deleted.push_back(make_device(BOB, "BOB0"));

    auto updates = collect_device_updates(cs.public_identity, identities, devices);

    REQUIRE(updates.new_.size() == 1);
    REQUIRE(updates.new_[BOB].size() == 2);
    const auto& bob1 = updates.new_[BOB].at("BOB1");
    REQUIRE(bob1.device_owner_identity);
    CHECK(bob1.device_owner_identity->master_key() == "master-" + BOB);
    REQUIRE(bob1.own_identity);
    CHECK(bob1.own_identity->master_key == cs.public_identity.master_key);

    REQUIRE(updates.changed.size() == 2);
    CHECK(updates.changed[CAROL].at("CAROL1").device_owner_identity);
    // No identity for Dave in this batch.
    CHECK_FALSE(updates.changed["@dave:example.org"].at("DAVE1").device_owner_identity);

    // Deleted devices aren't reported.
    CHECK(updates.new_[BOB].count("BOB0") == 0);
}

TEST_CASE("Identity updates", "[updates]") {
    IdentityChanges identities;
    identities.new_.push_back(make_other_identity(BOB));
    identities.changed.push_back(make_other_identity(CAROL));

    SECTION("Without our own identity") {
        auto updates = collect_identity_updates(std::nullopt, identities);
        REQUIRE(updates.new_.size() == 1);
        CHECK(updates.new_.at(BOB).user_id() == BOB);
        CHECK_FALSE(updates.new_.at(BOB).own_identity);
        REQUIRE(updates.changed.size() == 1);
        CHECK(updates.unchanged.empty());
    }

    SECTION("With our own identity") {
        auto cs = random_cross_signing();
        IdentityUpdateBatch batch{cs.public_identity, identities, {}};
        auto [ids, devs] = collect_updates(batch);
        REQUIRE(ids.changed.size() == 1);
        REQUIRE(ids.changed.at(CAROL).own_identity);
        CHECK(ids.changed.at(CAROL).own_identity->user_id == ALICE);
        CHECK(devs.new_.empty());
        CHECK(devs.changed.empty());
    }
}

TEST_CASE("Identity and device streams", "[store][updates][broadcast]") {
    auto store = make_store(seeded_backend());
    auto cs = random_cross_signing();

    auto identity_sub = store->user_identities_stream();
    auto device_sub = store->devices_stream();
    auto raw_sub = store->identities_stream_raw();

    Changes changes;
    changes.identities.new_.push_back(cs.public_identity);
    changes.identities.new_.push_back(make_other_identity(BOB));
    changes.devices.new_.push_back(make_device(BOB, "BOB1"));
    store->save_changes(changes);

    auto ids = identity_sub.next(1s);
    REQUIRE(ids);
    REQUIRE(ids->new_.size() == 2);
    // Our own identity is read back after the write, so it is attached to this very batch.
    REQUIRE(ids->new_.at(BOB).own_identity);
    CHECK(ids->new_.at(BOB).own_identity->master_key == cs.public_identity.master_key);

    auto devs = device_sub.next(1s);
    REQUIRE(devs);
    REQUIRE(devs->new_.count(BOB));
    const auto& bob1 = devs->new_.at(BOB).at("BOB1");
    CHECK(bob1.device_owner_identity);
    CHECK(bob1.own_identity);

    // The raw stream carries the persisted deltas as they were saved.
    auto raw = raw_sub.next(1s);
    REQUIRE(raw);
    CHECK(raw->identities.new_.size() == 2);
    CHECK(raw->devices.new_.size() == 1);
    CHECK(raw->own_identity);

    // Writes without identity or device changes don't produce updates.
    store->save_sessions({Session{"c2VuZGVy", "b25l", "one"_bytes, {}, {}}});
    CHECK_FALSE(identity_sub.next(50ms));
}

TEST_CASE("Device lookups", "[store][devices]") {
    auto store = make_store(seeded_backend());
    auto cs = random_cross_signing();

    Changes changes;
    changes.identities.new_.push_back(cs.public_identity);
    changes.identities.new_.push_back(make_other_identity(BOB));
    changes.devices.new_.push_back(make_device(BOB, "BOB1"));
    changes.devices.new_.push_back(make_device(BOB, "BOB2"));
    changes.devices.new_.push_back(make_device(ALICE, ALICE_DEVICE));
    changes.devices.new_.push_back(make_device(ALICE, "ALICEPHONE"));
    store->save_changes(changes);

    CHECK(store->get_device_data_for_user(ALICE).size() == 2);
    auto filtered = store->get_device_data_for_user_filtered(ALICE);
    REQUIRE(filtered.size() == 1);
    CHECK(filtered.count("ALICEPHONE"));
    CHECK(store->get_device_data_for_user_filtered(BOB).size() == 2);

    auto device = store->get_device(BOB, "BOB2");
    REQUIRE(device);
    CHECK(device->device_id() == "BOB2");
    REQUIRE(device->device_owner_identity);
    CHECK_FALSE(device->device_owner_identity->is_own());
    REQUIRE(device->own_identity);
    CHECK(device->own_identity->master_key == cs.public_identity.master_key);

    auto by_curve = store->get_device_from_curve_key(BOB, "curve-BOB1");
    REQUIRE(by_curve);
    CHECK(by_curve->device_id() == "BOB1");
    CHECK_FALSE(store->get_device_from_curve_key(BOB, "curve-nobody"));
    CHECK_FALSE(store->get_device(BOB, "BOB9"));

    auto user_devices = store->get_user_devices(BOB);
    CHECK(user_devices.devices().size() == 2);
    REQUIRE(user_devices.get("BOB1"));
    CHECK(user_devices.get("BOB1")->device_owner_identity);
    CHECK_FALSE(user_devices.get("BOB9"));

    auto bob = store->get_identity(BOB);
    REQUIRE(bob);
    CHECK(bob->user_id() == BOB);
    CHECK(bob->own_identity);
    CHECK_FALSE(store->get_identity(CAROL));

    Changes removal;
    removal.devices.deleted.push_back(make_device(BOB, "BOB1"));
    store->save_changes(removal);
    CHECK(store->get_device_data_for_user(BOB).size() == 1);
}
