#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "utils.hpp"

using namespace eematrix::test;

namespace {

void publish_own_identity(Store& store, const OwnUserIdentityData& identity) {
    Changes changes;
    changes.identities.new_.push_back(identity);
    store.save_changes(changes);
}

bool own_identity_verified(Store& store) {
    auto identity = store.get_identity(ALICE);
    return identity && identity->inner.own() && identity->inner.own()->verified;
}

}  // namespace

TEST_CASE("Secret names", "[secrets]") {
    using namespace eematrix::store::secret_name;
    CHECK(cross_signing_usage(CROSS_SIGNING_MASTER_KEY) == KeyUsage::master);
    CHECK(cross_signing_usage(CROSS_SIGNING_SELF_SIGNING_KEY) == KeyUsage::self_signing);
    CHECK(cross_signing_usage(CROSS_SIGNING_USER_SIGNING_KEY) == KeyUsage::user_signing);
    CHECK_FALSE(cross_signing_usage(RECOVERY_KEY));
    CHECK_FALSE(cross_signing_usage("m.something_else"));
}

TEST_CASE("Backup decryption keys", "[secrets][backup]") {
    BackupDecryptionKey a, b;
    CHECK_FALSE(a == b);
    CHECK(eematrix::from_base64(a.to_base64()).size() == BackupDecryptionKey::KEY_SIZE);
    CHECK(a.to_base64().find('=') == std::string::npos);

    auto parsed = BackupDecryptionKey::from_base64(a.to_base64());
    CHECK(parsed == a);

    CHECK_THROWS_AS(BackupDecryptionKey::from_base64("c2hvcnQ"), invalid_secret_key);
    CHECK_THROWS_AS(BackupDecryptionKey::from_base64("not base64!"), invalid_secret_key);
}

TEST_CASE("Importing cross-signing keys", "[store][secrets]") {
    auto store = make_store(seeded_backend());
    auto cs = random_cross_signing();

    SECTION("Without a public identity nothing is imported") {
        auto status = store->import_cross_signing_keys(cs.private_keys);
        CHECK_FALSE(status.has_master);
        CHECK_FALSE(status.has_self_signing);
        CHECK_FALSE(status.has_user_signing);
        CHECK_FALSE(store->export_cross_signing_keys());
    }

    SECTION("Matching keys") {
        publish_own_identity(*store, cs.public_identity);
        CHECK_FALSE(own_identity_verified(*store));

        auto status = store->import_cross_signing_keys(cs.private_keys);
        CHECK(status.is_complete());
        CHECK(own_identity_verified(*store));

        auto exported = store->export_cross_signing_keys();
        REQUIRE(exported);
        CHECK(exported->master_key == cs.private_keys.master_key);
        CHECK(exported->self_signing_key == cs.private_keys.self_signing_key);
        CHECK(exported->user_signing_key == cs.private_keys.user_signing_key);

        CHECK(store->export_secret(secret_name::CROSS_SIGNING_MASTER_KEY) ==
              cs.private_keys.master_key);
    }

    SECTION("Partial import doesn't verify") {
        publish_own_identity(*store, cs.public_identity);
        auto partial = cs.private_keys;
        partial.self_signing_key.reset();

        auto status = store->import_cross_signing_keys(partial);
        CHECK(status.has_master);
        CHECK(status.has_user_signing);
        CHECK_FALSE(status.has_self_signing);
        CHECK_FALSE(own_identity_verified(*store));
    }

    SECTION("Mismatching keys are rejected as a whole") {
        publish_own_identity(*store, cs.public_identity);
        auto mixed = cs.private_keys;
        mixed.self_signing_key = random_cross_signing().private_keys.self_signing_key;

        CHECK_THROWS_AS(store->import_cross_signing_keys(mixed), mismatched_public_keys);
        CHECK_FALSE(store->private_identity().status().has_master);
        CHECK_FALSE(store->export_cross_signing_keys());
    }

    SECTION("Undecodable keys") {
        publish_own_identity(*store, cs.public_identity);
        auto broken = cs.private_keys;
        broken.master_key = "not base64!";
        CHECK_THROWS_AS(store->import_cross_signing_keys(broken), invalid_secret_key);
    }

    SECTION("Store failures") {
        publish_own_identity(*store, cs.public_identity);
        auto backend = std::dynamic_pointer_cast<CountingStore>(
                store->crypto_store().backend());
        REQUIRE(backend);
        backend->fail_writes = true;
        CHECK_THROWS_AS(
                store->import_cross_signing_keys(cs.private_keys), secret_import_store_error);
    }
}

TEST_CASE("Exporting a secrets bundle", "[store][secrets][bundle]") {
    auto store = make_store(seeded_backend());
    auto cs = random_cross_signing();
    publish_own_identity(*store, cs.public_identity);

    SECTION("No keys at all") {
        CHECK_THROWS_AS(store->export_secrets_bundle(), missing_cross_signing_keys);
    }

    SECTION("Missing self-signing key") {
        auto partial = cs.private_keys;
        partial.self_signing_key.reset();
        store->import_cross_signing_keys(partial);

        try {
            store->export_secrets_bundle();
            FAIL("export_secrets_bundle should have thrown");
        } catch (const missing_cross_signing_key& e) {
            CHECK(e.usage == KeyUsage::self_signing);
        }
    }

    SECTION("Complete keys, no backup") {
        store->import_cross_signing_keys(cs.private_keys);
        auto bundle = store->export_secrets_bundle();
        CHECK(bundle.cross_signing.master_key == *cs.private_keys.master_key);
        CHECK_FALSE(bundle.backup);

        nlohmann::json j = bundle;
        CHECK_FALSE(j.contains("backup"));
    }

    SECTION("Backup key without a version") {
        store->import_cross_signing_keys(cs.private_keys);
        Changes changes;
        changes.backup_decryption_key = BackupDecryptionKey{};
        store->save_changes(changes);

        CHECK_THROWS_AS(store->export_secrets_bundle(), missing_backup_version);
    }

    SECTION("Complete keys with backup") {
        store->import_cross_signing_keys(cs.private_keys);
        BackupDecryptionKey key;
        Changes changes;
        changes.backup_decryption_key = key;
        changes.backup_version = "2";
        store->save_changes(changes);

        auto bundle = store->export_secrets_bundle();
        REQUIRE(bundle.backup);
        CHECK(bundle.backup->key == key);
        CHECK(bundle.backup->backup_version == "2");
        CHECK(store->export_secret(secret_name::RECOVERY_KEY) == key.to_base64());
    }
}

TEST_CASE("Moving secrets to a new device", "[store][secrets][bundle]") {
    auto old_device = make_store(seeded_backend());
    auto cs = random_cross_signing();
    publish_own_identity(*old_device, cs.public_identity);
    old_device->import_cross_signing_keys(cs.private_keys);

    Changes backup;
    backup.backup_decryption_key = BackupDecryptionKey{};
    backup.backup_version = "7";
    old_device->save_changes(backup);

    std::string json = nlohmann::json(old_device->export_secrets_bundle()).dump();

    auto new_device = make_store(seeded_backend());
    new_device->import_secrets_bundle(nlohmann::json::parse(json).get<SecretsBundle>());

    CHECK(new_device->private_identity().status().is_complete());
    CHECK(own_identity_verified(*new_device));

    auto own = new_device->get_identity(ALICE);
    REQUIRE(own);
    CHECK(own->inner.master_key() == cs.public_identity.master_key);
    CHECK(own->inner.self_signing_key() == cs.public_identity.self_signing_key);

    auto keys = new_device->load_backup_keys();
    REQUIRE(keys.decryption_key);
    CHECK(keys.backup_version == "7");
    auto old_keys = old_device->load_backup_keys();
    REQUIRE(old_keys.decryption_key);
    CHECK(*keys.decryption_key == *old_keys.decryption_key);
}

TEST_CASE("Secrets bundle JSON", "[secrets][bundle][json]") {
    auto cs = random_cross_signing();
    nlohmann::json j = {
            {"cross_signing",
             {{"master_key", *cs.private_keys.master_key},
              {"self_signing_key", *cs.private_keys.self_signing_key},
              {"user_signing_key", *cs.private_keys.user_signing_key}}},
            {"backup",
             {{"algorithm", "m.megolm_backup.v1.curve25519-aes-sha2"},
              {"key", BackupDecryptionKey{}.to_base64()},
              {"backup_version", "1"}}}};

    auto bundle = j.get<SecretsBundle>();
    CHECK(bundle.cross_signing.user_signing_key == *cs.private_keys.user_signing_key);
    REQUIRE(bundle.backup);
    CHECK(bundle.backup->backup_version == "1");

    j["backup"]["algorithm"] = "m.megolm_backup.v2";
    CHECK_THROWS(j.get<SecretsBundle>());

    j["backup"]["algorithm"] = "m.megolm_backup.v1.curve25519-aes-sha2";
    j["backup"]["key"] = "dG9vIHNob3J0";
    CHECK_THROWS_AS(j.get<SecretsBundle>(), invalid_secret_key);
}

TEST_CASE("Gossipped secrets", "[store][secrets][inbox]") {
    auto store = make_store(seeded_backend());
    auto cs = random_cross_signing();
    publish_own_identity(*store, cs.public_identity);

    auto sub = store->secrets_stream();

    GossippedSecret self_signing{
            std::string{secret_name::CROSS_SIGNING_SELF_SIGNING_KEY},
            ALICE,
            "OTHERDEVICE",
            "req1",
            *cs.private_keys.self_signing_key};
    GossippedSecret recovery{
            std::string{secret_name::RECOVERY_KEY},
            ALICE,
            "OTHERDEVICE",
            "req2",
            BackupDecryptionKey{}.to_base64()};

    Changes changes;
    changes.secrets = {self_signing, recovery};
    store->save_changes(changes);

    auto first = sub.next(1s);
    auto second = sub.next(1s);
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first->request_id == "req1");
    CHECK(second->request_id == "req2");

    auto inbox = store->get_secrets_from_inbox(secret_name::RECOVERY_KEY);
    REQUIRE(inbox.size() == 1);
    CHECK(inbox[0].sender_device == "OTHERDEVICE");

    store->import_secret(self_signing);
    CHECK(store->private_identity().status().has_self_signing);

    // The backup key is left for the caller to check against the current backup.
    store->import_secret(recovery);
    CHECK_FALSE(store->load_backup_keys().decryption_key);
    CHECK(store->get_secrets_from_inbox(secret_name::RECOVERY_KEY).size() == 1);

    store->delete_secrets_from_inbox(secret_name::RECOVERY_KEY);
    CHECK(store->get_secrets_from_inbox(secret_name::RECOVERY_KEY).empty());
    CHECK(store->get_secrets_from_inbox(secret_name::CROSS_SIGNING_SELF_SIGNING_KEY).size() == 1);

    auto wrong = self_signing;
    wrong.secret = *random_cross_signing().private_keys.self_signing_key;
    wrong.secret_name = std::string{secret_name::CROSS_SIGNING_MASTER_KEY};
    CHECK_THROWS_AS(store->import_secret(wrong), mismatched_public_keys);

    CHECK_FALSE(store->export_secret("m.unknown"));
}
