#pragma once

#include <oxenc/hex.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "eematrix/ed25519.hpp"
#include "eematrix/random.hpp"
#include "eematrix/store/memory_store.hpp"
#include "eematrix/store/store.hpp"
#include "eematrix/util.hpp"

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

inline ustring operator""_bytes(const char* x, size_t n) {
    return {reinterpret_cast<const unsigned char*>(x), n};
}
inline ustring operator""_hexbytes(const char* x, size_t n) {
    ustring bytes;
    oxenc::from_hex(x, x + n, std::back_inserter(bytes));
    return bytes;
}

inline std::string to_hex(ustring_view bytes) {
    std::string hex;
    oxenc::to_hex(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}

inline std::string_view to_sv(ustring_view x) {
    return {reinterpret_cast<const char*>(x.data()), x.size()};
}
inline ustring_view to_usv(std::string_view x) {
    return {reinterpret_cast<const unsigned char*>(x.data()), x.size()};
}
template <size_t N>
ustring_view to_usv(const std::array<unsigned char, N>& data) {
    return {data.data(), N};
}

template <typename Container>
std::set<typename Container::value_type> as_set(const Container& c) {
    return {c.begin(), c.end()};
}

template <typename... T>
std::set<std::common_type_t<T...>> make_set(T&&... args) {
    return {std::forward<T>(args)...};
}

namespace eematrix::test {

using namespace std::literals;
using namespace eematrix::store;

inline const UserId ALICE = "@alice:example.org";
inline const DeviceId ALICE_DEVICE = "ALICEDEVICE";
inline const UserId BOB = "@bob:example.org";
inline const UserId CAROL = "@carol:example.org";

inline const RoomId ROOM = "!room:example.org";
inline const RoomId OTHER_ROOM = "!other:example.org";

inline const std::string SENDER_KEY = "c2VuZGVyIGN1cnZlMjU1MTkga2V5IGZvciB0ZXN0aW5n";
inline const std::string SENDER_ED25519 = "c2VuZGVyIGVkMjU1MTkga2V5IGZvciB0ZXN0aW5nIQ";

inline StaticAccountData alice_account_data() {
    StaticAccountData data;
    data.user_id = ALICE;
    data.device_id = ALICE_DEVICE;
    data.identity_keys = IdentityKeys{"YWxpY2UgZWQyNTUxOQ", "YWxpY2UgY3VydmUyNTUxOQ"};
    data.creation_local_time = std::chrono::system_clock::now();
    return data;
}

// MemoryStore that counts tracked user loads and saves, and can be made to fail its writes.
class CountingStore : public MemoryStore {
  public:
    std::atomic<int> load_tracked_users_calls{0};
    std::atomic<int> save_tracked_users_calls{0};
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_tracked_user_writes{false};
    // Makes the tracked user load slow enough for concurrent callers to pile up behind it.
    std::chrono::milliseconds load_delay{0};

    std::vector<TrackedUser> load_tracked_users() override {
        load_tracked_users_calls++;
        if (load_delay.count() > 0)
            std::this_thread::sleep_for(load_delay);
        return MemoryStore::load_tracked_users();
    }

    void save_tracked_users(const std::vector<std::pair<UserId, bool>>& users) override {
        save_tracked_users_calls++;
        if (fail_tracked_user_writes)
            throw std::runtime_error{"disk full"};
        MemoryStore::save_tracked_users(users);
    }

    void save_changes(const Changes& changes) override {
        if (fail_writes)
            throw std::runtime_error{"disk full"};
        MemoryStore::save_changes(changes);
    }

    void save_pending_changes(const PendingChanges& changes) override {
        if (fail_writes)
            throw std::runtime_error{"disk full"};
        MemoryStore::save_pending_changes(changes);
    }

    void save_inbound_group_sessions(
            const std::vector<InboundGroupSession>& sessions,
            std::optional<std::string_view> backed_up_to_version) override {
        if (fail_writes)
            throw std::runtime_error{"disk full"};
        MemoryStore::save_inbound_group_sessions(sessions, backed_up_to_version);
    }
};

// A backend that already holds Alice's account.
inline std::shared_ptr<CountingStore> seeded_backend() {
    auto backend = std::make_shared<CountingStore>();
    PendingChanges changes;
    changes.account.emplace(alice_account_data(), "initial pickle"_bytes);
    backend->save_pending_changes(changes);
    return backend;
}

inline std::unique_ptr<Store> make_store(
        std::shared_ptr<CryptoStore> backend, const StoreOptions& options = {}) {
    return std::make_unique<Store>(alice_account_data(), std::move(backend), options);
}

// Random Megolm ratchet state that can be exported at any message index.
struct TestSession {
    std::array<unsigned char, InboundGroupSession::RATCHET_SIZE> ratchet;
    std::array<unsigned char, 32> signing_key;

    InboundGroupSession session(
            const RoomId& room, uint32_t index = 0, bool shared_history = false) const {
        return InboundGroupSession{
                room,
                SENDER_KEY,
                SENDER_ED25519,
                index,
                ratchet,
                signing_key,
                SenderData::unknown(),
                shared_history};
    }

    ExportedRoomKey export_at(
            const RoomId& room, uint32_t index = 0, bool shared_history = false) const {
        return session(room, index, shared_history).export_key();
    }

    std::string session_id() const { return to_base64_unpadded(to_usv(signing_key)); }
};

inline TestSession random_session() {
    TestSession s;
    auto ratchet = random::random(s.ratchet.size());
    auto signing = random::random(s.signing_key.size());
    std::copy(ratchet.begin(), ratchet.end(), s.ratchet.begin());
    std::copy(signing.begin(), signing.end(), s.signing_key.begin());
    return s;
}

// Three cross-signing seeds and the public identity they belong to.
struct TestCrossSigning {
    CrossSigningKeyExport private_keys;
    OwnUserIdentityData public_identity;
};

inline TestCrossSigning random_cross_signing(const UserId& user = ALICE) {
    auto make = [](std::string& seed_b64, std::string& pubkey_b64) {
        auto seed = random::random(32);
        seed_b64 = to_base64_unpadded(seed);
        pubkey_b64 = to_base64_unpadded(to_usv(ed25519::pubkey_for_seed(seed)));
    };

    TestCrossSigning cs;
    cs.public_identity.user_id = user;
    std::string master, self_signing, user_signing;
    make(master, cs.public_identity.master_key);
    make(self_signing, cs.public_identity.self_signing_key);
    make(user_signing, cs.public_identity.user_signing_key);
    cs.private_keys.master_key = master;
    cs.private_keys.self_signing_key = self_signing;
    cs.private_keys.user_signing_key = user_signing;
    return cs;
}

inline DeviceData make_device(const UserId& user, const DeviceId& device) {
    DeviceData d;
    d.user_id = user;
    d.device_id = device;
    d.algorithms = {"m.olm.v1.curve25519-aes-sha2", std::string{MEGOLM_V1_AES_SHA2}};
    d.keys["curve25519:" + device] = "curve-" + device;
    d.keys["ed25519:" + device] = "ed-" + device;
    return d;
}

inline OtherUserIdentityData make_other_identity(const UserId& user) {
    OtherUserIdentityData id;
    id.user_id = user;
    id.master_key = "master-" + user;
    id.self_signing_key = "self-signing-" + user;
    return id;
}

}  // namespace eematrix::test
