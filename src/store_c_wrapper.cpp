#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "eematrix/export.h"
#include "eematrix/store.h"
#include "eematrix/store/memory_store.hpp"
#include "eematrix/store/store.hpp"

using namespace eematrix;
using namespace eematrix::store;

namespace {

// Copies the strings into a single malloc'ed block laid out as
//
// {crypto_store_string_list}
// {pointer1}{pointer2}...
// {string data 1\0}{string data 2\0}...
//
// so that one `free()` releases everything.
template <typename Container>
crypto_store_string_list* make_string_list(const Container& vals) {
    size_t sz = sizeof(crypto_store_string_list) + vals.size() * sizeof(char*);
    for (auto& v : vals)
        sz += v.size() + 1;

    auto* ret = static_cast<crypto_store_string_list*>(std::malloc(sz));
    if (!ret)
        throw std::bad_alloc{};
    ret->len = vals.size();

    static_assert(alignof(crypto_store_string_list) >= alignof(char*));

    ret->value = reinterpret_cast<char**>(ret + 1);
    char** next_ptr = ret->value;
    char* next_str = reinterpret_cast<char*>(next_ptr + ret->len);

    for (const auto& v : vals) {
        *(next_ptr++) = next_str;
        std::memcpy(next_str, v.c_str(), v.size() + 1);
        next_str += v.size() + 1;
    }

    return ret;
}

char* make_c_string(std::string_view s) {
    auto* ret = static_cast<char*>(std::malloc(s.size() + 1));
    if (!ret)
        throw std::bad_alloc{};
    std::memcpy(ret, s.data(), s.size());
    ret[s.size()] = 0;
    return ret;
}

std::vector<UserId> to_user_ids(const char** user_ids, size_t count) {
    if (count && !user_ids)
        throw std::invalid_argument{"user_ids must not be NULL"};
    std::vector<UserId> users;
    users.reserve(count);
    for (size_t i = 0; i < count; i++) {
        if (!user_ids[i])
            throw std::invalid_argument{"user_ids must not contain NULL entries"};
        users.emplace_back(user_ids[i]);
    }
    return users;
}

}  // namespace

extern "C" {

EEMATRIX_C_API bool crypto_store_init(
        crypto_store_object** store, const char* user_id, const char* device_id, char* error) {
    try {
        if (!store || !user_id || !device_id)
            throw std::invalid_argument{"store, user_id and device_id are required"};

        StaticAccountData account;
        account.user_id = user_id;
        account.device_id = device_id;
        account.creation_local_time = std::chrono::system_clock::now();

        auto s = std::make_unique<Store>(std::move(account), std::make_shared<MemoryStore>());
        auto s_object = std::make_unique<crypto_store_object>();

        s_object->internals = s.release();
        s_object->last_error = nullptr;
        *store = s_object.release();
        return true;
    } catch (const std::exception& e) {
        return set_error_value(error, e.what());
    }
}

EEMATRIX_C_API void crypto_store_free(crypto_store_object* store) {
    if (!store)
        return;
    delete static_cast<Store*>(store->internals);
    delete store;
}

EEMATRIX_C_API void crypto_store_set_logger(
        crypto_store_object* store,
        void (*callback)(crypto_store_log_level, const char*, void*),
        void* ctx) {
    if (!callback)
        unbox(store).logger = nullptr;
    else {
        unbox(store).logger = [callback, ctx](LogLevel lvl, std::string msg) {
            callback(static_cast<crypto_store_log_level>(static_cast<int>(lvl)), msg.c_str(), ctx);
        };
    }
}

EEMATRIX_C_API bool crypto_store_update_tracked_users(
        crypto_store_object* store, const char** user_ids, size_t count) {
    try {
        unbox(store).update_tracked_users(to_user_ids(user_ids, count));
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_mark_tracked_users_as_changed(
        crypto_store_object* store, const char** user_ids, size_t count) {
    try {
        unbox(store).mark_tracked_users_as_changed(to_user_ids(user_ids, count));
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_users_for_key_query(
        crypto_store_object* store, crypto_store_string_list** users, uint64_t* sequence_number) {
    try {
        if (!users || !sequence_number)
            throw std::invalid_argument{"users and sequence_number are required"};
        auto [batch, seq] = unbox(store).users_for_key_query();
        *users = make_string_list(batch);
        *sequence_number = seq.value();
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_mark_tracked_users_as_up_to_date(
        crypto_store_object* store,
        const char** user_ids,
        size_t count,
        uint64_t sequence_number) {
    try {
        unbox(store).mark_tracked_users_as_up_to_date(
                to_user_ids(user_ids, count), SequenceNumber{sequence_number});
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_wait_if_user_key_query_pending(
        crypto_store_object* store,
        const char* user_id,
        uint32_t timeout_ms,
        CRYPTO_STORE_KEY_QUERY_RESULT* result) {
    try {
        if (!user_id || !result)
            throw std::invalid_argument{"user_id and result are required"};
        auto r = unbox(store).wait_if_user_key_query_pending(
                std::chrono::milliseconds{timeout_ms}, user_id);
        switch (r) {
            case UserKeyQueryResult::WasPending:
                *result = CRYPTO_STORE_KEY_QUERY_WAS_PENDING;
                break;
            case UserKeyQueryResult::WasNotPending:
                *result = CRYPTO_STORE_KEY_QUERY_WAS_NOT_PENDING;
                break;
            case UserKeyQueryResult::TimeoutExpired:
                *result = CRYPTO_STORE_KEY_QUERY_TIMEOUT_EXPIRED;
                break;
        }
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_export_secrets_bundle(crypto_store_object* store, char** json) {
    try {
        if (!json)
            throw std::invalid_argument{"json is required"};
        nlohmann::json bundle = unbox(store).export_secrets_bundle();
        *json = make_c_string(bundle.dump());
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_import_secrets_bundle(
        crypto_store_object* store, const char* json) {
    try {
        if (!json)
            throw std::invalid_argument{"json is required"};
        auto bundle = nlohmann::json::parse(json).get<SecretsBundle>();
        unbox(store).import_secrets_bundle(bundle);
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_export_room_keys(
        crypto_store_object* store, const char* room_id, char** json) {
    try {
        if (!json)
            throw std::invalid_argument{"json is required"};
        std::optional<std::string> room;
        if (room_id)
            room = room_id;
        auto keys = unbox(store).export_room_keys([&room](const InboundGroupSession& session) {
            return !room || session.room_id() == *room;
        });
        *json = make_c_string(nlohmann::json(keys).dump());
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

EEMATRIX_C_API bool crypto_store_import_room_keys(
        crypto_store_object* store,
        const char* json,
        const char* from_backup_version,
        size_t* imported,
        size_t* total) {
    try {
        if (!json)
            throw std::invalid_argument{"json is required"};
        auto keys = nlohmann::json::parse(json).get<std::vector<ExportedRoomKey>>();

        std::optional<std::string_view> version;
        if (from_backup_version)
            version = from_backup_version;

        auto result = unbox(store).import_room_keys(keys, version);
        if (imported)
            *imported = result.imported_count;
        if (total)
            *total = result.total_count;
        return true;
    } catch (const std::exception& e) {
        return set_error(store, e.what());
    }
}

}  // extern "C"
