#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "export.h"

typedef struct crypto_store_object {
    // Internal opaque object pointer; calling code should leave this alone.
    void* internals;

    // When an error occurs in the C API this string will be set to the specific error message.  May
    // be empty.
    const char* last_error;

    // Sometimes used as the backing buffer for `last_error`.  Should not be touched externally.
    char _error_buf[256];
} crypto_store_object;

// A list of strings returned from the C API; the struct, pointers and string data live in a single
// allocation that is released with one `free()` of the returned pointer.
typedef struct crypto_store_string_list {
    char** value;
    size_t len;
} crypto_store_string_list;

typedef enum crypto_store_log_level {
    CRYPTO_STORE_LOG_LEVEL_DEBUG = 0,
    CRYPTO_STORE_LOG_LEVEL_INFO,
    CRYPTO_STORE_LOG_LEVEL_WARNING,
    CRYPTO_STORE_LOG_LEVEL_ERROR
} crypto_store_log_level;

typedef enum CRYPTO_STORE_KEY_QUERY_RESULT {
    CRYPTO_STORE_KEY_QUERY_WAS_PENDING = 0,
    CRYPTO_STORE_KEY_QUERY_WAS_NOT_PENDING = 1,
    CRYPTO_STORE_KEY_QUERY_TIMEOUT_EXPIRED = 2,
} CRYPTO_STORE_KEY_QUERY_RESULT;

/// API: crypto_store/crypto_store_init
///
/// Constructs a new crypto store for the given user and device, backed by an in-memory backend.
///
/// When done with the object the `crypto_store_object` must be destroyed by passing the pointer to
/// crypto_store_free().
///
/// Inputs:
/// - `store` -- [out] Pointer to the store object
/// - `user_id` -- [in] null-terminated Matrix user id of the account owner
/// - `device_id` -- [in] null-terminated device id of this device
/// - `error` -- [out] the pointer to a buffer in which we will write an error string if an error
/// occurs; error messages are discarded if this is given as NULL.  If non-NULL this must be a
/// buffer of at least 256 bytes.
///
/// Outputs:
/// - `bool` -- Returns true on success; returns false and write the exception message as a C-string
/// into `error` (if not NULL) on failure.
EEMATRIX_EXPORT bool crypto_store_init(
        crypto_store_object** store, const char* user_id, const char* device_id, char* error);

/// API: crypto_store/crypto_store_free
///
/// Frees a store object created with crypto_store_init.  Outstanding notification subscriptions
/// end.
EEMATRIX_EXPORT void crypto_store_free(crypto_store_object* store);

/// API: crypto_store/crypto_store_set_logger
///
/// Sets a logging function; takes the log function pointer and a context pointer (which can be NULL
/// if not needed).  The given function pointer will be invoked with one of the above values, a
/// null-terminated c string containing the log message, and the void* context object given when
/// setting the logger (this is for caller-specific state data and won't be touched).
///
/// The logging function must have signature:
///
/// void log(crypto_store_log_level lvl, const char* msg, void* ctx);
///
/// Can be called with callback set to NULL to clear an existing logger.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `callback` -- [in] Callback function
/// - `ctx` --- [in, optional] Pointer to an optional context.  Set to NULL if unused
EEMATRIX_EXPORT void crypto_store_set_logger(
        crypto_store_object* store,
        void (*callback)(crypto_store_log_level, const char*, void*),
        void* ctx);

/// API: crypto_store/crypto_store_update_tracked_users
///
/// Starts tracking the devices of the given users.  Users not tracked yet are marked as needing a
/// key query.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `user_ids` -- [in] array of null-terminated user ids
/// - `count` -- [in] number of entries in `user_ids`
///
/// Outputs:
/// - `bool` -- true on success; false (with `store->last_error` set) on failure.
EEMATRIX_EXPORT bool crypto_store_update_tracked_users(
        crypto_store_object* store, const char** user_ids, size_t count);

/// API: crypto_store/crypto_store_mark_tracked_users_as_changed
///
/// Marks the given users as needing a key query.  Users that aren't tracked are ignored.
EEMATRIX_EXPORT bool crypto_store_mark_tracked_users_as_changed(
        crypto_store_object* store, const char** user_ids, size_t count);

/// API: crypto_store/crypto_store_users_for_key_query
///
/// Retrieves the users whose devices need to be queried, and the sequence number that must be
/// passed back to crypto_store_mark_tracked_users_as_up_to_date once the query completed.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `users` -- [out] receives a newly allocated list of user ids; the caller must `free()` it.
/// - `sequence_number` -- [out] receives the sequence number of this batch.
///
/// Outputs:
/// - `bool` -- true on success; false (with `store->last_error` set) on failure.
EEMATRIX_EXPORT bool crypto_store_users_for_key_query(
        crypto_store_object* store, crypto_store_string_list** users, uint64_t* sequence_number);

/// API: crypto_store/crypto_store_mark_tracked_users_as_up_to_date
///
/// Records that the key query for the given users completed.  Users that were marked as changed
/// after `sequence_number` was handed out remain dirty.
EEMATRIX_EXPORT bool crypto_store_mark_tracked_users_as_up_to_date(
        crypto_store_object* store,
        const char** user_ids,
        size_t count,
        uint64_t sequence_number);

/// API: crypto_store/crypto_store_wait_if_user_key_query_pending
///
/// Blocks until a pending key query for `user_id` completes or `timeout_ms` elapses.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `user_id` -- [in] null-terminated user id
/// - `timeout_ms` -- [in] longest time to wait, in milliseconds
/// - `result` -- [out] what happened
///
/// Outputs:
/// - `bool` -- true on success; false (with `store->last_error` set) on failure.
EEMATRIX_EXPORT bool crypto_store_wait_if_user_key_query_pending(
        crypto_store_object* store,
        const char* user_id,
        uint32_t timeout_ms,
        CRYPTO_STORE_KEY_QUERY_RESULT* result);

/// API: crypto_store/crypto_store_export_secrets_bundle
///
/// Exports the cross-signing private keys and the backup key as a JSON secrets bundle.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `json` -- [out] receives a newly allocated, null-terminated JSON string; the caller must
///   `free()` it.
///
/// Outputs:
/// - `bool` -- true on success; false (with `store->last_error` set) if a key is missing.
EEMATRIX_EXPORT bool crypto_store_export_secrets_bundle(crypto_store_object* store, char** json);

/// API: crypto_store/crypto_store_import_secrets_bundle
///
/// Imports a JSON secrets bundle as produced by crypto_store_export_secrets_bundle.
EEMATRIX_EXPORT bool crypto_store_import_secrets_bundle(
        crypto_store_object* store, const char* json);

/// API: crypto_store/crypto_store_export_room_keys
///
/// Exports room keys as a JSON array in the key export format.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `room_id` -- [in, optional] only export keys of this room; NULL exports all keys.
/// - `json` -- [out] receives a newly allocated, null-terminated JSON string; the caller must
///   `free()` it.
EEMATRIX_EXPORT bool crypto_store_export_room_keys(
        crypto_store_object* store, const char* room_id, char** json);

/// API: crypto_store/crypto_store_import_room_keys
///
/// Imports a JSON array of room keys in the key export format.
///
/// Inputs:
/// - `store` -- [in] Pointer to store object
/// - `json` -- [in] null-terminated JSON array
/// - `from_backup_version` -- [in, optional] backup version the keys came from, or NULL.
/// - `imported` -- [out, optional] number of keys written
/// - `total` -- [out, optional] number of keys in the input
EEMATRIX_EXPORT bool crypto_store_import_room_keys(
        crypto_store_object* store,
        const char* json,
        const char* from_backup_version,
        size_t* imported,
        size_t* total);

#ifdef __cplusplus
}  // extern "C"
#endif
