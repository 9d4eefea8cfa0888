#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../types.hpp"
#include "../util.hpp"

namespace eematrix::store {

/// The only room key algorithm this store knows how to hold.
inline constexpr std::string_view MEGOLM_V1_AES_SHA2 = "m.megolm.v1.aes-sha2";

/// The public identity keys of a device, as unpadded base64.
struct IdentityKeys {
    std::string ed25519;
    std::string curve25519;

    bool operator==(const IdentityKeys& other) const {
        return ed25519 == other.ed25519 && curve25519 == other.curve25519;
    }
};

/// Account data that never changes for the lifetime of a store, so it can be handed out without
/// touching the cached Account.
struct StaticAccountData {
    UserId user_id;
    DeviceId device_id;
    IdentityKeys identity_keys;
    std::chrono::system_clock::time_point creation_local_time;
};

/// The durable cryptographic identity of this device.  The long-term and one-time key material is
/// opaque at this layer: it is produced and advanced by the encryption engine and only stored and
/// handed back here.
///
/// An Account is move-only; the explicit `deep_clone()` is the only way to duplicate one.  Cloning
/// copies all of the pickled key material, so it is not cheap and should only be done when a copy
/// must outlive a transaction (e.g. to refresh the cache after a commit).
class Account {
  public:
    Account(StaticAccountData static_data, ustring pickle);

    Account(Account&&) = default;
    Account& operator=(Account&&) = default;
    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    /// API: olm/Account::deep_clone
    ///
    /// Returns an independent copy of this account, including its pickled key material.
    Account deep_clone() const;

    const StaticAccountData& static_data() const { return static_data_; }
    const UserId& user_id() const { return static_data_.user_id; }
    const DeviceId& device_id() const { return static_data_.device_id; }
    const IdentityKeys& identity_keys() const { return static_data_.identity_keys; }

    // Opaque pickled ratchet/key state.
    const ustring& pickle() const { return pickle_; }
    void set_pickle(ustring pickle) { pickle_ = std::move(pickle); }

    // Whether the device keys have been uploaded to the server.
    bool shared() const { return shared_; }
    void mark_as_shared() { shared_ = true; }

    uint64_t uploaded_key_count() const { return uploaded_key_count_; }
    void update_uploaded_key_count(uint64_t count) { uploaded_key_count_ = count; }

    /// One-time keys that were generated but not yet published; key id -> unpadded base64 key.
    const std::map<std::string, std::string>& one_time_keys() const { return one_time_keys_; }
    void add_one_time_key(std::string key_id, std::string key);
    void mark_keys_as_published() { one_time_keys_.clear(); }

  private:
    StaticAccountData static_data_;
    ustring pickle_;
    bool shared_ = false;
    uint64_t uploaded_key_count_ = 0;
    std::map<std::string, std::string> one_time_keys_;
};

/// A 1:1 Olm session.  Like the account, the ratchet is opaque pickled state.
struct Session {
    std::string sender_key;
    std::string session_id;
    ustring pickle;
    std::chrono::system_clock::time_point creation_time;
    std::chrono::system_clock::time_point last_use_time;
};

/// What we knew about the sender of a room key at the time we received it.  Computing this is the
/// job of the trust layer; the store only carries it.
struct SenderData {
    enum class Kind {
        unknown,
        device_info,
        verification_violation,
        sender_unverified,
        sender_verified
    };

    Kind kind = Kind::unknown;
    std::optional<UserId> user_id;
    std::optional<DeviceId> device_id;
    bool legacy_session = false;

    static SenderData unknown() { return SenderData{}; }

    bool operator==(const SenderData& other) const {
        return kind == other.kind && user_id == other.user_id && device_id == other.device_id &&
               legacy_session == other.legacy_session;
    }
};

/// Result of comparing two versions of the same inbound group session.
enum class SessionOrdering {
    /// Both sessions have the same ratchet state.
    Equal,
    /// The session can decrypt more messages than the other one (it starts at an earlier index).
    Better,
    /// The session can decrypt fewer messages than the other one.
    Worse,
    /// The sessions share an index but not a ratchet; neither can stand in for the other.
    Unconnected,
};

struct ExportedRoomKey;
struct HistoricRoomKey;

/// An inbound Megolm session, aka a room key.  Identified by (room_id, session_id).
///
/// The ratchet itself is carried as the 128 byte ratchet value at `first_known_index` plus the
/// session's Ed25519 signing key; advancing the ratchet is left to the encryption engine.
class InboundGroupSession {
  public:
    static constexpr size_t RATCHET_SIZE = 128;
    static constexpr unsigned char EXPORT_FORMAT_VERSION = 0x01;
    // version byte + u32 index + ratchet + signing key
    static constexpr size_t EXPORTED_SESSION_KEY_SIZE = 1 + 4 + RATCHET_SIZE + 32;

    InboundGroupSession(
            RoomId room_id,
            std::string sender_key,
            std::string sender_claimed_ed25519,
            uint32_t first_known_index,
            const std::array<unsigned char, RATCHET_SIZE>& ratchet,
            const std::array<unsigned char, 32>& signing_key,
            SenderData sender_data,
            bool shared_history);

    /// API: olm/InboundGroupSession::from_export
    ///
    /// Converts an exported room key (from a key file, backup or forwarded key) into a session.
    ///
    /// Throws `invalid_room_key` if the export uses an unknown algorithm, has empty identifiers or
    /// the session key doesn't decode to a valid exported session key.
    static InboundGroupSession from_export(const ExportedRoomKey& key);

    /// API: olm/InboundGroupSession::from_historic
    ///
    /// Same as `from_export`, for a key received in a room key bundle.  Such sessions are always
    /// flagged as shared history.
    static InboundGroupSession from_historic(const HistoricRoomKey& key);

    const RoomId& room_id() const { return room_id_; }
    const std::string& session_id() const { return session_id_; }
    const std::string& sender_key() const { return sender_key_; }
    const std::string& sender_claimed_ed25519() const { return sender_claimed_ed25519_; }
    std::string_view algorithm() const { return MEGOLM_V1_AES_SHA2; }
    uint32_t first_known_index() const { return first_known_index_; }
    const SenderData& sender_data() const { return sender_data_; }
    void set_sender_data(SenderData data) { sender_data_ = std::move(data); }
    bool shared_history() const { return shared_history_; }
    bool imported() const { return imported_; }

    bool backed_up() const { return backed_up_; }
    void mark_as_backed_up() { backed_up_ = true; }
    void reset_backup_state() { backed_up_ = false; }

    /// API: olm/InboundGroupSession::compare
    ///
    /// Compares this session with another version of the *same* session.
    ///
    /// Inputs:
    /// - `other` -- another copy of this session, e.g. the one already in the store.
    ///
    /// Outputs:
    /// - Better if this session starts at an earlier message index than `other`, Worse if later,
    ///   Equal if it is the same ratchet, Unconnected if the index matches but the ratchet doesn't.
    ///   Throws std::invalid_argument if `other` has a different room or session id; sessions of
    ///   different identity have no order.
    SessionOrdering compare(const InboundGroupSession& other) const;

    /// API: olm/InboundGroupSession::export_session_key
    ///
    /// Returns the exported session key (unpadded base64) at the first known index.
    std::string export_session_key() const;

    /// API: olm/InboundGroupSession::export_key
    ///
    /// Exports the session in the room key export format.
    ExportedRoomKey export_key() const;

  private:
    RoomId room_id_;
    std::string session_id_;
    std::string sender_key_;
    std::string sender_claimed_ed25519_;
    uint32_t first_known_index_;
    sodium_cleared<std::array<unsigned char, RATCHET_SIZE>> ratchet_;
    std::array<unsigned char, 32> signing_key_;
    SenderData sender_data_;
    bool shared_history_;
    bool imported_ = false;
    bool backed_up_ = false;
};

/// A room key in the format used by key exports, key backups and forwarded room keys.
struct ExportedRoomKey {
    std::string algorithm{MEGOLM_V1_AES_SHA2};
    RoomId room_id;
    std::string sender_key;
    std::string session_id;
    // Unpadded base64 exported session key.
    std::string session_key;
    // key algorithm -> key, e.g. "ed25519" -> the sender's claimed Ed25519 key
    std::map<std::string, std::string> sender_claimed_keys;
    std::vector<std::string> forwarding_curve25519_key_chain;
    bool shared_history = false;
};

/// Parses the exported session key format.  Throws std::invalid_argument on malformed input.
struct ParsedSessionKey {
    uint32_t first_known_index;
    sodium_cleared<std::array<unsigned char, InboundGroupSession::RATCHET_SIZE>> ratchet;
    std::array<unsigned char, 32> signing_key;
};
ParsedSessionKey parse_exported_session_key(std::string_view session_key_b64);

}  // namespace eematrix::store
