#include "eematrix/store/olm.hpp"

#include <oxenc/endian.h>

#include <algorithm>
#include <stdexcept>

#include "eematrix/store/error.hpp"
#include "eematrix/store/room_history.hpp"

namespace eematrix::store {

Account::Account(StaticAccountData static_data, ustring pickle) :
        static_data_{std::move(static_data)}, pickle_{std::move(pickle)} {}

Account Account::deep_clone() const {
    Account copy{static_data_, pickle_};
    copy.shared_ = shared_;
    copy.uploaded_key_count_ = uploaded_key_count_;
    copy.one_time_keys_ = one_time_keys_;
    return copy;
}

void Account::add_one_time_key(std::string key_id, std::string key) {
    one_time_keys_.insert_or_assign(std::move(key_id), std::move(key));
}

ParsedSessionKey parse_exported_session_key(std::string_view session_key_b64) {
    auto raw = from_base64(session_key_b64);
    if (raw.size() != InboundGroupSession::EXPORTED_SESSION_KEY_SIZE)
        throw std::invalid_argument{
                "Invalid exported session key: expected " +
                std::to_string(InboundGroupSession::EXPORTED_SESSION_KEY_SIZE) +
                " bytes, got " + std::to_string(raw.size())};
    if (raw[0] != InboundGroupSession::EXPORT_FORMAT_VERSION)
        throw std::invalid_argument{
                "Invalid exported session key: unknown version " + std::to_string(raw[0])};

    ParsedSessionKey parsed;
    auto* pos = raw.data() + 1;
    parsed.first_known_index = oxenc::load_big_to_host<uint32_t>(pos);
    pos += 4;
    std::copy(pos, pos + InboundGroupSession::RATCHET_SIZE, parsed.ratchet.begin());
    pos += InboundGroupSession::RATCHET_SIZE;
    std::copy(pos, pos + parsed.signing_key.size(), parsed.signing_key.begin());
    sodium_zero_buffer(raw.data(), raw.size());
    return parsed;
}

InboundGroupSession::InboundGroupSession(
        RoomId room_id,
        std::string sender_key,
        std::string sender_claimed_ed25519,
        uint32_t first_known_index,
        const std::array<unsigned char, RATCHET_SIZE>& ratchet,
        const std::array<unsigned char, 32>& signing_key,
        SenderData sender_data,
        bool shared_history) :
        room_id_{std::move(room_id)},
        session_id_{to_base64_unpadded(to_unsigned_sv(signing_key))},
        sender_key_{std::move(sender_key)},
        sender_claimed_ed25519_{std::move(sender_claimed_ed25519)},
        first_known_index_{first_known_index},
        ratchet_{ratchet},
        signing_key_{signing_key},
        sender_data_{std::move(sender_data)},
        shared_history_{shared_history} {}

namespace {

    // Shared by the export and history bundle conversions, which only differ in where the fields
    // come from.
    InboundGroupSession session_from_parts(
            std::string_view algorithm,
            const RoomId& room_id,
            const std::string& sender_key,
            const std::string& session_id,
            std::string_view session_key,
            const std::map<std::string, std::string>& sender_claimed_keys,
            bool shared_history) {
        if (algorithm != MEGOLM_V1_AES_SHA2)
            throw invalid_room_key{"Unsupported room key algorithm " + std::string{algorithm}};
        if (room_id.empty())
            throw invalid_room_key{"Room key has an empty room id"};
        if (session_id.empty())
            throw invalid_room_key{"Room key has an empty session id"};
        if (sender_key.empty())
            throw invalid_room_key{"Room key has an empty sender key"};

        std::optional<ParsedSessionKey> parsed;
        try {
            parsed = parse_exported_session_key(session_key);
        } catch (const std::invalid_argument& e) {
            throw invalid_room_key{e.what()};
        }

        std::string claimed_ed25519;
        if (auto it = sender_claimed_keys.find("ed25519"); it != sender_claimed_keys.end())
            claimed_ed25519 = it->second;

        InboundGroupSession session{
                room_id,
                sender_key,
                std::move(claimed_ed25519),
                parsed->first_known_index,
                parsed->ratchet,
                parsed->signing_key,
                SenderData::unknown(),
                shared_history};

        if (session.session_id() != session_id)
            throw invalid_room_key{
                    "Room key session id " + session_id +
                    " doesn't match the exported session key"};
        return session;
    }

}  // namespace

InboundGroupSession InboundGroupSession::from_export(const ExportedRoomKey& key) {
    auto session = session_from_parts(
            key.algorithm,
            key.room_id,
            key.sender_key,
            key.session_id,
            key.session_key,
            key.sender_claimed_keys,
            key.shared_history);
    session.imported_ = true;
    return session;
}

InboundGroupSession InboundGroupSession::from_historic(const HistoricRoomKey& key) {
    auto session = session_from_parts(
            key.algorithm,
            key.room_id,
            key.sender_key,
            key.session_id,
            key.session_key,
            key.sender_claimed_keys,
            true);
    session.imported_ = true;
    return session;
}

SessionOrdering InboundGroupSession::compare(const InboundGroupSession& other) const {
    if (room_id_ != other.room_id_ || session_id_ != other.session_id_)
        throw std::invalid_argument{
                "Can't compare room keys of different sessions: " + room_id_ + "/" +
                session_id_ + " vs " + other.room_id_ + "/" + other.session_id_};

    if (first_known_index_ < other.first_known_index_)
        return SessionOrdering::Better;
    if (first_known_index_ > other.first_known_index_)
        return SessionOrdering::Worse;

    const std::array<unsigned char, RATCHET_SIZE>& ours = ratchet_;
    const std::array<unsigned char, RATCHET_SIZE>& theirs = other.ratchet_;
    return ours == theirs ? SessionOrdering::Equal : SessionOrdering::Unconnected;
}

std::string InboundGroupSession::export_session_key() const {
    ustring raw;
    raw.resize(EXPORTED_SESSION_KEY_SIZE);
    auto* pos = raw.data();
    *pos++ = EXPORT_FORMAT_VERSION;
    oxenc::write_host_as_big(first_known_index_, pos);
    pos += 4;
    pos = std::copy(ratchet_.begin(), ratchet_.end(), pos);
    std::copy(signing_key_.begin(), signing_key_.end(), pos);

    auto b64 = to_base64_unpadded(raw);
    sodium_zero_buffer(raw.data(), raw.size());
    return b64;
}

ExportedRoomKey InboundGroupSession::export_key() const {
    ExportedRoomKey key;
    key.room_id = room_id_;
    key.sender_key = sender_key_;
    key.session_id = session_id_;
    key.session_key = export_session_key();
    if (!sender_claimed_ed25519_.empty())
        key.sender_claimed_keys.emplace("ed25519", sender_claimed_ed25519_);
    key.shared_history = shared_history_;
    return key;
}

}  // namespace eematrix::store
