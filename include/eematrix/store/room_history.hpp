#pragma once

#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../types.hpp"
#include "olm.hpp"

namespace eematrix::store {

/// Machine readable reason a room key was not shared.
enum class WithheldCode { blacklisted, unverified, unauthorised, unavailable, no_olm };

std::string_view to_string(WithheldCode code);
std::optional<WithheldCode> withheld_code_from_string(std::string_view code);

/// An `m.room_key.withheld` declaration: the key for `session_id` was deliberately not shared.
struct RoomKeyWithheldContent {
    std::string algorithm{MEGOLM_V1_AES_SHA2};
    WithheldCode code;
    RoomId room_id;
    std::string session_id;
    std::string sender_key;
    DeviceId from_device;

    std::string reason() const;
};

/// A room key as shared in a history bundle.  This is an ExportedRoomKey without the forwarding
/// chain; every key in a bundle is shared history by definition.
struct HistoricRoomKey {
    std::string algorithm{MEGOLM_V1_AES_SHA2};
    RoomId room_id;
    std::string sender_key;
    std::string session_id;
    std::string session_key;
    std::map<std::string, std::string> sender_claimed_keys;

    static HistoricRoomKey from_export(const ExportedRoomKey& key);
};

/// The keys we are willing to share with a newly invited member, plus declarations for the ones
/// we aren't.
struct RoomKeyBundle {
    std::vector<HistoricRoomKey> room_keys;
    std::vector<RoomKeyWithheldContent> withheld;

    bool empty() const { return room_keys.empty() && withheld.empty(); }
};

/// Where an uploaded room key bundle can be fetched from, as announced in a to-device message.
struct RoomKeyBundleContent {
    RoomId room_id;
    // Encrypted file descriptor of the uploaded bundle; opaque JSON at this layer.
    std::string file;
};

/// A received bundle announcement waiting to be downloaded and imported.
struct StoredRoomKeyBundleData {
    UserId sender_user;
    SenderData sender_data;
    RoomKeyBundleContent bundle_data;
};

/// Notification that a bundle announcement from `sender` arrived for `room_id`.
struct RoomKeyBundleInfo {
    UserId sender;
    RoomId room_id;
};

void to_json(nlohmann::json& j, const ExportedRoomKey& key);
void from_json(const nlohmann::json& j, ExportedRoomKey& key);
void to_json(nlohmann::json& j, const HistoricRoomKey& key);
void from_json(const nlohmann::json& j, HistoricRoomKey& key);
void to_json(nlohmann::json& j, const RoomKeyWithheldContent& content);
void from_json(const nlohmann::json& j, RoomKeyWithheldContent& content);
void to_json(nlohmann::json& j, const RoomKeyBundle& bundle);
void from_json(const nlohmann::json& j, RoomKeyBundle& bundle);

}  // namespace eematrix::store
