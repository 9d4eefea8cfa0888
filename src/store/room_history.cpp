#include "eematrix/store/room_history.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace eematrix::store {

std::string_view to_string(WithheldCode code) {
    switch (code) {
        case WithheldCode::blacklisted: return "m.blacklisted";
        case WithheldCode::unverified: return "m.unverified";
        case WithheldCode::unauthorised: return "m.unauthorised";
        case WithheldCode::unavailable: return "m.unavailable";
        case WithheldCode::no_olm: return "m.no_olm";
    }
    return "";
}

std::optional<WithheldCode> withheld_code_from_string(std::string_view code) {
    for (auto c :
         {WithheldCode::blacklisted,
          WithheldCode::unverified,
          WithheldCode::unauthorised,
          WithheldCode::unavailable,
          WithheldCode::no_olm})
        if (to_string(c) == code)
            return c;
    return std::nullopt;
}

std::string RoomKeyWithheldContent::reason() const {
    switch (code) {
        case WithheldCode::blacklisted: return "The sender has blocked you.";
        case WithheldCode::unverified:
            return "The sender has disabled encrypting to unverified devices.";
        case WithheldCode::unauthorised: return "You are not authorised to read the message.";
        case WithheldCode::unavailable: return "The requested key was not found.";
        case WithheldCode::no_olm: return "Unable to establish a secure channel.";
    }
    return "";
}

HistoricRoomKey HistoricRoomKey::from_export(const ExportedRoomKey& key) {
    HistoricRoomKey h;
    h.algorithm = key.algorithm;
    h.room_id = key.room_id;
    h.sender_key = key.sender_key;
    h.session_id = key.session_id;
    h.session_key = key.session_key;
    h.sender_claimed_keys = key.sender_claimed_keys;
    return h;
}

void to_json(nlohmann::json& j, const ExportedRoomKey& key) {
    j = nlohmann::json{
            {"algorithm", key.algorithm},
            {"room_id", key.room_id},
            {"sender_key", key.sender_key},
            {"session_id", key.session_id},
            {"session_key", key.session_key},
            {"sender_claimed_keys", key.sender_claimed_keys},
            {"forwarding_curve25519_key_chain", key.forwarding_curve25519_key_chain},
            {"shared_history", key.shared_history}};
}

void from_json(const nlohmann::json& j, ExportedRoomKey& key) {
    j.at("algorithm").get_to(key.algorithm);
    j.at("room_id").get_to(key.room_id);
    j.at("sender_key").get_to(key.sender_key);
    j.at("session_id").get_to(key.session_id);
    j.at("session_key").get_to(key.session_key);
    key.sender_claimed_keys =
            j.value("sender_claimed_keys", std::map<std::string, std::string>{});
    key.forwarding_curve25519_key_chain =
            j.value("forwarding_curve25519_key_chain", std::vector<std::string>{});
    key.shared_history = j.value("shared_history", false);
}

void to_json(nlohmann::json& j, const HistoricRoomKey& key) {
    j = nlohmann::json{
            {"algorithm", key.algorithm},
            {"room_id", key.room_id},
            {"sender_key", key.sender_key},
            {"session_id", key.session_id},
            {"session_key", key.session_key},
            {"sender_claimed_keys", key.sender_claimed_keys}};
}

void from_json(const nlohmann::json& j, HistoricRoomKey& key) {
    j.at("algorithm").get_to(key.algorithm);
    j.at("room_id").get_to(key.room_id);
    j.at("sender_key").get_to(key.sender_key);
    j.at("session_id").get_to(key.session_id);
    j.at("session_key").get_to(key.session_key);
    key.sender_claimed_keys =
            j.value("sender_claimed_keys", std::map<std::string, std::string>{});
}

void to_json(nlohmann::json& j, const RoomKeyWithheldContent& content) {
    j = nlohmann::json{
            {"algorithm", content.algorithm},
            {"code", std::string{to_string(content.code)}},
            {"reason", content.reason()},
            {"room_id", content.room_id},
            {"session_id", content.session_id},
            {"sender_key", content.sender_key},
            {"from_device", content.from_device}};
}

void from_json(const nlohmann::json& j, RoomKeyWithheldContent& content) {
    j.at("algorithm").get_to(content.algorithm);
    auto code = j.at("code").get<std::string>();
    auto parsed = withheld_code_from_string(code);
    if (!parsed)
        throw std::invalid_argument{"Unknown withheld code " + code};
    content.code = *parsed;
    j.at("room_id").get_to(content.room_id);
    j.at("session_id").get_to(content.session_id);
    j.at("sender_key").get_to(content.sender_key);
    content.from_device = j.value("from_device", std::string{});
}

void to_json(nlohmann::json& j, const RoomKeyBundle& bundle) {
    j = nlohmann::json{{"room_keys", bundle.room_keys}, {"withheld", bundle.withheld}};
}

void from_json(const nlohmann::json& j, RoomKeyBundle& bundle) {
    bundle.room_keys = j.value("room_keys", std::vector<HistoricRoomKey>{});
    bundle.withheld = j.value("withheld", std::vector<RoomKeyWithheldContent>{});
}

}  // namespace eematrix::store
