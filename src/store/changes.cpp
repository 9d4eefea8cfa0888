#include "eematrix/store/changes.hpp"

namespace eematrix::store {

IdentityChanges::Maps IdentityChanges::into_maps() const {
    Maps maps;
    for (const auto& i : new_)
        maps.new_.insert_or_assign(i.user_id(), i);
    for (const auto& i : changed)
        maps.changed.insert_or_assign(i.user_id(), i);
    for (const auto& i : unchanged)
        maps.unchanged.insert_or_assign(i.user_id(), i);
    return maps;
}

bool Changes::empty() const {
    return !private_identity && !backup_version && !backup_decryption_key && sessions.empty() &&
           inbound_group_sessions.empty() && identities.empty() && identities.unchanged.empty() &&
           devices.empty() && withheld_session_info.empty() && secrets.empty() &&
           received_room_key_bundles.empty();
}

RoomKeyInfo RoomKeyInfo::from(const InboundGroupSession& session) {
    return RoomKeyInfo{
            std::string{session.algorithm()},
            session.room_id(),
            session.sender_key(),
            session.session_id()};
}

}  // namespace eematrix::store
