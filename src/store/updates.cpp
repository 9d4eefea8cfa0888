#include "eematrix/store/updates.hpp"

namespace eematrix::store {

DeviceUpdates collect_device_updates(
        const std::optional<OwnUserIdentityData>& own_identity,
        const IdentityChanges& identities,
        const DeviceChanges& devices) {
    auto maps = identities.into_maps();

    auto owner_identity = [&maps](const UserId& user_id) -> std::optional<UserIdentityData> {
        for (const auto* map : {&maps.new_, &maps.changed, &maps.unchanged})
            if (auto it = map->find(user_id); it != map->end())
                return it->second;
        return std::nullopt;
    };

    auto wrap = [&](const DeviceData& device) {
        return Device{device, own_identity, owner_identity(device.user_id)};
    };

    DeviceUpdates updates;
    for (const auto& device : devices.new_)
        updates.new_[device.user_id].insert_or_assign(device.device_id, wrap(device));
    for (const auto& device : devices.changed)
        updates.changed[device.user_id].insert_or_assign(device.device_id, wrap(device));
    return updates;
}

IdentityUpdates collect_identity_updates(
        const std::optional<OwnUserIdentityData>& own_identity, const IdentityChanges& identities) {
    auto maps = identities.into_maps();

    auto convert = [&own_identity](const std::map<UserId, UserIdentityData>& from) {
        std::map<UserId, UserIdentity> to;
        for (const auto& [user_id, identity] : from)
            to.insert_or_assign(user_id, UserIdentity{identity, own_identity});
        return to;
    };

    IdentityUpdates updates;
    updates.new_ = convert(maps.new_);
    updates.changed = convert(maps.changed);
    updates.unchanged = convert(maps.unchanged);
    return updates;
}

std::pair<IdentityUpdates, DeviceUpdates> collect_updates(const IdentityUpdateBatch& batch) {
    return {collect_identity_updates(batch.own_identity, batch.identities),
            collect_device_updates(batch.own_identity, batch.identities, batch.devices)};
}

}  // namespace eematrix::store
