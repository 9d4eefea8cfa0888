#include "eematrix/store/identities.hpp"

namespace eematrix::store {

namespace {
    std::optional<std::string> find_key(const DeviceData& device, std::string_view algorithm) {
        std::string key_id{algorithm};
        key_id += ':';
        key_id += device.device_id;
        if (auto it = device.keys.find(key_id); it != device.keys.end())
            return it->second;
        return std::nullopt;
    }
}  // namespace

std::optional<std::string> DeviceData::curve25519_key() const {
    return find_key(*this, "curve25519");
}

std::optional<std::string> DeviceData::ed25519_key() const {
    return find_key(*this, "ed25519");
}

const UserId& UserIdentityData::user_id() const {
    return std::visit([](const auto& d) -> const UserId& { return d.user_id; }, data_);
}

const std::string& UserIdentityData::master_key() const {
    return std::visit([](const auto& d) -> const std::string& { return d.master_key; }, data_);
}

const std::string& UserIdentityData::self_signing_key() const {
    return std::visit(
            [](const auto& d) -> const std::string& { return d.self_signing_key; }, data_);
}

std::optional<Device> UserDevices::get(const DeviceId& device_id) const {
    auto it = inner.find(device_id);
    if (it == inner.end())
        return std::nullopt;
    return Device{it->second, own_identity, device_owner_identity};
}

std::vector<Device> UserDevices::devices() const {
    std::vector<Device> result;
    result.reserve(inner.size());
    for (const auto& [id, data] : inner)
        result.push_back(Device{data, own_identity, device_owner_identity});
    return result;
}

}  // namespace eematrix::store
