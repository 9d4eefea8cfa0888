#pragma once

#include <optional>
#include <utility>

#include "changes.hpp"
#include "crypto_store_wrapper.hpp"
#include "identities.hpp"

namespace eematrix::store {

/// API: updates/collect_device_updates
///
/// Attaches identities to a raw device delta.  Each device gets the identity of its owner, looked
/// up by user id among the new, then changed, then unchanged identities of the same batch, and
/// our own identity.  Deleted devices are not reported.
///
/// Inputs:
/// - `own_identity` -- our own identity, if known.
/// - `identities` -- the identity delta written together with the devices.
/// - `devices` -- the device delta.
///
/// Outputs:
/// - New and changed devices grouped by user id and device id.
DeviceUpdates collect_device_updates(
        const std::optional<OwnUserIdentityData>& own_identity,
        const IdentityChanges& identities,
        const DeviceChanges& devices);

/// Attaches our own identity to each identity of a raw identity delta, keyed by user id.
IdentityUpdates collect_identity_updates(
        const std::optional<OwnUserIdentityData>& own_identity, const IdentityChanges& identities);

/// Both of the above for one batch from the raw identities stream.
std::pair<IdentityUpdates, DeviceUpdates> collect_updates(const IdentityUpdateBatch& batch);

}  // namespace eematrix::store
