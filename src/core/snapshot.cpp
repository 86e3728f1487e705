/**
 * @file snapshot.cpp
 * @brief Snapshot construction.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/snapshot.hpp"
#include "lanscope/utils/uuid.hpp"

#include <algorithm>

namespace lanscope {
namespace core {

const DeviceSnapshot* Snapshot::findDevice(const std::string& address) const {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&address](const DeviceSnapshot& d) { return d.address == address; });
    return it != devices.end() ? &*it : nullptr;
}

DeviceSnapshot toDeviceSnapshot(const InventoryDevice& device) {
    DeviceSnapshot entry;
    entry.address = device.address;
    entry.macAddress = device.macAddress;
    entry.hostname = device.hostname;
    entry.manufacturer = device.manufacturer;
    entry.deviceType = device.deviceType;
    entry.openPorts = device.openPorts;
    entry.online = device.online;
    entry.rogue = device.rogue;
    return entry;
}

Snapshot makeSnapshot(const std::vector<InventoryDevice>& devices,
                      std::chrono::milliseconds duration,
                      SystemClock::time_point createdAt) {
    std::vector<DeviceSnapshot> entries;
    entries.reserve(devices.size());
    for (const auto& device : devices) {
        entries.push_back(toDeviceSnapshot(device));
    }
    return makeSnapshot(std::move(entries), duration, createdAt);
}

Snapshot makeSnapshot(std::vector<DeviceSnapshot> devices,
                      std::chrono::milliseconds duration,
                      SystemClock::time_point createdAt) {
    std::stable_sort(devices.begin(), devices.end(),
                     [](const DeviceSnapshot& a, const DeviceSnapshot& b) {
                         return a.address < b.address;
                     });
    // Address is the diff key; keep the first entry per address
    devices.erase(std::unique(devices.begin(), devices.end(),
                              [](const DeviceSnapshot& a, const DeviceSnapshot& b) {
                                  return a.address == b.address;
                              }),
                  devices.end());

    Snapshot snapshot;
    snapshot.id = utils::generateUuid();
    snapshot.createdAt = createdAt;
    snapshot.duration = duration;
    snapshot.deviceCount = devices.size();
    for (const auto& device : devices) {
        if (device.online) {
            ++snapshot.onlineCount;
        }
        snapshot.openPortCount += device.openPorts.size();
    }
    snapshot.devices = std::move(devices);
    return snapshot;
}

}  // namespace core
}  // namespace lanscope
