/**
 * @file snapshot.hpp
 * @brief Point-in-time device inventories.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_inventory.hpp"
#include "lanscope/core/device_record.hpp"
#include "lanscope/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @struct DeviceSnapshot
 * @brief One device as it was when the snapshot was taken.
 */
struct LANSCOPE_CORE_API DeviceSnapshot {
    std::string address;
    std::string macAddress;
    std::string hostname;          ///< Empty = none
    std::string manufacturer;
    std::string deviceType;
    std::set<uint16_t> openPorts;
    bool online = true;
    bool rogue = false;

    /// hostname, or the address when there is none
    const std::string& displayName() const { return hostname.empty() ? address : hostname; }
};

/**
 * @struct Snapshot
 * @brief Immutable inventory captured at the end of a scan.
 *
 * devices are ordered by address and unique per address.
 */
struct LANSCOPE_CORE_API Snapshot {
    std::string id;                               ///< UUID v4
    SystemClock::time_point createdAt;
    std::vector<DeviceSnapshot> devices;
    size_t deviceCount = 0;
    size_t onlineCount = 0;
    size_t openPortCount = 0;
    std::chrono::milliseconds duration{0};        ///< Scan time that produced it

    const DeviceSnapshot* findDevice(const std::string& address) const;
};

LANSCOPE_CORE_API DeviceSnapshot toDeviceSnapshot(const InventoryDevice& device);

/**
 * @brief Capture an inventory with a fresh id and computed counts.
 */
LANSCOPE_CORE_API Snapshot makeSnapshot(const std::vector<InventoryDevice>& devices,
                                        std::chrono::milliseconds duration,
                                        SystemClock::time_point createdAt = SystemClock::now());

/**
 * @brief Build a snapshot directly from device entries (tests, imports).
 */
LANSCOPE_CORE_API Snapshot makeSnapshot(std::vector<DeviceSnapshot> devices,
                                        std::chrono::milliseconds duration,
                                        SystemClock::time_point createdAt = SystemClock::now());

/**
 * @brief Milliseconds since the unix epoch.
 */
inline int64_t toEpochMillis(SystemClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline SystemClock::time_point fromEpochMillis(int64_t ms) {
    return SystemClock::time_point(
        std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace core
}  // namespace lanscope
