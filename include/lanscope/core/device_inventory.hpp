/**
 * @file device_inventory.hpp
 * @brief Address-keyed inventory of devices seen on the network.
 *
 * The inventory is what snapshots capture: one entry per address with
 * its hardware address, open ports and operator trust flag. It is fed
 * by the discovery pipeline and read by the service layer.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_record.hpp"
#include "lanscope/core/export.hpp"
#include "lanscope/core/port_prober.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum DeviceSource
 * @brief Which discovery path first produced an inventory entry.
 */
enum class DeviceSource {
    Advertisement,   ///< mDNS browse
    Tool,            ///< Secondary command line tool only
    Manual
};

inline const char* deviceSourceToString(DeviceSource source) {
    switch (source) {
        case DeviceSource::Advertisement: return "advertisement";
        case DeviceSource::Tool:          return "tool";
        case DeviceSource::Manual:        return "manual";
    }
    return "unknown";
}

/**
 * @struct InventoryDevice
 */
struct LANSCOPE_CORE_API InventoryDevice {
    std::string address;
    std::string macAddress;             ///< Empty when unknown
    std::string hostname;               ///< Display name; empty when unknown
    std::string manufacturer;
    std::string deviceType = "unknown";
    std::set<uint16_t> openPorts;
    bool online = true;
    bool rogue = false;
    TxtRecord metadata;
    DeviceSource source = DeviceSource::Advertisement;
    SystemClock::time_point lastSeen;
};

/**
 * @brief Parse the kernel ARP table format of /proc/net/arp.
 *
 * Incomplete entries (flags 0x0 or an all-zero hardware address) are
 * skipped.
 * @return IPv4 address -> lowercase MAC address.
 */
LANSCOPE_CORE_API std::map<std::string, std::string> parseArpTable(const std::string& contents);

/**
 * @brief Read and parse an ARP table file. Empty if unreadable.
 */
LANSCOPE_CORE_API std::map<std::string, std::string> readArpTable(
    const std::string& path = "/proc/net/arp");

/**
 * @class DeviceInventory
 * @brief Thread-safe address -> InventoryDevice map.
 *
 * Readers share the lock; every accessor returns copies.
 */
class LANSCOPE_CORE_API DeviceInventory {
public:
    DeviceInventory() = default;
    ~DeviceInventory() = default;

    DeviceInventory(const DeviceInventory&) = delete;
    DeviceInventory& operator=(const DeviceInventory&) = delete;

    // =========================================================================
    // Population
    // =========================================================================

    /**
     * @brief Create baseline entries for addresses not yet known.
     *
     * Known addresses are marked online and their lastSeen refreshed.
     * @return Number of entries created.
     */
    size_t importAddresses(const std::vector<std::string>& addresses,
                           DeviceSource source = DeviceSource::Advertisement);

    /**
     * @brief Minimal entry for an address only the secondary tool found.
     *
     * Manufacturer "Apple", type "iot", online.
     * @return True if a new entry was created.
     */
    bool synthesize(const std::string& address);

    /**
     * @brief Replace the open-port sets of the listed addresses.
     */
    void updateOpenPorts(const PortMap& ports);

    /**
     * @brief Apply advertisement-derived details to an entry.
     *
     * Empty arguments leave the existing field untouched; TXT keys are
     * merged with incoming values winning.
     * @return False if the address is unknown.
     */
    bool mergeMetadata(const std::string& address,
                       const std::string& hostname,
                       const std::string& deviceType,
                       const TxtRecord& metadata);

    /**
     * @brief Fill in MAC addresses from an ARP table.
     * @return Number of entries updated.
     */
    size_t applyHardwareAddresses(const std::map<std::string, std::string>& arpTable);

    /**
     * @brief Set online to whether each address is in seen.
     */
    void refreshOnline(const std::set<std::string>& seen);

    // =========================================================================
    // Operator actions
    // =========================================================================

    /**
     * @brief Mark or clear an address as rogue.
     * @return False if the address is unknown.
     */
    bool setRogue(const std::string& address, bool rogue);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<InventoryDevice> find(const std::string& address) const;

    /**
     * @brief All entries, ordered by address.
     */
    std::vector<InventoryDevice> devices() const;

    std::vector<std::string> addresses() const;

    size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, InventoryDevice> devices_;
};

}  // namespace core
}  // namespace lanscope
