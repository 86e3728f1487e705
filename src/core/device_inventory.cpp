/**
 * @file device_inventory.cpp
 * @brief DeviceInventory implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/device_inventory.hpp"
#include "lanscope/net/platform.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>

namespace lanscope {
namespace core {

// =============================================================================
// ARP table
// =============================================================================

std::map<std::string, std::string> parseArpTable(const std::string& contents) {
    // IP address  HW type  Flags  HW address  Mask  Device
    std::map<std::string, std::string> table;
    std::istringstream stream(contents);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string ip, hwType, flags, mac;
        if (!(fields >> ip >> hwType >> flags >> mac)) {
            continue;
        }
        if (!net::isIPv4Address(ip)) {
            continue;   // header
        }
        if (flags == "0x0" || mac == "00:00:00:00:00:00") {
            continue;
        }
        std::transform(mac.begin(), mac.end(), mac.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        table[ip] = mac;
    }
    return table;
}

std::map<std::string, std::string> readArpTable(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_DEBUG("Inventory", "ARP table {} not readable", path);
        return {};
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parseArpTable(contents.str());
}

// =============================================================================
// Population
// =============================================================================

size_t DeviceInventory::importAddresses(const std::vector<std::string>& addresses,
                                        DeviceSource source) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t created = 0;
    auto now = SystemClock::now();

    for (const auto& address : addresses) {
        auto it = devices_.find(address);
        if (it != devices_.end()) {
            it->second.online = true;
            it->second.lastSeen = now;
            continue;
        }
        InventoryDevice device;
        device.address = address;
        device.source = source;
        device.lastSeen = now;
        devices_.emplace(address, std::move(device));
        ++created;
    }

    if (created > 0) {
        LOG_INFO("Inventory", "Imported {} new devices ({} total)", created, devices_.size());
    }
    return created;
}

bool DeviceInventory::synthesize(const std::string& address) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it != devices_.end()) {
        it->second.online = true;
        it->second.lastSeen = SystemClock::now();
        return false;
    }

    InventoryDevice device;
    device.address = address;
    device.manufacturer = "Apple";
    device.deviceType = "iot";
    device.online = true;
    device.source = DeviceSource::Tool;
    device.lastSeen = SystemClock::now();
    devices_.emplace(address, std::move(device));

    LOG_DEBUG("Inventory", "Synthesized entry for {}", address);
    return true;
}

void DeviceInventory::updateOpenPorts(const PortMap& ports) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [address, open] : ports) {
        auto it = devices_.find(address);
        if (it != devices_.end()) {
            it->second.openPorts = open;
        }
    }
}

bool DeviceInventory::mergeMetadata(const std::string& address,
                                    const std::string& hostname,
                                    const std::string& deviceType,
                                    const TxtRecord& metadata) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return false;
    }

    InventoryDevice& device = it->second;
    if (!hostname.empty()) {
        device.hostname = hostname;
    }
    if (!deviceType.empty()) {
        device.deviceType = deviceType;
    }
    for (const auto& [key, value] : metadata) {
        device.metadata[key] = value;
    }
    return true;
}

size_t DeviceInventory::applyHardwareAddresses(const std::map<std::string, std::string>& arpTable) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t updated = 0;
    for (auto& [address, device] : devices_) {
        auto it = arpTable.find(address);
        if (it != arpTable.end() && device.macAddress != it->second) {
            device.macAddress = it->second;
            ++updated;
        }
    }
    return updated;
}

void DeviceInventory::refreshOnline(const std::set<std::string>& seen) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [address, device] : devices_) {
        bool online = seen.count(address) != 0;
        if (device.online && !online) {
            LOG_INFO("Inventory", "{} went offline", address);
        }
        device.online = online;
    }
}

// =============================================================================
// Operator actions
// =============================================================================

bool DeviceInventory::setRogue(const std::string& address, bool rogue) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return false;
    }
    if (it->second.rogue != rogue) {
        LOG_INFO("Inventory", "{} marked {}", address, rogue ? "rogue" : "trusted");
    }
    it->second.rogue = rogue;
    return true;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<InventoryDevice> DeviceInventory::find(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<InventoryDevice> DeviceInventory::devices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<InventoryDevice> result;
    result.reserve(devices_.size());
    for (const auto& [address, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

std::vector<std::string> DeviceInventory::addresses() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(devices_.size());
    for (const auto& [address, device] : devices_) {
        result.push_back(address);
    }
    return result;
}

size_t DeviceInventory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

void DeviceInventory::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    devices_.clear();
}

}  // namespace core
}  // namespace lanscope
