/**
 * @file snapshot_store.cpp
 * @brief SnapshotStore implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/snapshot_store.hpp"
#include "lanscope/utils/logger.hpp"

#include "lanscope/proto/snapshot.pb.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace lanscope {
namespace core {

namespace {

constexpr uint32_t kStoreVersion = 1;

void toProto(const Snapshot& snapshot, storage::Snapshot* out) {
    out->set_id(snapshot.id);
    out->set_created_at_ms(toEpochMillis(snapshot.createdAt));
    out->set_device_count(static_cast<uint32_t>(snapshot.deviceCount));
    out->set_online_count(static_cast<uint32_t>(snapshot.onlineCount));
    out->set_open_port_count(static_cast<uint32_t>(snapshot.openPortCount));
    out->set_duration_ms(snapshot.duration.count());

    for (const auto& device : snapshot.devices) {
        auto* entry = out->add_devices();
        entry->set_address(device.address);
        entry->set_mac_address(device.macAddress);
        entry->set_hostname(device.hostname);
        entry->set_manufacturer(device.manufacturer);
        entry->set_device_type(device.deviceType);
        for (uint16_t port : device.openPorts) {
            entry->add_open_ports(port);
        }
        entry->set_online(device.online);
        entry->set_rogue(device.rogue);
    }
}

Snapshot fromProto(const storage::Snapshot& in) {
    Snapshot snapshot;
    snapshot.id = in.id();
    snapshot.createdAt = fromEpochMillis(in.created_at_ms());
    snapshot.deviceCount = in.device_count();
    snapshot.onlineCount = in.online_count();
    snapshot.openPortCount = in.open_port_count();
    snapshot.duration = std::chrono::milliseconds(in.duration_ms());

    snapshot.devices.reserve(in.devices_size());
    for (const auto& entry : in.devices()) {
        DeviceSnapshot device;
        device.address = entry.address();
        device.macAddress = entry.mac_address();
        device.hostname = entry.hostname();
        device.manufacturer = entry.manufacturer();
        device.deviceType = entry.device_type();
        for (uint32_t port : entry.open_ports()) {
            if (port <= 0xFFFF) {
                device.openPorts.insert(static_cast<uint16_t>(port));
            }
        }
        device.online = entry.online();
        device.rogue = entry.rogue();
        snapshot.devices.push_back(std::move(device));
    }
    return snapshot;
}

}  // namespace

SnapshotStore::SnapshotStore(SnapshotStoreConfig config)
    : config_(std::move(config))
{
    if (config_.capacity == 0) {
        throw std::invalid_argument("snapshot store capacity must be at least 1");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    load();
}

std::string SnapshotStore::filePath() const {
    return (std::filesystem::path(config_.directory) / (config_.name + ".pb")).string();
}

void SnapshotStore::add(Snapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("SnapshotStore", "Stored snapshot {} ({} devices)", snapshot.id, snapshot.deviceCount);
    snapshots_.push_back(std::move(snapshot));
    while (snapshots_.size() > config_.capacity) {
        LOG_DEBUG("SnapshotStore", "Evicting snapshot {}", snapshots_.front().id);
        snapshots_.pop_front();
    }
    save();
}

std::optional<Snapshot> SnapshotStore::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back();
}

std::optional<Snapshot> SnapshotStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& snapshot : snapshots_) {
        if (snapshot.id == id) {
            return snapshot;
        }
    }
    return std::nullopt;
}

std::vector<Snapshot> SnapshotStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Snapshot>(snapshots_.rbegin(), snapshots_.rend());
}

std::vector<Snapshot> SnapshotStore::range(SystemClock::time_point from,
                                           SystemClock::time_point to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Snapshot> result;
    for (auto it = snapshots_.rbegin(); it != snapshots_.rend(); ++it) {
        if (it->createdAt >= from && it->createdAt <= to) {
            result.push_back(*it);
        }
    }
    return result;
}

void SnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.clear();
    save();
    LOG_INFO("SnapshotStore", "Cleared snapshot history");
}

size_t SnapshotStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

// =============================================================================
// Persistence
// =============================================================================

void SnapshotStore::load() {
    if (!config_.persist) {
        return;
    }

    const std::string path = filePath();
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_DEBUG("SnapshotStore", "No store at {}, starting empty", path);
        return;
    }

    storage::SnapshotHistory history;
    if (!history.ParseFromIstream(&in)) {
        LOG_WARN("SnapshotStore", "Could not parse {}, starting empty", path);
        return;
    }

    for (const auto& snapshot : history.snapshots()) {
        snapshots_.push_back(fromProto(snapshot));
    }
    while (snapshots_.size() > config_.capacity) {
        snapshots_.pop_front();
    }
    LOG_INFO("SnapshotStore", "Loaded {} snapshots from {}", snapshots_.size(), path);
}

void SnapshotStore::save() const {
    if (!config_.persist) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        LOG_ERROR("SnapshotStore", "Cannot create {}: {}", config_.directory, ec.message());
        return;
    }

    storage::SnapshotHistory history;
    history.set_version(kStoreVersion);
    for (const auto& snapshot : snapshots_) {
        toProto(snapshot, history.add_snapshots());
    }

    const std::string path = filePath();
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out || !history.SerializeToOstream(&out)) {
            LOG_ERROR("SnapshotStore", "Failed to write {}", tmpPath);
            return;
        }
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        LOG_ERROR("SnapshotStore", "Failed to replace {}", path);
        std::remove(tmpPath.c_str());
    }
}

}  // namespace core
}  // namespace lanscope
