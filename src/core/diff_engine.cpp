/**
 * @file diff_engine.cpp
 * @brief DiffEngine and Comparison implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/diff_engine.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <sstream>

namespace lanscope {
namespace core {

namespace {

int severityRank(Severity severity) {
    switch (severity) {
        case Severity::Critical: return 0;
        case Severity::Warning:  return 1;
        case Severity::Info:     return 2;
    }
    return 3;
}

std::string joinPorts(const std::vector<uint16_t>& ports) {
    std::ostringstream oss;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << ports[i];
    }
    return oss.str();
}

std::string hostnameOrNone(const std::string& hostname) {
    return hostname.empty() ? "none" : hostname;
}

using DeviceIndex = std::map<std::string, const DeviceSnapshot*>;

// Pointers are valid while snapshot lives
DeviceIndex indexByAddress(const Snapshot& snapshot) {
    DeviceIndex index;
    for (const auto& device : snapshot.devices) {
        index.emplace(device.address, &device);
    }
    return index;
}

}  // namespace

const std::set<uint16_t>& sensitivePorts() {
    static const std::set<uint16_t> ports = {22, 23, 3389, 5900};
    return ports;
}

// =============================================================================
// Comparison
// =============================================================================

Comparison::Comparison(Snapshot before, Snapshot after, std::vector<ChangeEvent> events)
    : before_(std::move(before))
    , after_(std::move(after))
    , events_(std::move(events))
{
}

std::set<std::string> Comparison::eventAddresses() const {
    std::set<std::string> addresses;
    for (const auto& event : events_) {
        addresses.insert(event.address);
    }
    return addresses;
}

std::vector<DeviceSnapshot> Comparison::newDevices() const {
    const DeviceIndex before = indexByAddress(before_);
    std::vector<DeviceSnapshot> result;
    for (const auto& device : after_.devices) {
        if (before.count(device.address) == 0) {
            result.push_back(device);
        }
    }
    return result;
}

std::vector<DeviceSnapshot> Comparison::removedDevices() const {
    const DeviceIndex after = indexByAddress(after_);
    std::vector<DeviceSnapshot> result;
    for (const auto& device : before_.devices) {
        if (after.count(device.address) == 0) {
            result.push_back(device);
        }
    }
    return result;
}

std::vector<DeviceSnapshot> Comparison::modifiedDevices() const {
    auto touched = eventAddresses();
    const DeviceIndex before = indexByAddress(before_);
    std::vector<DeviceSnapshot> result;
    for (const auto& device : after_.devices) {
        if (before.count(device.address) != 0 && touched.count(device.address) != 0) {
            result.push_back(device);
        }
    }
    return result;
}

std::vector<DeviceSnapshot> Comparison::unchangedDevices() const {
    auto touched = eventAddresses();
    std::vector<DeviceSnapshot> result;
    for (const auto& device : after_.devices) {
        if (touched.count(device.address) == 0) {
            result.push_back(device);
        }
    }
    return result;
}

size_t Comparison::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                             [severity](const ChangeEvent& e) {
                                                 return e.severity == severity;
                                             }));
}

std::string Comparison::summary() const {
    std::ostringstream oss;
    oss << newDevices().size() << " new, "
        << removedDevices().size() << " removed, "
        << modifiedDevices().size() << " modified, "
        << unchangedDevices().size() << " unchanged";
    return oss.str();
}

// =============================================================================
// DiffEngine
// =============================================================================

std::vector<ChangeEvent> DiffEngine::compareDevice(const DeviceSnapshot& before,
                                                   const DeviceSnapshot& after) const {
    std::vector<ChangeEvent> events;
    const std::string& address = after.address;

    std::vector<uint16_t> opened;
    std::vector<uint16_t> closed;
    std::set_difference(after.openPorts.begin(), after.openPorts.end(),
                        before.openPorts.begin(), before.openPorts.end(),
                        std::back_inserter(opened));
    std::set_difference(before.openPorts.begin(), before.openPorts.end(),
                        after.openPorts.begin(), after.openPorts.end(),
                        std::back_inserter(closed));

    if (!opened.empty() || !closed.empty()) {
        bool sensitive = std::any_of(opened.begin(), opened.end(), [](uint16_t port) {
            return sensitivePorts().count(port) != 0;
        });

        std::string detail = "Ports changed:";
        if (!opened.empty()) {
            detail += " Added " + joinPorts(opened);
        }
        if (!closed.empty()) {
            detail += opened.empty() ? " " : "; ";
            detail += "Removed " + joinPorts(closed);
        }
        events.push_back({address, ChangeKind::PortsChanged, detail,
                          sensitive ? Severity::Warning : Severity::Info});
    }

    if (before.hostname != after.hostname) {
        events.push_back({address, ChangeKind::HostnameChanged,
                          "Hostname changed: '" + hostnameOrNone(before.hostname) +
                              "' → '" + hostnameOrNone(after.hostname) + "'",
                          Severity::Info});
    }

    if (before.online != after.online) {
        if (after.online) {
            events.push_back({address, ChangeKind::StatusChanged, "Device came online",
                              Severity::Info});
        } else {
            events.push_back({address, ChangeKind::StatusChanged, "Device went offline",
                              Severity::Warning});
        }
    }

    if (!before.rogue && after.rogue) {
        events.push_back({address, ChangeKind::BecameUntrusted,
                          "Device flagged as rogue (previously trusted)", Severity::Critical});
    } else if (before.rogue && !after.rogue) {
        events.push_back({address, ChangeKind::BecameTrusted,
                          "Device now trusted (was rogue)", Severity::Info});
    }

    return events;
}

Comparison DiffEngine::compare(const Snapshot& before, const Snapshot& after) const {
    std::vector<ChangeEvent> events;
    const DeviceIndex beforeIndex = indexByAddress(before);
    const DeviceIndex afterIndex = indexByAddress(after);

    for (const auto& device : after.devices) {
        auto previous = beforeIndex.find(device.address);
        if (previous == beforeIndex.end()) {
            events.push_back({device.address, ChangeKind::Added,
                              "New device discovered: " + device.displayName(),
                              device.rogue ? Severity::Warning : Severity::Info});
            continue;
        }
        auto deviceEvents = compareDevice(*previous->second, device);
        events.insert(events.end(), deviceEvents.begin(), deviceEvents.end());
    }

    for (const auto& device : before.devices) {
        if (afterIndex.count(device.address) == 0) {
            events.push_back({device.address, ChangeKind::Removed,
                              "Device left network: " + device.displayName(), Severity::Info});
        }
    }

    std::stable_sort(events.begin(), events.end(), [](const ChangeEvent& a, const ChangeEvent& b) {
        int ra = severityRank(a.severity);
        int rb = severityRank(b.severity);
        if (ra != rb) {
            return ra < rb;
        }
        if (a.address != b.address) {
            return a.address < b.address;
        }
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });

    LOG_DEBUG("DiffEngine", "Compared {} with {}: {} events", before.id, after.id, events.size());
    return Comparison(before, after, std::move(events));
}

}  // namespace core
}  // namespace lanscope
