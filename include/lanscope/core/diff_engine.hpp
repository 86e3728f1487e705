/**
 * @file diff_engine.hpp
 * @brief Categorized, severity-ranked comparison of two snapshots.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"
#include "lanscope/core/snapshot.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ChangeKind
 */
enum class ChangeKind {
    Added,
    Removed,
    PortsChanged,
    HostnameChanged,
    StatusChanged,
    BecameUntrusted,
    BecameTrusted
};

inline const char* changeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Added:           return "added";
        case ChangeKind::Removed:         return "removed";
        case ChangeKind::PortsChanged:    return "ports-changed";
        case ChangeKind::HostnameChanged: return "hostname-changed";
        case ChangeKind::StatusChanged:   return "status-changed";
        case ChangeKind::BecameUntrusted: return "became-untrusted";
        case ChangeKind::BecameTrusted:   return "became-trusted";
    }
    return "unknown";
}

/**
 * @enum Severity
 */
enum class Severity {
    Info,
    Warning,
    Critical
};

inline const char* severityToString(Severity severity) {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

/**
 * @struct ChangeEvent
 */
struct LANSCOPE_CORE_API ChangeEvent {
    std::string address;
    ChangeKind kind = ChangeKind::Added;
    std::string detail;
    Severity severity = Severity::Info;
};

/**
 * @brief Ports whose appearance raises a port change to warning.
 *
 * 22 (ssh), 23 (telnet), 3389 (rdp), 5900 (vnc).
 */
LANSCOPE_CORE_API const std::set<uint16_t>& sensitivePorts();

/**
 * @class Comparison
 * @brief Two snapshots and the events between them.
 *
 * The device views are derived on each call from the address sets
 * and the event list:
 * - new: addresses only in after
 * - removed: addresses only in before
 * - modified: addresses in both with at least one event
 * - unchanged: addresses in after that no event mentions
 */
class LANSCOPE_CORE_API Comparison {
public:
    Comparison(Snapshot before, Snapshot after, std::vector<ChangeEvent> events);

    const Snapshot& before() const { return before_; }
    const Snapshot& after() const { return after_; }

    /// Severity first (critical first), then address, then kind
    const std::vector<ChangeEvent>& events() const { return events_; }

    std::vector<DeviceSnapshot> newDevices() const;
    std::vector<DeviceSnapshot> removedDevices() const;
    std::vector<DeviceSnapshot> modifiedDevices() const;   ///< As in after
    std::vector<DeviceSnapshot> unchangedDevices() const;

    bool hasChanges() const { return !events_.empty(); }
    size_t count(Severity severity) const;

    /**
     * @brief e.g. "2 new, 1 removed, 3 modified, 10 unchanged".
     */
    std::string summary() const;

private:
    Snapshot before_;
    Snapshot after_;
    std::vector<ChangeEvent> events_;

    std::set<std::string> eventAddresses() const;
};

/**
 * @class DiffEngine
 * @brief Produces Comparisons. Stateless.
 *
 * Usage:
 * @code
 * DiffEngine engine;
 * Comparison c = engine.compare(older, newer);
 * for (const auto& e : c.events()) { ... }
 * @endcode
 */
class LANSCOPE_CORE_API DiffEngine {
public:
    Comparison compare(const Snapshot& before, const Snapshot& after) const;

    /**
     * @brief Events for one address present in both snapshots.
     */
    std::vector<ChangeEvent> compareDevice(const DeviceSnapshot& before,
                                           const DeviceSnapshot& after) const;
};

}  // namespace core
}  // namespace lanscope
