/**
 * @file device_record.hpp
 * @brief Canonical merged device identity and its discovery history.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"
#include "lanscope/core/service_category.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace lanscope {
namespace core {

using SystemClock = std::chrono::system_clock;
using TxtRecord = std::map<std::string, std::string>;

/**
 * @struct DeviceRecord
 * @brief One physical device as seen through service advertisements.
 *
 * Keyed by canonical advertised name. The address is optional because
 * resolution can fail or lag behind the advertisement.
 */
struct LANSCOPE_CORE_API DeviceRecord {
    std::string key;                        ///< Canonical name, unique per record
    ServiceCategory category = ServiceCategory::SleepProxy;
    std::string categoryLabel;              ///< e.g. "HomeKit Accessory"
    std::set<std::string> seenCategories;   ///< Every service type advertised under this name
    bool strong = false;                    ///< Seen via an authoritative category
    std::optional<std::string> address;
    SystemClock::time_point discoveredAt;
    TxtRecord metadata;                     ///< Advertisement TXT key/values
};

/**
 * @enum DiscoveryEventKind
 */
enum class DiscoveryEventKind {
    Discovered,
    Updated,
    Disappeared
};

inline const char* discoveryEventKindToString(DiscoveryEventKind kind) {
    switch (kind) {
        case DiscoveryEventKind::Discovered:  return "discovered";
        case DiscoveryEventKind::Updated:     return "updated";
        case DiscoveryEventKind::Disappeared: return "disappeared";
    }
    return "unknown";
}

/**
 * @struct DiscoveryEvent
 * @brief Immutable history entry describing a record change.
 */
struct LANSCOPE_CORE_API DiscoveryEvent {
    SystemClock::time_point timestamp;
    DiscoveryEventKind kind = DiscoveryEventKind::Discovered;
    std::string deviceName;
    std::optional<std::string> address;
    ServiceCategory category = ServiceCategory::SleepProxy;
};

}  // namespace core
}  // namespace lanscope
