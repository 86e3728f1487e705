/**
 * @file service_category.hpp
 * @brief Advertisement categories browsed during discovery.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ServiceCategory
 * @brief DNS-SD service types a device may advertise under.
 *
 * Hap and HomeKit are authoritative for "this is an accessory"; the
 * others are companion advertisements that often co-exist on the
 * same device.
 */
enum class ServiceCategory {
    Hap,            ///< _hap._tcp
    HomeKit,        ///< _homekit._tcp
    AirPlay,        ///< _airplay._tcp
    Raop,           ///< _raop._tcp
    CompanionLink,  ///< _companion-link._tcp
    SleepProxy      ///< _sleep-proxy._udp
};

/**
 * @brief All categories, in browse order.
 */
LANSCOPE_CORE_API const std::vector<ServiceCategory>& allServiceCategories();

/**
 * @brief DNS-SD service type, e.g. "_hap._tcp".
 */
LANSCOPE_CORE_API const char* serviceTypeOf(ServiceCategory category);

/**
 * @brief Parse a service type. Accepts trailing "." or ".local." forms.
 */
LANSCOPE_CORE_API std::optional<ServiceCategory> categoryFromServiceType(const std::string& type);

/**
 * @brief True for the categories that identify a genuine accessory.
 */
LANSCOPE_CORE_API bool isStrongCategory(ServiceCategory category);

/**
 * @brief Human-readable device label for a category.
 */
LANSCOPE_CORE_API const char* categoryLabel(ServiceCategory category);

/**
 * @brief Undo dns-sd style escapes: "\032" (decimal byte) and "\." .
 */
LANSCOPE_CORE_API std::string unescapeServiceName(const std::string& name);

/**
 * @brief Canonical identity key for an advertised instance name.
 *
 * Strips the accessory/media service suffixes and a trailing
 * ".local", trims whitespace, and falls back to "HomeKit Device"
 * when nothing remains.
 */
LANSCOPE_CORE_API std::string canonicalDeviceName(const std::string& advertisedName);

}  // namespace core
}  // namespace lanscope
