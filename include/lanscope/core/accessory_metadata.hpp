/**
 * @file accessory_metadata.hpp
 * @brief Interpretation of accessory-protocol TXT records.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_record.hpp"
#include "lanscope/core/export.hpp"

#include <optional>
#include <string>

namespace lanscope {
namespace core {

/**
 * @struct AccessoryMetadata
 * @brief Decoded _hap._tcp TXT keys.
 *
 * | key | field           |
 * |-----|-----------------|
 * | md  | model           |
 * | pv  | protocolVersion |
 * | ci  | categoryId      |
 * | sf  | statusFlags     |
 * | ff  | featureFlags    |
 * | id  | deviceId        |
 * | c#  | configNumber    |
 * | s#  | stateNumber     |
 * | sh  | setupHash       |
 */
struct LANSCOPE_CORE_API AccessoryMetadata {
    std::string displayName;             ///< model, else the address
    std::optional<std::string> model;
    std::optional<std::string> protocolVersion;
    std::optional<int> categoryId;
    std::string categoryName = "Unknown";
    std::optional<std::string> statusFlags;
    std::optional<std::string> featureFlags;
    std::optional<std::string> deviceId;
    std::optional<std::string> configNumber;
    std::optional<std::string> stateNumber;
    std::optional<std::string> setupHash;
    bool paired = false;                 ///< sf == "0"
};

/**
 * @brief Name of an accessory category id (1 Other ... 32 Speaker).
 *
 * Ids outside the table map to "Accessory".
 */
LANSCOPE_CORE_API const char* accessoryCategoryName(int categoryId);

/**
 * @brief Decode a TXT record. address is the display-name fallback.
 */
LANSCOPE_CORE_API AccessoryMetadata parseAccessoryMetadata(const TxtRecord& txt,
                                                           const std::string& address);

}  // namespace core
}  // namespace lanscope
