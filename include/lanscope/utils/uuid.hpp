/**
 * @file uuid.hpp
 * @brief Random (version 4) UUIDs used as snapshot identities.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/utils/export.hpp"

#include <string>

namespace lanscope {
namespace utils {

/**
 * @brief Generate an RFC 4122 version 4 UUID.
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, lowercase hex,
 * where y is one of 8, 9, a or b. Safe to call from any thread.
 */
LANSCOPE_UTILS_API std::string generateUuid();

/**
 * @brief Check the 8-4-4-4-12 hex layout of a UUID string.
 */
LANSCOPE_UTILS_API bool isValidUuid(const std::string& uuid);

/**
 * @brief The all-zero UUID.
 */
inline std::string nilUuid() {
    return "00000000-0000-0000-0000-000000000000";
}

}  // namespace utils
}  // namespace lanscope
