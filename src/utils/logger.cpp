/**
 * @file logger.cpp
 * @brief Linkage unit for the header-only logger.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/utils/logger.hpp"

namespace lanscope {
namespace utils {

// Logger lives entirely in its header; the singleton is a function-local static.

}  // namespace utils
}  // namespace lanscope
