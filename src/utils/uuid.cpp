/**
 * @file uuid.cpp
 * @brief UUID generation and validation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/utils/uuid.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace lanscope {
namespace utils {

std::string generateUuid() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    // Version nibble 0100, variant bits 10
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << ((hi >> 32) & 0xFFFFFFFF) << "-"
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (hi & 0xFFFF) << "-"
        << std::setw(4) << ((lo >> 48) & 0xFFFF) << "-"
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

bool isValidUuid(const std::string& uuid) {
    if (uuid.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < uuid.size(); ++i) {
        const char c = uuid[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace utils
}  // namespace lanscope
