/**
 * @file accessory_metadata.cpp
 * @brief TXT record decoding.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/accessory_metadata.hpp"

#include <cctype>

namespace lanscope {
namespace core {

namespace {

std::optional<std::string> lookup(const TxtRecord& txt, const char* key) {
    auto it = txt.find(key);
    if (it == txt.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> parseInt(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

const char* accessoryCategoryName(int categoryId) {
    switch (categoryId) {
        case 1:  return "Other";
        case 2:  return "Bridge";
        case 3:  return "Fan";
        case 4:  return "Garage Door Opener";
        case 5:  return "Lightbulb";
        case 6:  return "Door Lock";
        case 7:  return "Outlet";
        case 8:  return "Switch";
        case 9:  return "Thermostat";
        case 10: return "Sensor";
        case 11: return "Security System";
        case 12: return "Door";
        case 13: return "Window";
        case 14: return "Window Covering";
        case 15: return "Programmable Switch";
        case 16: return "Range Extender";
        case 17: return "IP Camera";
        case 18: return "Video Doorbell";
        case 19: return "Air Purifier";
        case 20: return "Heater";
        case 21: return "Air Conditioner";
        case 22: return "Humidifier";
        case 23: return "Dehumidifier";
        case 28: return "Sprinkler";
        case 29: return "Faucet";
        case 30: return "Shower System";
        case 31: return "Television";
        case 32: return "Speaker";
        default: return "Accessory";
    }
}

AccessoryMetadata parseAccessoryMetadata(const TxtRecord& txt, const std::string& address) {
    AccessoryMetadata meta;
    meta.model = lookup(txt, "md");
    meta.displayName = meta.model.value_or(address);
    meta.protocolVersion = lookup(txt, "pv");
    meta.statusFlags = lookup(txt, "sf");
    meta.featureFlags = lookup(txt, "ff");
    meta.deviceId = lookup(txt, "id");
    meta.configNumber = lookup(txt, "c#");
    meta.stateNumber = lookup(txt, "s#");
    meta.setupHash = lookup(txt, "sh");
    meta.paired = meta.statusFlags && *meta.statusFlags == "0";

    if (auto ci = lookup(txt, "ci")) {
        meta.categoryId = parseInt(*ci);
        meta.categoryName = meta.categoryId ? accessoryCategoryName(*meta.categoryId) : "Unknown";
    }
    return meta;
}

}  // namespace core
}  // namespace lanscope
