/**
 * @file service_category.cpp
 * @brief ServiceCategory helpers.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/service_category.hpp"

#include <cctype>

namespace lanscope {
namespace core {

namespace {

constexpr const char* kFallbackName = "HomeKit Device";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool removeSuffix(std::string& s, const std::string& suffix) {
    if (s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        s.erase(s.size() - suffix.size());
        return true;
    }
    return false;
}

}  // namespace

const std::vector<ServiceCategory>& allServiceCategories() {
    static const std::vector<ServiceCategory> categories = {
        ServiceCategory::Hap,
        ServiceCategory::HomeKit,
        ServiceCategory::AirPlay,
        ServiceCategory::Raop,
        ServiceCategory::CompanionLink,
        ServiceCategory::SleepProxy,
    };
    return categories;
}

const char* serviceTypeOf(ServiceCategory category) {
    switch (category) {
        case ServiceCategory::Hap:           return "_hap._tcp";
        case ServiceCategory::HomeKit:       return "_homekit._tcp";
        case ServiceCategory::AirPlay:       return "_airplay._tcp";
        case ServiceCategory::Raop:          return "_raop._tcp";
        case ServiceCategory::CompanionLink: return "_companion-link._tcp";
        case ServiceCategory::SleepProxy:    return "_sleep-proxy._udp";
    }
    return "";
}

std::optional<ServiceCategory> categoryFromServiceType(const std::string& type) {
    std::string t = trim(type);
    while (!t.empty() && t.back() == '.') {
        t.pop_back();
    }
    removeSuffix(t, ".local");
    for (ServiceCategory category : allServiceCategories()) {
        if (t == serviceTypeOf(category)) {
            return category;
        }
    }
    return std::nullopt;
}

bool isStrongCategory(ServiceCategory category) {
    switch (category) {
        case ServiceCategory::Hap:
        case ServiceCategory::HomeKit:
            return true;
        case ServiceCategory::AirPlay:
        case ServiceCategory::Raop:
        case ServiceCategory::CompanionLink:
        case ServiceCategory::SleepProxy:
            return false;
    }
    return false;
}

const char* categoryLabel(ServiceCategory category) {
    switch (category) {
        case ServiceCategory::Hap:
        case ServiceCategory::HomeKit:
            return "HomeKit Accessory";
        case ServiceCategory::AirPlay:
        case ServiceCategory::Raop:
            return "AirPlay Device";
        case ServiceCategory::CompanionLink:
            return "Apple Device";
        case ServiceCategory::SleepProxy:
            return "Smart Home Device";
    }
    return "Smart Home Device";
}

std::string unescapeServiceName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '\\' && i + 1 < name.size()) {
            if (i + 3 < name.size() &&
                std::isdigit(static_cast<unsigned char>(name[i + 1])) &&
                std::isdigit(static_cast<unsigned char>(name[i + 2])) &&
                std::isdigit(static_cast<unsigned char>(name[i + 3]))) {
                int code = (name[i + 1] - '0') * 100 + (name[i + 2] - '0') * 10 + (name[i + 3] - '0');
                if (code <= 255) {
                    out.push_back(static_cast<char>(code));
                    i += 3;
                    continue;
                }
            }
            out.push_back(name[++i]);
            continue;
        }
        out.push_back(name[i]);
    }
    return out;
}

std::string canonicalDeviceName(const std::string& advertisedName) {
    std::string name = unescapeServiceName(trim(advertisedName));
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    removeSuffix(name, ".local");
    for (const char* suffix : {"._homekit._tcp", "._hap._tcp", "._airplay._tcp"}) {
        if (removeSuffix(name, suffix)) {
            break;
        }
    }
    name = trim(name);
    return name.empty() ? kFallbackName : name;
}

}  // namespace core
}  // namespace lanscope
