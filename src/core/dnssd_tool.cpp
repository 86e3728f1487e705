/**
 * @file dnssd_tool.cpp
 * @brief ToolDiscovery implementation and tool output parsers.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/dnssd_tool.hpp"
#include "lanscope/core/service_category.hpp"
#include "lanscope/net/platform.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <regex>
#include <set>
#include <sstream>
#include <thread>

namespace lanscope {
namespace core {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool hasToken(const std::string& line, const std::string& token) {
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        if (word == token) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> splitFields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

}  // namespace

std::optional<ToolFlavor> parseToolFlavor(const std::string& text) {
    if (text == "dns-sd" || text == "dnssd") {
        return ToolFlavor::DnsSd;
    }
    if (text == "avahi") {
        return ToolFlavor::Avahi;
    }
    if (text == "none") {
        return ToolFlavor::None;
    }
    return std::nullopt;
}

std::vector<std::string> ToolDiscoveryResult::addresses() const {
    std::vector<std::string> result;
    for (const auto& service : services) {
        if (service.address &&
            std::find(result.begin(), result.end(), *service.address) == result.end()) {
            result.push_back(*service.address);
        }
    }
    return result;
}

// =============================================================================
// Parsers
// =============================================================================

std::vector<std::string> parseDnsSdBrowse(const std::string& output,
                                          const std::string& serviceType) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    const std::string marker = serviceType + ".";

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!hasToken(line, "Add")) {
            continue;
        }
        size_t pos = line.find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        std::string name = trim(line.substr(pos + marker.size()));
        if (name.empty()) {
            continue;
        }
        if (seen.insert(name).second) {
            names.push_back(name);
        }
    }
    return names;
}

std::optional<std::string> extractIPv4(const std::string& output) {
    static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");

    for (auto it = std::sregex_iterator(output.begin(), output.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        std::string candidate = it->str();
        if (net::isIPv4Address(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<ToolService> parseAvahiBrowse(const std::string& output) {
    std::vector<ToolService> services;

    auto findOrAdd = [&services](const std::string& name) -> ToolService& {
        for (auto& service : services) {
            if (service.name == name) {
                return service;
            }
        }
        services.push_back(ToolService{name, std::nullopt});
        return services.back();
    };

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() < 2 || line[1] != ';') {
            continue;
        }
        auto fields = splitFields(line, ';');
        if (fields.size() < 4) {
            continue;
        }
        std::string name = trim(unescapeServiceName(fields[3]));
        if (name.empty()) {
            continue;
        }

        if (fields[0] == "+") {
            findOrAdd(name);
        } else if (fields[0] == "=") {
            if (fields.size() < 8 || fields[2] != "IPv4") {
                continue;
            }
            ToolService& service = findOrAdd(name);
            if (!service.address && net::isIPv4Address(fields[7])) {
                service.address = fields[7];
            }
        }
    }
    return services;
}

// =============================================================================
// ToolDiscovery
// =============================================================================

ToolDiscovery::ToolDiscovery(CommandRunner& runner, ToolDiscoveryConfig config)
    : runner_(runner)
    , config_(std::move(config))
{
}

ToolDiscoveryResult ToolDiscovery::discover(const Progress& progress) {
    switch (config_.flavor) {
        case ToolFlavor::DnsSd:
            return discoverWithDnsSd(progress);
        case ToolFlavor::Avahi:
            return discoverWithAvahi(progress);
        case ToolFlavor::None:
            break;
    }
    if (progress) {
        progress(1.0);
    }
    return ToolDiscoveryResult();
}

ToolDiscoveryResult ToolDiscovery::discoverWithDnsSd(const Progress& progress) {
    ToolDiscoveryResult result;

    // dns-sd -B never exits by itself; whatever it printed before the
    // deadline is the browse result.
    ToolOutput browse = runner_.execute(
        config_.dnsSdPath, {"-B", config_.serviceType, config_.domain}, config_.browseTimeout);
    if (browse.outcome == ToolOutcome::SpawnFailed) {
        LOG_WARN("DnsSd", "Browse unavailable: {}", browse.text);
        result.error = browse.text;
        if (progress) {
            progress(1.0);
        }
        return result;
    }

    std::vector<std::string> names = parseDnsSdBrowse(browse.text, config_.serviceType);
    if (names.size() > config_.maxLookups) {
        LOG_DEBUG("DnsSd", "Limiting lookups to {} of {} names", config_.maxLookups, names.size());
        names.resize(config_.maxLookups);
    }
    LOG_INFO("DnsSd", "Browse found {} instances", names.size());
    if (progress) {
        progress(0.5);
    }

    std::vector<std::optional<std::string>> addresses(names.size());
    std::atomic<size_t> next{0};
    std::mutex progressMutex;
    size_t completed = 0;

    auto worker = [&]() {
        while (true) {
            size_t index = next.fetch_add(1);
            if (index >= names.size()) {
                break;
            }
            // Browse output shows the escaped form; lookups take the real name
            std::string name = unescapeServiceName(names[index]);
            std::string text = runner_.run(
                config_.dnsSdPath, {"-L", name, config_.serviceType, config_.domain},
                config_.lookupTimeout);

            if (!isTimeoutMessage(text) && !isSpawnError(text)) {
                addresses[index] = extractIPv4(text);
            }
            LOG_DEBUG("DnsSd", "Lookup {} -> {}", name,
                      addresses[index] ? *addresses[index] : std::string("none"));

            std::lock_guard<std::mutex> lock(progressMutex);
            ++completed;
            if (progress) {
                progress(0.5 + 0.5 * static_cast<double>(completed) / names.size());
            }
        }
    };

    size_t workerCount = std::min(std::max<size_t>(config_.lookupConcurrency, 1), names.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    for (size_t i = 0; i < names.size(); ++i) {
        result.services.push_back(ToolService{unescapeServiceName(names[i]), addresses[i]});
    }
    if (progress) {
        progress(1.0);
    }
    return result;
}

ToolDiscoveryResult ToolDiscovery::discoverWithAvahi(const Progress& progress) {
    ToolDiscoveryResult result;

    ToolOutput browse = runner_.execute(
        config_.avahiBrowsePath, {"-p", "-t", "-r", config_.serviceType}, config_.browseTimeout);
    if (browse.outcome == ToolOutcome::SpawnFailed) {
        LOG_WARN("DnsSd", "avahi-browse unavailable: {}", browse.text);
        result.error = browse.text;
    } else {
        result.services = parseAvahiBrowse(browse.text);
        if (result.services.size() > config_.maxLookups) {
            result.services.resize(config_.maxLookups);
        }
        LOG_INFO("DnsSd", "avahi-browse found {} instances", result.services.size());
    }

    if (progress) {
        progress(1.0);
    }
    return result;
}

}  // namespace core
}  // namespace lanscope
