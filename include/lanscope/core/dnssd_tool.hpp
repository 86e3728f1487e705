/**
 * @file dnssd_tool.hpp
 * @brief Secondary discovery through the platform's DNS-SD command line tools.
 *
 * Two flavours are understood:
 * - dns-sd: "dns-sd -B" lists instance names, "dns-sd -L" is run per
 *   name and scanned for an IPv4 address
 * - avahi: "avahi-browse -p -t -r" resolves inline, one parsable line
 *   per resolved instance
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"
#include "lanscope/core/external_tool_runner.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ToolFlavor
 */
enum class ToolFlavor {
    DnsSd,
    Avahi,
    None
};

inline const char* toolFlavorToString(ToolFlavor flavor) {
    switch (flavor) {
        case ToolFlavor::DnsSd: return "dns-sd";
        case ToolFlavor::Avahi: return "avahi";
        case ToolFlavor::None:  return "none";
    }
    return "unknown";
}

/**
 * @brief Parse "dns-sd", "avahi" or "none".
 */
LANSCOPE_CORE_API std::optional<ToolFlavor> parseToolFlavor(const std::string& text);

/**
 * @struct ToolDiscoveryConfig
 */
struct LANSCOPE_CORE_API ToolDiscoveryConfig {
    ToolFlavor flavor = ToolFlavor::DnsSd;
    std::string serviceType = "_hap._tcp";
    std::string domain = "local.";
    std::chrono::milliseconds browseTimeout{10000};
    std::chrono::milliseconds lookupTimeout{2000};
    size_t maxLookups = 50;
    size_t lookupConcurrency = 8;
    std::string dnsSdPath = "dns-sd";
    std::string avahiBrowsePath = "avahi-browse";

    ToolDiscoveryConfig() = default;
};

/**
 * @struct ToolService
 * @brief One instance reported by the tool.
 */
struct LANSCOPE_CORE_API ToolService {
    std::string name;                     ///< Unescaped instance name
    std::optional<std::string> address;   ///< IPv4, when a lookup found one
};

/**
 * @struct ToolDiscoveryResult
 */
struct LANSCOPE_CORE_API ToolDiscoveryResult {
    std::vector<ToolService> services;
    std::string error;                    ///< Non-empty if the browse could not run

    std::vector<std::string> addresses() const;
};

/**
 * @brief Instance names from "dns-sd -B" output.
 *
 * Only lines carrying the "Add" marker and serviceType are used; the
 * name is whatever follows "<serviceType>." on the line. Duplicates are
 * dropped, first occurrence order is kept.
 */
LANSCOPE_CORE_API std::vector<std::string> parseDnsSdBrowse(const std::string& output,
                                                            const std::string& serviceType);

/**
 * @brief First valid dotted-quad IPv4 address in text.
 */
LANSCOPE_CORE_API std::optional<std::string> extractIPv4(const std::string& output);

/**
 * @brief Instances from "avahi-browse -p -t -r" output.
 *
 * "+" lines announce a name, "=" lines carry the resolved address in
 * field 7. IPv6 resolutions are skipped.
 */
LANSCOPE_CORE_API std::vector<ToolService> parseAvahiBrowse(const std::string& output);

/**
 * @class ToolDiscovery
 * @brief Runs the configured flavour through a CommandRunner.
 *
 * Usage:
 * @code
 * ExternalToolRunner runner;
 * ToolDiscovery discovery(runner, ToolDiscoveryConfig());
 * auto result = discovery.discover([](double f) { ... });
 * @endcode
 */
class LANSCOPE_CORE_API ToolDiscovery {
public:
    /// Fraction of this source's work done, 0.0 to 1.0.
    using Progress = std::function<void(double)>;

    ToolDiscovery(CommandRunner& runner, ToolDiscoveryConfig config);

    /**
     * @brief Browse, then look up at most maxLookups names.
     *
     * Lookups run on up to lookupConcurrency threads. Never throws for
     * tool failures: a failed browse yields an empty result with
     * error set, a failed lookup an absent address.
     */
    ToolDiscoveryResult discover(const Progress& progress = nullptr);

    const ToolDiscoveryConfig& config() const { return config_; }

private:
    CommandRunner& runner_;
    ToolDiscoveryConfig config_;

    ToolDiscoveryResult discoverWithDnsSd(const Progress& progress);
    ToolDiscoveryResult discoverWithAvahi(const Progress& progress);
};

}  // namespace core
}  // namespace lanscope
