/**
 * @file config.hpp
 * @brief lanscoped daemon configuration and CLI parsing
 */

#pragma once

#include "lanscope/core/discovery_engine.hpp"
#include "lanscope/utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace lanscope {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string bind_addr = "0.0.0.0";
    uint16_t port = 5680;
    std::string log_level = "INFO";
    bool help = false;
    std::string error;                          ///< Set when parsing failed

    // Discovery
    std::string scan_mode = "standard";         ///< quick, standard, deep
    int64_t browse_window_ms = 0;               ///< Overrides scan_mode when > 0
    int64_t resolve_timeout_ms = 2000;          ///< Per-result address resolution
    std::string interface_addr;                 ///< Multicast interface, empty = default

    // Secondary tool
    std::string tool = "dns-sd";                ///< dns-sd, avahi, none
    int64_t tool_browse_timeout_ms = 10000;
    int64_t tool_lookup_timeout_ms = 2000;
    size_t max_lookups = 50;
    size_t lookup_concurrency = 8;

    // Port enrichment
    int64_t probe_timeout_ms = 500;

    // Storage
    std::string data_dir = ".";
    std::string store_name = "lanscope-scan-history";
    size_t max_snapshots = 50;
    size_t max_history = 0;                     ///< 0 = unbounded

    // Scheduling
    int64_t scan_interval_s = 0;                ///< Periodic scans, 0 = off
    bool expire_unseen = true;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "lanscoped - LAN device discovery daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --bind <addr>                 gRPC bind address (default: 0.0.0.0)\n"
              << "  --port <port>                 gRPC port (default: 5680)\n"
              << "  --log-level <level>           TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\nDiscovery Options:\n"
              << "  --scan-mode <mode>            quick (5s), standard (15s), deep (30s) (default: standard)\n"
              << "  --browse-window-ms <ms>       Explicit browse window, overrides --scan-mode\n"
              << "  --resolve-timeout-ms <ms>     Address resolution timeout (default: 2000)\n"
              << "  --interface <addr>            Local IPv4 address for multicast (default: kernel choice)\n"
              << "\nSecondary Tool Options:\n"
              << "  --tool <name>                 dns-sd, avahi or none (default: dns-sd)\n"
              << "  --tool-browse-timeout-ms <ms> Tool browse timeout (default: 10000)\n"
              << "  --tool-lookup-timeout-ms <ms> Per-name lookup timeout (default: 2000)\n"
              << "  --max-lookups <n>             Names resolved per scan (default: 50)\n"
              << "  --lookup-concurrency <n>      Concurrent lookups (default: 8)\n"
              << "\nPort Options:\n"
              << "  --probe-timeout-ms <ms>       TCP connect timeout (default: 500)\n"
              << "\nStorage Options:\n"
              << "  --data-dir <dir>              Snapshot directory (default: .)\n"
              << "  --store-name <name>           Snapshot store name (default: lanscope-scan-history)\n"
              << "  --max-snapshots <n>           Snapshots kept (default: 50)\n"
              << "  --max-history <n>             Discovery events kept, 0=unbounded (default: 0)\n"
              << "\nScheduling Options:\n"
              << "  --scan-interval-s <s>         Scan periodically, 0=off (default: 0)\n"
              << "  --expire-unseen <bool>        Retire devices missing from a scan (default: true)\n"
              << "\n  --help                        Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --scan-mode quick --scan-interval-s 300\n"
              << "  " << program_name << " --tool avahi --data-dir /var/lib/lanscope\n";
}

/**
 * @brief Parse "true"/"false"/"1"/"0"/"yes"/"no".
 * @throws std::invalid_argument for anything else
 */
inline bool parseBool(const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("expected true or false");
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; on error help is set and error describes it
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        std::cerr << "Error: " << message << "\n";
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                int port = std::stoi(value);
                if (port <= 0 || port > 65535) {
                    return fail(std::string("Invalid port ") + value);
                }
                config.port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--scan-mode") == 0) {
                if (!core::parseScanMode(value)) {
                    return fail(std::string("Unknown scan mode ") + value);
                }
                config.scan_mode = value;
            } else if (std::strcmp(arg, "--browse-window-ms") == 0) {
                config.browse_window_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--resolve-timeout-ms") == 0) {
                config.resolve_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--interface") == 0) {
                config.interface_addr = value;
            } else if (std::strcmp(arg, "--tool") == 0) {
                if (!core::parseToolFlavor(value)) {
                    return fail(std::string("Unknown tool ") + value);
                }
                config.tool = value;
            } else if (std::strcmp(arg, "--tool-browse-timeout-ms") == 0) {
                config.tool_browse_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--tool-lookup-timeout-ms") == 0) {
                config.tool_lookup_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--max-lookups") == 0) {
                config.max_lookups = std::stoull(value);
            } else if (std::strcmp(arg, "--lookup-concurrency") == 0) {
                config.lookup_concurrency = std::stoull(value);
            } else if (std::strcmp(arg, "--probe-timeout-ms") == 0) {
                config.probe_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--data-dir") == 0) {
                config.data_dir = value;
            } else if (std::strcmp(arg, "--store-name") == 0) {
                config.store_name = value;
            } else if (std::strcmp(arg, "--max-snapshots") == 0) {
                config.max_snapshots = std::stoull(value);
                if (config.max_snapshots == 0) {
                    return fail("--max-snapshots must be at least 1");
                }
            } else if (std::strcmp(arg, "--max-history") == 0) {
                config.max_history = std::stoull(value);
            } else if (std::strcmp(arg, "--scan-interval-s") == 0) {
                config.scan_interval_s = std::stoll(value);
            } else if (std::strcmp(arg, "--expire-unseen") == 0) {
                config.expire_unseen = parseBool(value);
            } else {
                return fail(std::string("Unknown option ") + arg);
            }
        } catch (const std::logic_error&) {
            // std::stoi and friends throw invalid_argument / out_of_range
            return fail(std::string("Invalid value '") + value + "' for " + arg);
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    if (level_str == "TRACE") return utils::LogLevel::TRACE;
    if (level_str == "DEBUG") return utils::LogLevel::DEBUG;
    if (level_str == "INFO") return utils::LogLevel::INFO;
    if (level_str == "WARN") return utils::LogLevel::WARN;
    if (level_str == "ERROR") return utils::LogLevel::ERROR;
    if (level_str == "FATAL") return utils::LogLevel::FATAL;
    return utils::LogLevel::INFO;
}

/**
 * @brief Effective browse window: explicit override, else the scan mode's.
 */
inline std::chrono::milliseconds browseWindow(const Config& config) {
    if (config.browse_window_ms > 0) {
        return std::chrono::milliseconds(config.browse_window_ms);
    }
    auto mode = core::parseScanMode(config.scan_mode);
    return core::scanModeWindow(mode ? *mode : core::ScanMode::Standard);
}

/**
 * @brief Build the engine configuration from daemon options.
 */
inline core::EngineConfig toEngineConfig(const Config& config) {
    core::EngineConfig engine;

    engine.browser.interfaceAddress = config.interface_addr;
    engine.browser.resolveTimeout = std::chrono::milliseconds(config.resolve_timeout_ms);

    auto flavor = core::parseToolFlavor(config.tool);
    engine.tool.flavor = flavor ? *flavor : core::ToolFlavor::DnsSd;
    engine.tool.browseTimeout = std::chrono::milliseconds(config.tool_browse_timeout_ms);
    engine.tool.lookupTimeout = std::chrono::milliseconds(config.tool_lookup_timeout_ms);
    engine.tool.maxLookups = config.max_lookups;
    engine.tool.lookupConcurrency = config.lookup_concurrency;

    engine.orchestrator.browseWindow = browseWindow(config);
    engine.orchestrator.expireUnseen = config.expire_unseen;

    engine.store.directory = config.data_dir;
    engine.store.name = config.store_name;
    engine.store.capacity = config.max_snapshots;

    engine.maxHistory = config.max_history;
    engine.probeTimeout = std::chrono::milliseconds(config.probe_timeout_ms);
    return engine;
}

} // namespace daemon
} // namespace lanscope
