/**
 * @file discovery_orchestrator.hpp
 * @brief Six-phase discovery pipeline with phase-relative progress.
 *
 * | # | Phase                    | Overall range |
 * |---|--------------------------|---------------|
 * | 1 | Browse                   | 0.00 - 0.25   |
 * | 2 | Import                   | 0.25 - 0.40   |
 * | 3 | Port enrichment          | 0.40 - 0.60   |
 * | 4 | Secondary-tool discovery | 0.60 - 0.75   |
 * | 5 | Union                    | 0.75 - 0.85   |
 * | 6 | Finalize                 | 0.85 - 1.00   |
 *
 * No phase is fatal: a phase that throws contributes nothing and the
 * pipeline moves on, always reaching Finalize.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_inventory.hpp"
#include "lanscope/core/dnssd_tool.hpp"
#include "lanscope/core/export.hpp"
#include "lanscope/core/identity_resolver.hpp"
#include "lanscope/core/port_prober.hpp"
#include "lanscope/core/service_browser.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ScanPhase
 */
enum class ScanPhase {
    Browse,
    Import,
    PortEnrichment,
    ToolDiscovery,
    Union,
    Finalize,
    Complete
};

inline const char* scanPhaseToString(ScanPhase phase) {
    switch (phase) {
        case ScanPhase::Browse:         return "browse";
        case ScanPhase::Import:         return "import";
        case ScanPhase::PortEnrichment: return "port-enrichment";
        case ScanPhase::ToolDiscovery:  return "tool-discovery";
        case ScanPhase::Union:          return "union";
        case ScanPhase::Finalize:       return "finalize";
        case ScanPhase::Complete:       return "complete";
    }
    return "unknown";
}

/**
 * @struct PhaseBand
 * @brief Slice of the overall 0..1 range owned by a phase.
 */
struct PhaseBand {
    double start;
    double end;
};

LANSCOPE_CORE_API PhaseBand phaseBand(ScanPhase phase);

/**
 * @brief Map a phase-relative fraction into the overall range.
 *
 * phaseFraction is clamped to [0, 1].
 */
LANSCOPE_CORE_API double overallProgress(ScanPhase phase, double phaseFraction);

/**
 * @struct ScanProgress
 */
struct LANSCOPE_CORE_API ScanProgress {
    ScanPhase phase = ScanPhase::Browse;
    double fraction = 0.0;      ///< Overall, never decreases within a scan
    std::string status;
};

/**
 * @struct ScanObserver
 * @brief Callbacks for scan progress and the published device list.
 *
 * Either callback may be empty. They are invoked one at a time, from
 * whichever thread is doing the work.
 */
struct LANSCOPE_CORE_API ScanObserver {
    std::function<void(const ScanProgress&)> onProgress;
    std::function<void(const std::vector<InventoryDevice>&)> onDevices;
};

/**
 * @struct OrchestratorConfig
 */
struct LANSCOPE_CORE_API OrchestratorConfig {
    std::vector<ServiceCategory> categories = allServiceCategories();
    std::chrono::milliseconds browseWindow{15000};
    std::vector<uint16_t> probePorts = homeKitPorts();
    bool expireUnseen = true;            ///< Retire identities missing from a scan
    std::string arpTablePath = "/proc/net/arp";   ///< Empty disables MAC lookup
    std::chrono::milliseconds tickInterval{250};  ///< Browse progress cadence

    OrchestratorConfig() = default;
};

/**
 * @struct ScanReport
 * @brief Outcome of one pipeline run.
 */
struct LANSCOPE_CORE_API ScanReport {
    std::vector<InventoryDevice> devices;
    std::string status;
    bool failed = false;
    bool cancelled = false;           ///< Stopped early; also sets failed
    SystemClock::time_point startedAt;
    std::chrono::milliseconds duration{0};

    size_t advertisedAddresses = 0;   ///< Addresses from the browse phase
    size_t toolAddresses = 0;         ///< Addresses from the secondary tool
    size_t synthesized = 0;           ///< Entries created for tool-only addresses
    size_t retired = 0;               ///< Identities retired as unseen
};

/**
 * @class DiscoveryOrchestrator
 * @brief Runs browse, import, enrichment, tool discovery, union and finalize.
 *
 * The orchestrator owns none of its collaborators. It writes identities
 * only through the IdentityResolver and devices only through the
 * DeviceInventory, reading copies between phases.
 *
 * Usage:
 * @code
 * DiscoveryOrchestrator orchestrator(resolver, inventory, browser, prober, &tool, config);
 * ScanObserver observer;
 * observer.onProgress = [](const ScanProgress& p) { ... };
 * auto token = orchestrator.subscribe(observer);
 * ScanReport report = orchestrator.runScan();
 * @endcode
 */
class LANSCOPE_CORE_API DiscoveryOrchestrator {
public:
    /**
     * @param tool Secondary discovery; nullptr skips phase 4.
     */
    DiscoveryOrchestrator(IdentityResolver& resolver,
                          DeviceInventory& inventory,
                          ServiceBrowser& browser,
                          PortProber& prober,
                          ToolDiscovery* tool,
                          OrchestratorConfig config = OrchestratorConfig());

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief Run all six phases on the calling thread.
     *
     * Not reentrant; callers serialize scans.
     */
    ScanReport runScan();

    /**
     * @brief Stop browsing and skip the remaining work phases.
     *
     * A scan cancelled before the union phase reports cancelled and
     * leaves online state and identities untouched.
     */
    void cancel();

    uint64_t subscribe(ScanObserver observer);
    void unsubscribe(uint64_t token);

    ScanProgress lastProgress() const;

    const OrchestratorConfig& config() const { return config_; }
    void setBrowseWindow(std::chrono::milliseconds window) { config_.browseWindow = window; }

private:
    IdentityResolver& resolver_;
    DeviceInventory& inventory_;
    ServiceBrowser& browser_;
    PortProber& prober_;
    ToolDiscovery* tool_;
    OrchestratorConfig config_;

    std::atomic<bool> cancelled_{false};

    mutable std::mutex observerMutex_;
    std::map<uint64_t, ScanObserver> observers_;
    uint64_t nextToken_ = 1;

    // Held across observer callbacks so they see non-decreasing fractions.
    // progressMutex_ is never held while an observer runs.
    std::mutex deliveryMutex_;
    mutable std::mutex progressMutex_;
    ScanProgress progress_;

    void report(ScanPhase phase, double phaseFraction, const std::string& status);
    void publishDevices(const std::vector<InventoryDevice>& devices);
    std::vector<ScanObserver> observers() const;
};

}  // namespace core
}  // namespace lanscope
