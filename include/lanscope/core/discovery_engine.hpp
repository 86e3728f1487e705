/**
 * @file discovery_engine.hpp
 * @brief Owner of the discovery pipeline, its state and snapshot history.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_inventory.hpp"
#include "lanscope/core/diff_engine.hpp"
#include "lanscope/core/discovery_orchestrator.hpp"
#include "lanscope/core/dnssd_tool.hpp"
#include "lanscope/core/export.hpp"
#include "lanscope/core/external_tool_runner.hpp"
#include "lanscope/core/identity_resolver.hpp"
#include "lanscope/core/port_prober.hpp"
#include "lanscope/core/service_browser.hpp"
#include "lanscope/core/snapshot_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum ScanMode
 * @brief Browse window presets: 5, 15 and 30 seconds.
 */
enum class ScanMode {
    Quick,
    Standard,
    Deep
};

inline const char* scanModeToString(ScanMode mode) {
    switch (mode) {
        case ScanMode::Quick:    return "quick";
        case ScanMode::Standard: return "standard";
        case ScanMode::Deep:     return "deep";
    }
    return "unknown";
}

LANSCOPE_CORE_API std::optional<ScanMode> parseScanMode(const std::string& text);

LANSCOPE_CORE_API std::chrono::milliseconds scanModeWindow(ScanMode mode);

/**
 * @struct EngineConfig
 */
struct LANSCOPE_CORE_API EngineConfig {
    MdnsBrowserConfig browser;
    ToolDiscoveryConfig tool;
    OrchestratorConfig orchestrator;
    SnapshotStoreConfig store;
    size_t maxHistory = 0;                          ///< 0 = unbounded
    std::chrono::milliseconds probeTimeout{500};
    size_t probeWorkers = 16;

    EngineConfig() = default;
};

/**
 * @struct EngineComponents
 * @brief Optional replacements for the network-facing collaborators.
 *
 * Null members get the production implementation.
 */
struct LANSCOPE_CORE_API EngineComponents {
    std::unique_ptr<ServiceBrowser> browser;
    std::unique_ptr<PortProber> prober;
    std::unique_ptr<CommandRunner> runner;
};

/**
 * @struct ScanResult
 */
struct LANSCOPE_CORE_API ScanResult {
    ScanReport report;
    Snapshot snapshot;
};

using ScanCompletion = std::function<void(const ScanResult&)>;

/**
 * @class DiscoveryEngine
 * @brief Explicitly constructed root object shared by the service layer.
 *
 * Scans are single-flight: a scan requested while another runs is
 * rejected rather than queued. Each completed scan is captured as a
 * snapshot and stored.
 *
 * Usage:
 * @code
 * DiscoveryEngine engine(config);
 * auto result = engine.runScan();
 * if (result) {
 *     auto comparison = engine.compareLatest();
 * }
 * @endcode
 */
class LANSCOPE_CORE_API DiscoveryEngine {
public:
    explicit DiscoveryEngine(EngineConfig config = EngineConfig(),
                             EngineComponents components = EngineComponents());

    /**
     * @brief Cancels a running scan and waits for it.
     */
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    // =========================================================================
    // Scanning
    // =========================================================================

    /**
     * @brief Run a scan on the calling thread.
     * @param window Browse window; default is the configured one.
     * @return nullopt if a scan is already running. A cancelled scan
     *         returns its report with an empty snapshot.
     */
    std::optional<ScanResult> runScan(std::optional<std::chrono::milliseconds> window = std::nullopt);

    /**
     * @brief Run a scan on a background thread.
     *
     * observer is subscribed for this scan only. onComplete runs on the
     * scan thread after the snapshot is stored, and may start the next
     * scan. A cancelled scan stores no snapshot.
     * @return False if a scan is already running or the engine is being destroyed.
     */
    bool startScan(ScanObserver observer,
                   ScanCompletion onComplete,
                   std::optional<std::chrono::milliseconds> window = std::nullopt);

    bool isScanning() const { return scanning_.load(); }

    void cancelScan();

    uint64_t subscribe(ScanObserver observer);
    void unsubscribe(uint64_t token);

    ScanProgress lastProgress() const;

    // =========================================================================
    // State
    // =========================================================================

    std::vector<InventoryDevice> devices() const;
    std::vector<DeviceRecord> identities() const;
    std::vector<DiscoveryEvent> history(size_t limit = 0) const;

    /**
     * @brief Mark or clear a device as rogue.
     * @return False if the address is not in the inventory.
     */
    bool setTrust(const std::string& address, bool rogue);

    // =========================================================================
    // Snapshots
    // =========================================================================

    std::vector<Snapshot> snapshots() const;
    std::optional<Snapshot> snapshot(const std::string& id) const;

    /**
     * @brief Compare two stored snapshots.
     * @return nullopt if either id is unknown.
     */
    std::optional<Comparison> compare(const std::string& beforeId, const std::string& afterId) const;

    /**
     * @brief Compare the two most recent snapshots.
     * @return nullopt if fewer than two are stored.
     */
    std::optional<Comparison> compareLatest() const;

    IdentityResolver& resolver() { return resolver_; }
    DeviceInventory& inventory() { return inventory_; }
    SnapshotStore& store() { return store_; }

private:
    EngineConfig config_;

    IdentityResolver resolver_;
    DeviceInventory inventory_;
    SnapshotStore store_;
    DiffEngine diff_;

    std::unique_ptr<ServiceBrowser> browser_;
    std::unique_ptr<PortProber> prober_;
    std::unique_ptr<CommandRunner> runner_;
    std::unique_ptr<ToolDiscovery> tool_;
    std::unique_ptr<DiscoveryOrchestrator> orchestrator_;

    std::atomic<bool> scanning_{false};
    std::mutex threadMutex_;
    std::thread scanThread_;
    std::vector<std::thread> finishedThreads_;   ///< Scan threads that chained a new scan
    bool stopping_ = false;                      ///< Guarded by threadMutex_

    // Caller has claimed scanning_
    ScanResult performScan(std::optional<std::chrono::milliseconds> window);
};

}  // namespace core
}  // namespace lanscope
