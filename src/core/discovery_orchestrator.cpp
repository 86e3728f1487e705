/**
 * @file discovery_orchestrator.cpp
 * @brief DiscoveryOrchestrator implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/discovery_orchestrator.hpp"
#include "lanscope/core/accessory_metadata.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <set>
#include <thread>

namespace lanscope {
namespace core {

namespace {

constexpr const char* kFallbackName = "HomeKit Device";

std::string phaseStatus(int number, const std::string& text) {
    return "Phase " + std::to_string(number) + "/6: " + text;
}

}  // namespace

PhaseBand phaseBand(ScanPhase phase) {
    switch (phase) {
        case ScanPhase::Browse:         return {0.00, 0.25};
        case ScanPhase::Import:         return {0.25, 0.40};
        case ScanPhase::PortEnrichment: return {0.40, 0.60};
        case ScanPhase::ToolDiscovery:  return {0.60, 0.75};
        case ScanPhase::Union:          return {0.75, 0.85};
        case ScanPhase::Finalize:       return {0.85, 1.00};
        case ScanPhase::Complete:       return {1.00, 1.00};
    }
    return {0.0, 0.0};
}

double overallProgress(ScanPhase phase, double phaseFraction) {
    PhaseBand band = phaseBand(phase);
    double f = std::clamp(phaseFraction, 0.0, 1.0);
    return band.start + (band.end - band.start) * f;
}

DiscoveryOrchestrator::DiscoveryOrchestrator(IdentityResolver& resolver,
                                             DeviceInventory& inventory,
                                             ServiceBrowser& browser,
                                             PortProber& prober,
                                             ToolDiscovery* tool,
                                             OrchestratorConfig config)
    : resolver_(resolver)
    , inventory_(inventory)
    , browser_(browser)
    , prober_(prober)
    , tool_(tool)
    , config_(std::move(config))
{
}

// =============================================================================
// Pipeline
// =============================================================================

ScanReport DiscoveryOrchestrator::runScan() {
    ScanReport scan;
    scan.startedAt = SystemClock::now();
    auto started = std::chrono::steady_clock::now();
    cancelled_.store(false);

    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        progress_ = ScanProgress();
    }

    std::vector<std::string> errors;
    auto recordFailure = [&errors](const char* phase, const std::exception& e) {
        LOG_ERROR("Orchestrator", "{} phase failed: {}", phase, e.what());
        errors.push_back(e.what());
    };

    std::set<std::string> seenKeys;
    std::set<std::string> browseAddresses;

    // -------------------------------------------------------------------------
    // Phase 1: Browse
    // -------------------------------------------------------------------------
    report(ScanPhase::Browse, 0.0, phaseStatus(1, "Scanning via Bonjour/mDNS..."));
    try {
        std::mutex sinkMutex;
        std::mutex tickMutex;
        std::condition_variable tickCv;
        bool browseDone = false;
        auto window = config_.browseWindow;

        std::thread ticker([&]() {
            auto begin = std::chrono::steady_clock::now();
            std::unique_lock<std::mutex> lock(tickMutex);
            while (!tickCv.wait_for(lock, config_.tickInterval, [&] { return browseDone; })) {
                double elapsed = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - begin).count();
                double total = std::chrono::duration<double>(window).count();
                double f = total > 0 ? std::min(elapsed / total, 0.99) : 0.99;
                report(ScanPhase::Browse, f, "");
            }
        });

        try {
            browser_.browse(config_.categories, window, [&](const BrowseResult& result) {
                resolver_.ingest(result);
                std::lock_guard<std::mutex> lock(sinkMutex);
                seenKeys.insert(canonicalDeviceName(result.name));
            });
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(tickMutex);
                browseDone = true;
            }
            tickCv.notify_all();
            ticker.join();
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(tickMutex);
            browseDone = true;
        }
        tickCv.notify_all();
        ticker.join();

        // Resolution may have landed after the first delivery, so read
        // addresses back from the merged records.
        for (const auto& record : resolver_.records()) {
            if (seenKeys.count(record.key) != 0 && record.address) {
                browseAddresses.insert(*record.address);
            }
        }
        scan.advertisedAddresses = browseAddresses.size();
        report(ScanPhase::Browse, 1.0,
               phaseStatus(1, "Found " + std::to_string(seenKeys.size()) + " services"));
    } catch (const std::exception& e) {
        recordFailure("Browse", e);
    }

    // -------------------------------------------------------------------------
    // Phase 2: Import
    // -------------------------------------------------------------------------
    std::vector<std::string> scanAddresses(browseAddresses.begin(), browseAddresses.end());
    report(ScanPhase::Import, 0.0,
           phaseStatus(2, "Importing " + std::to_string(scanAddresses.size()) + " devices..."));
    try {
        if (!cancelled_.load()) {
            inventory_.importAddresses(scanAddresses, DeviceSource::Advertisement);
        }
    } catch (const std::exception& e) {
        recordFailure("Import", e);
    }
    report(ScanPhase::Import, 1.0, "");

    // -------------------------------------------------------------------------
    // Phase 3: Port enrichment
    // -------------------------------------------------------------------------
    report(ScanPhase::PortEnrichment, 0.0,
           phaseStatus(3, "Scanning ports on " + std::to_string(scanAddresses.size()) + " devices..."));
    try {
        if (!cancelled_.load() && !scanAddresses.empty()) {
            PortMap ports = prober_.probe(scanAddresses, config_.probePorts, [this](double f) {
                report(ScanPhase::PortEnrichment, f, "");
            });
            inventory_.updateOpenPorts(ports);
        }
    } catch (const std::exception& e) {
        recordFailure("Port enrichment", e);
    }
    report(ScanPhase::PortEnrichment, 1.0, "");

    // -------------------------------------------------------------------------
    // Phase 4: Secondary-tool discovery
    // -------------------------------------------------------------------------
    std::set<std::string> toolAddresses;
    if (tool_ != nullptr && tool_->config().flavor != ToolFlavor::None) {
        const char* flavor = toolFlavorToString(tool_->config().flavor);
        report(ScanPhase::ToolDiscovery, 0.0,
               phaseStatus(4, std::string("Running ") + flavor + " discovery..."));
        try {
            if (!cancelled_.load()) {
                ToolDiscoveryResult result = tool_->discover([this](double f) {
                    report(ScanPhase::ToolDiscovery, f, "");
                });
                for (const auto& service : result.services) {
                    resolver_.ingest(service.name, ServiceCategory::Hap, service.address);
                    seenKeys.insert(canonicalDeviceName(service.name));
                    if (service.address) {
                        toolAddresses.insert(*service.address);
                    }
                }
            }
        } catch (const std::exception& e) {
            recordFailure("Tool discovery", e);
        }
        scan.toolAddresses = toolAddresses.size();
        report(ScanPhase::ToolDiscovery, 1.0,
               phaseStatus(4, "Found " + std::to_string(toolAddresses.size()) +
                              " devices via " + flavor));
    } else {
        report(ScanPhase::ToolDiscovery, 1.0, phaseStatus(4, "Secondary discovery disabled"));
    }

    // A partial address set would mark every unseen device offline, so
    // a cancelled scan stops mutating state here.
    const bool cancelled = cancelled_.load();

    // -------------------------------------------------------------------------
    // Phase 5: Union
    // -------------------------------------------------------------------------
    std::set<std::string> allAddresses = browseAddresses;
    allAddresses.insert(toolAddresses.begin(), toolAddresses.end());
    report(ScanPhase::Union, 0.0,
           phaseStatus(5, "Merging " + std::to_string(allAddresses.size()) + " unique IPs..."));
    try {
        if (!cancelled) {
            for (const auto& address : toolAddresses) {
                if (browseAddresses.count(address) == 0 && inventory_.synthesize(address)) {
                    ++scan.synthesized;
                }
            }
            inventory_.refreshOnline(allAddresses);
        }
    } catch (const std::exception& e) {
        recordFailure("Union", e);
    }
    report(ScanPhase::Union, 1.0, "");

    // -------------------------------------------------------------------------
    // Phase 6: Finalize
    // -------------------------------------------------------------------------
    report(ScanPhase::Finalize, 0.0, phaseStatus(6, "Finalizing device list..."));
    try {
        for (const auto& record : resolver_.records()) {
            if (!record.address || allAddresses.count(*record.address) == 0) {
                continue;
            }
            AccessoryMetadata meta = parseAccessoryMetadata(record.metadata, *record.address);
            std::string hostname = record.key == kFallbackName ? meta.displayName : record.key;
            std::string type = meta.categoryId ? meta.categoryName : record.categoryLabel;
            inventory_.mergeMetadata(*record.address, hostname, type, record.metadata);
        }

        if (!config_.arpTablePath.empty()) {
            inventory_.applyHardwareAddresses(readArpTable(config_.arpTablePath));
        }

        // An empty browse is more likely a network problem than every
        // device leaving at once, so nothing is retired then.
        if (!cancelled && config_.expireUnseen && !seenKeys.empty()) {
            scan.retired = resolver_.retireUnseen(seenKeys).size();
        }
    } catch (const std::exception& e) {
        recordFailure("Finalize", e);
    }

    scan.devices = inventory_.devices();
    publishDevices(scan.devices);

    scan.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (cancelled) {
        scan.cancelled = true;
        scan.failed = true;
        scan.status = "Discovery cancelled";
    } else if (!errors.empty()) {
        scan.failed = true;
        scan.status = "Discovery failed: " + errors.front();
    } else {
        scan.status = "Discovery complete - " + std::to_string(allAddresses.size()) +
                      " HomeKit devices found";
    }
    report(ScanPhase::Complete, 1.0, scan.status);

    LOG_INFO("Orchestrator", "{} in {}ms", scan.status, scan.duration.count());
    return scan;
}

void DiscoveryOrchestrator::cancel() {
    cancelled_.store(true);
    browser_.cancel();
}

// =============================================================================
// Observers
// =============================================================================

uint64_t DiscoveryOrchestrator::subscribe(ScanObserver observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    uint64_t token = nextToken_++;
    observers_.emplace(token, std::move(observer));
    return token;
}

void DiscoveryOrchestrator::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observers_.erase(token);
}

ScanProgress DiscoveryOrchestrator::lastProgress() const {
    std::lock_guard<std::mutex> lock(progressMutex_);
    return progress_;
}

std::vector<ScanObserver> DiscoveryOrchestrator::observers() const {
    std::lock_guard<std::mutex> lock(observerMutex_);
    std::vector<ScanObserver> result;
    result.reserve(observers_.size());
    for (const auto& [token, observer] : observers_) {
        result.push_back(observer);
    }
    return result;
}

void DiscoveryOrchestrator::report(ScanPhase phase, double phaseFraction, const std::string& status) {
    std::lock_guard<std::mutex> delivery(deliveryMutex_);

    ScanProgress current;
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        progress_.phase = phase;
        progress_.fraction = std::max(progress_.fraction, overallProgress(phase, phaseFraction));
        if (!status.empty()) {
            progress_.status = status;
        }
        current = progress_;
    }
    if (!status.empty()) {
        LOG_DEBUG("Orchestrator", "{} ({})", status, current.fraction);
    }

    for (const auto& observer : observers()) {
        if (observer.onProgress) {
            observer.onProgress(current);
        }
    }
}

void DiscoveryOrchestrator::publishDevices(const std::vector<InventoryDevice>& devices) {
    for (const auto& observer : observers()) {
        if (observer.onDevices) {
            observer.onDevices(devices);
        }
    }
}

}  // namespace core
}  // namespace lanscope
