/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/discovery_engine.hpp"
#include "lanscope/utils/logger.hpp"

namespace lanscope {
namespace core {

namespace {

// Clears the single-flight flag however the scan ends
class ScanGuard {
public:
    explicit ScanGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ScanGuard() { flag_.store(false); }

    ScanGuard(const ScanGuard&) = delete;
    ScanGuard& operator=(const ScanGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

std::optional<ScanMode> parseScanMode(const std::string& text) {
    if (text == "quick") {
        return ScanMode::Quick;
    }
    if (text == "standard") {
        return ScanMode::Standard;
    }
    if (text == "deep") {
        return ScanMode::Deep;
    }
    return std::nullopt;
}

std::chrono::milliseconds scanModeWindow(ScanMode mode) {
    switch (mode) {
        case ScanMode::Quick:    return std::chrono::seconds(5);
        case ScanMode::Standard: return std::chrono::seconds(15);
        case ScanMode::Deep:     return std::chrono::seconds(30);
    }
    return std::chrono::seconds(15);
}

DiscoveryEngine::DiscoveryEngine(EngineConfig config, EngineComponents components)
    : config_(std::move(config))
    , resolver_(config_.maxHistory)
    , store_(config_.store)
    , browser_(std::move(components.browser))
    , prober_(std::move(components.prober))
    , runner_(std::move(components.runner))
{
    if (!browser_) {
        browser_ = std::make_unique<MdnsServiceBrowser>(config_.browser);
    }
    if (!prober_) {
        prober_ = std::make_unique<TcpConnectProber>(config_.probeTimeout, config_.probeWorkers);
    }
    if (!runner_) {
        runner_ = std::make_unique<ExternalToolRunner>();
    }
    if (config_.tool.flavor != ToolFlavor::None) {
        tool_ = std::make_unique<ToolDiscovery>(*runner_, config_.tool);
    }

    orchestrator_ = std::make_unique<DiscoveryOrchestrator>(
        resolver_, inventory_, *browser_, *prober_, tool_.get(), config_.orchestrator);

    LOG_INFO("Engine", "Ready: window={}ms, tool={}, store={}",
             config_.orchestrator.browseWindow.count(),
             toolFlavorToString(config_.tool.flavor), store_.filePath());
}

DiscoveryEngine::~DiscoveryEngine() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        stopping_ = true;
    }
    cancelScan();
    {
        // Join outside the lock: a finishing scan's onComplete may call
        // startScan, which takes threadMutex_ and is then refused.
        std::lock_guard<std::mutex> lock(threadMutex_);
        threads = std::move(finishedThreads_);
        if (scanThread_.joinable()) {
            threads.push_back(std::move(scanThread_));
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

// =============================================================================
// Scanning
// =============================================================================

ScanResult DiscoveryEngine::performScan(std::optional<std::chrono::milliseconds> window) {
    orchestrator_->setBrowseWindow(window ? *window : config_.orchestrator.browseWindow);

    ScanResult result;
    result.report = orchestrator_->runScan();
    if (result.report.cancelled) {
        LOG_INFO("Engine", "Scan cancelled, no snapshot stored");
        return result;
    }
    result.snapshot = makeSnapshot(result.report.devices, result.report.duration,
                                   result.report.startedAt);
    store_.add(result.snapshot);
    return result;
}

std::optional<ScanResult> DiscoveryEngine::runScan(std::optional<std::chrono::milliseconds> window) {
    bool expected = false;
    if (!scanning_.compare_exchange_strong(expected, true)) {
        LOG_WARN("Engine", "Scan rejected: another scan is running");
        return std::nullopt;
    }
    ScanGuard guard(scanning_);
    return performScan(window);
}

bool DiscoveryEngine::startScan(ScanObserver observer,
                                ScanCompletion onComplete,
                                std::optional<std::chrono::milliseconds> window) {
    bool expected = false;
    if (!scanning_.compare_exchange_strong(expected, true)) {
        LOG_WARN("Engine", "Scan rejected: another scan is running");
        return false;
    }

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (stopping_) {
        scanning_.store(false);
        return false;
    }

    // The previous scan has cleared scanning_, so its thread is exiting.
    // Called from that thread's onComplete, it cannot join itself yet.
    if (scanThread_.joinable()) {
        if (scanThread_.get_id() == std::this_thread::get_id()) {
            finishedThreads_.push_back(std::move(scanThread_));
        } else {
            scanThread_.join();
        }
    }
    for (auto it = finishedThreads_.begin(); it != finishedThreads_.end();) {
        if (it->get_id() == std::this_thread::get_id()) {
            ++it;
            continue;
        }
        it->join();
        it = finishedThreads_.erase(it);
    }

    uint64_t token = orchestrator_->subscribe(std::move(observer));
    scanThread_ = std::thread([this, token, window, onComplete = std::move(onComplete)]() {
        ScanResult result;
        {
            ScanGuard guard(scanning_);
            try {
                result = performScan(window);
            } catch (const std::exception& e) {
                LOG_ERROR("Engine", "Scan aborted: {}", e.what());
                result.report.failed = true;
                result.report.status = std::string("Discovery failed: ") + e.what();
            }
            orchestrator_->unsubscribe(token);
        }
        if (onComplete) {
            onComplete(result);
        }
    });
    return true;
}

void DiscoveryEngine::cancelScan() {
    if (scanning_.load()) {
        LOG_INFO("Engine", "Cancelling scan");
        orchestrator_->cancel();
    }
}

uint64_t DiscoveryEngine::subscribe(ScanObserver observer) {
    return orchestrator_->subscribe(std::move(observer));
}

void DiscoveryEngine::unsubscribe(uint64_t token) {
    orchestrator_->unsubscribe(token);
}

ScanProgress DiscoveryEngine::lastProgress() const {
    return orchestrator_->lastProgress();
}

// =============================================================================
// State
// =============================================================================

std::vector<InventoryDevice> DiscoveryEngine::devices() const {
    return inventory_.devices();
}

std::vector<DeviceRecord> DiscoveryEngine::identities() const {
    return resolver_.records();
}

std::vector<DiscoveryEvent> DiscoveryEngine::history(size_t limit) const {
    return resolver_.history(limit);
}

bool DiscoveryEngine::setTrust(const std::string& address, bool rogue) {
    return inventory_.setRogue(address, rogue);
}

// =============================================================================
// Snapshots
// =============================================================================

std::vector<Snapshot> DiscoveryEngine::snapshots() const {
    return store_.list();
}

std::optional<Snapshot> DiscoveryEngine::snapshot(const std::string& id) const {
    return store_.get(id);
}

std::optional<Comparison> DiscoveryEngine::compare(const std::string& beforeId,
                                                   const std::string& afterId) const {
    auto before = store_.get(beforeId);
    auto after = store_.get(afterId);
    if (!before || !after) {
        return std::nullopt;
    }
    return diff_.compare(*before, *after);
}

std::optional<Comparison> DiscoveryEngine::compareLatest() const {
    auto all = store_.list();
    if (all.size() < 2) {
        return std::nullopt;
    }
    return diff_.compare(all[1], all[0]);
}

}  // namespace core
}  // namespace lanscope
