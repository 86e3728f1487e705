/**
 * @file test_discovery_engine.cpp
 * @brief Unit tests for DiscoveryEngine scan lifecycle and snapshot history
 */

#include <gtest/gtest.h>
#include <lanscope/core/discovery_engine.hpp>

#include "fake_components.hpp"

#include <atomic>
#include <future>
#include <thread>

using namespace lanscope::core;
using namespace lanscope::testing;
using namespace std::chrono_literals;

namespace {

struct EngineFixture {
    ScriptedBrowser* browser = nullptr;
    ScriptedProber* prober = nullptr;
    std::unique_ptr<DiscoveryEngine> engine;
};

EngineFixture makeEngine(std::chrono::milliseconds hold = 0ms) {
    EngineConfig config;
    config.tool.flavor = ToolFlavor::None;
    config.orchestrator.browseWindow = 1s;
    config.orchestrator.tickInterval = 10ms;
    config.orchestrator.arpTablePath = "";
    config.orchestrator.probePorts = {22, 80, 443};
    config.store.persist = false;
    config.store.capacity = 5;

    EngineFixture fixture;
    EngineComponents components;
    auto browser = std::make_unique<ScriptedBrowser>(
        std::vector<BrowseResult>{
            browseResult("Eve Energy", ServiceCategory::Hap, "10.0.0.5", {{"ci", "7"}}),
            browseResult("Living Room", ServiceCategory::AirPlay, "10.0.0.9"),
        },
        hold);
    auto prober = std::make_unique<ScriptedProber>(PortMap{{"10.0.0.5", {80}}});
    fixture.browser = browser.get();
    fixture.prober = prober.get();
    components.browser = std::move(browser);
    components.prober = std::move(prober);
    components.runner = std::make_unique<ScriptedRunner>();

    fixture.engine = std::make_unique<DiscoveryEngine>(config, std::move(components));
    return fixture;
}

}  // namespace

TEST(ScanModeTest, NamesAndWindows) {
    EXPECT_EQ(parseScanMode("quick"), ScanMode::Quick);
    EXPECT_EQ(parseScanMode("standard"), ScanMode::Standard);
    EXPECT_EQ(parseScanMode("deep"), ScanMode::Deep);
    EXPECT_FALSE(parseScanMode("QUICK").has_value());

    EXPECT_EQ(scanModeWindow(ScanMode::Quick), 5s);
    EXPECT_EQ(scanModeWindow(ScanMode::Standard), 15s);
    EXPECT_EQ(scanModeWindow(ScanMode::Deep), 30s);
}

TEST(DiscoveryEngineTest, RunScanStoresSnapshot) {
    auto f = makeEngine();
    auto result = f.engine->runScan(50ms);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->report.failed);
    EXPECT_EQ(result->snapshot.deviceCount, 2u);
    EXPECT_EQ(result->snapshot.openPortCount, 1u);
    EXPECT_EQ(f.browser->lastWindow(), 50ms);

    ASSERT_EQ(f.engine->snapshots().size(), 1u);
    EXPECT_EQ(f.engine->snapshot(result->snapshot.id)->id, result->snapshot.id);
    EXPECT_EQ(f.engine->devices().size(), 2u);
    EXPECT_EQ(f.engine->identities().size(), 2u);
    EXPECT_EQ(f.engine->history().size(), 2u);
    EXPECT_FALSE(f.engine->isScanning());
}

TEST(DiscoveryEngineTest, DefaultWindowComesFromConfig) {
    auto f = makeEngine();
    f.engine->runScan();
    EXPECT_EQ(f.browser->lastWindow(), 1s);
}

TEST(DiscoveryEngineTest, OnlyOneScanAtATime) {
    auto f = makeEngine(300ms);

    std::promise<ScanResult> done;
    ASSERT_TRUE(f.engine->startScan(ScanObserver(), [&done](const ScanResult& r) {
        done.set_value(r);
    }));
    EXPECT_TRUE(f.engine->isScanning());
    EXPECT_FALSE(f.engine->runScan().has_value());
    EXPECT_FALSE(f.engine->startScan(ScanObserver(), nullptr));

    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_FALSE(future.get().report.failed);
    EXPECT_EQ(f.browser->browseCount(), 1);

    // The flag clears before completion is delivered
    EXPECT_FALSE(f.engine->isScanning());
    EXPECT_TRUE(f.engine->runScan(10ms).has_value());
}

TEST(DiscoveryEngineTest, StartScanStreamsProgressToObserver) {
    auto f = makeEngine();

    std::mutex mutex;
    std::vector<double> fractions;
    ScanObserver observer;
    observer.onProgress = [&](const ScanProgress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        fractions.push_back(p.fraction);
    };

    std::promise<void> done;
    ASSERT_TRUE(f.engine->startScan(observer, [&done](const ScanResult&) { done.set_value(); },
                                    50ms));
    ASSERT_EQ(done.get_future().wait_for(10s), std::future_status::ready);

    size_t seen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_FALSE(fractions.empty());
        EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
        seen = fractions.size();
    }

    // Observer was detached with the scan
    f.engine->runScan(10ms);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(fractions.size(), seen);
}

TEST(DiscoveryEngineTest, CancelEndsLongScan) {
    auto f = makeEngine(10s);

    std::promise<void> done;
    ASSERT_TRUE(f.engine->startScan(ScanObserver(), [&done](const ScanResult&) { done.set_value(); },
                                    10s));
    std::this_thread::sleep_for(50ms);
    f.engine->cancelScan();
    EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
}

TEST(DiscoveryEngineTest, CancelledScanLeavesStateAndHistoryAlone) {
    auto f = makeEngine();
    auto first = f.engine->runScan(10ms);
    ASSERT_TRUE(first.has_value());

    f.browser->setResults({});
    f.browser->setHoldFor(10s);
    std::promise<ScanResult> done;
    ASSERT_TRUE(f.engine->startScan(ScanObserver(), [&done](const ScanResult& r) {
        done.set_value(r);
    }, 10s));
    for (int i = 0; i < 200 && f.browser->browseCount() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(f.browser->browseCount(), 2);
    f.engine->cancelScan();

    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    ScanResult result = future.get();
    EXPECT_TRUE(result.report.cancelled);
    EXPECT_TRUE(result.report.failed);
    EXPECT_EQ(result.report.status, "Discovery cancelled");
    EXPECT_TRUE(result.snapshot.id.empty());

    EXPECT_EQ(f.engine->snapshots().size(), 1u);
    EXPECT_FALSE(f.engine->compareLatest().has_value());
    EXPECT_EQ(f.engine->identities().size(), 2u);
    auto devices = f.engine->devices();
    ASSERT_EQ(devices.size(), 2u);
    for (const auto& device : devices) {
        EXPECT_TRUE(device.online) << device.address;
    }
}

TEST(DiscoveryEngineTest, ObserverMayReadLastProgress) {
    auto f = makeEngine();
    DiscoveryEngine* engine = f.engine.get();

    std::atomic<int> reads{0};
    ScanObserver observer;
    observer.onProgress = [engine, &reads](const ScanProgress& p) {
        EXPECT_GE(engine->lastProgress().fraction, p.fraction);
        ++reads;
    };

    std::promise<void> done;
    ASSERT_TRUE(engine->startScan(observer, [&done](const ScanResult&) { done.set_value(); },
                                  20ms));
    ASSERT_EQ(done.get_future().wait_for(10s), std::future_status::ready);
    EXPECT_GT(reads.load(), 0);
    EXPECT_FALSE(engine->isScanning());
}

TEST(DiscoveryEngineTest, CompletionMayStartNextScan) {
    auto f = makeEngine();
    DiscoveryEngine* engine = f.engine.get();

    std::promise<bool> chained;
    std::promise<ScanResult> second;
    ASSERT_TRUE(engine->startScan(ScanObserver(), [engine, &chained, &second](const ScanResult&) {
        chained.set_value(engine->startScan(ScanObserver(), [&second](const ScanResult& r) {
            second.set_value(r);
        }, 10ms));
    }, 10ms));

    auto chainedFuture = chained.get_future();
    ASSERT_EQ(chainedFuture.wait_for(10s), std::future_status::ready);
    ASSERT_TRUE(chainedFuture.get());

    auto secondFuture = second.get_future();
    ASSERT_EQ(secondFuture.wait_for(10s), std::future_status::ready);
    EXPECT_FALSE(secondFuture.get().report.failed);
    EXPECT_EQ(f.browser->browseCount(), 2);
    EXPECT_EQ(engine->snapshots().size(), 2u);

    EXPECT_TRUE(engine->runScan(10ms).has_value());
    f.engine.reset();
}

TEST(DiscoveryEngineTest, CompareLatestNeedsTwoSnapshots) {
    auto f = makeEngine();
    EXPECT_FALSE(f.engine->compareLatest().has_value());

    auto first = f.engine->runScan(10ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(f.engine->compareLatest().has_value());

    f.prober->setOpen({{"10.0.0.5", {80, 22}}});
    auto second = f.engine->runScan(10ms);
    ASSERT_TRUE(second.has_value());

    auto comparison = f.engine->compareLatest();
    ASSERT_TRUE(comparison.has_value());
    EXPECT_EQ(comparison->before().id, first->snapshot.id);
    EXPECT_EQ(comparison->after().id, second->snapshot.id);
    ASSERT_EQ(comparison->events().size(), 1u);
    EXPECT_EQ(comparison->events()[0].kind, ChangeKind::PortsChanged);
    EXPECT_EQ(comparison->events()[0].severity, Severity::Warning);
}

TEST(DiscoveryEngineTest, CompareById) {
    auto f = makeEngine();
    auto a = f.engine->runScan(10ms);
    ASSERT_TRUE(f.engine->setTrust("10.0.0.9", true));
    auto b = f.engine->runScan(10ms);
    ASSERT_TRUE(a && b);

    auto comparison = f.engine->compare(a->snapshot.id, b->snapshot.id);
    ASSERT_TRUE(comparison.has_value());
    EXPECT_EQ(comparison->count(Severity::Critical), 1u);

    EXPECT_FALSE(f.engine->compare(a->snapshot.id, "missing").has_value());
    EXPECT_FALSE(f.engine->compare("missing", b->snapshot.id).has_value());
}

TEST(DiscoveryEngineTest, SetTrustUnknownAddressFails) {
    auto f = makeEngine();
    EXPECT_FALSE(f.engine->setTrust("10.0.0.99", true));
}
