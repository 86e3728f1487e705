/**
 * @file test_inspector_service.cpp
 * @brief Integration test: InspectorService over a real gRPC channel
 *
 * The daemon's discovery engine runs with scripted browser and prober
 * components, so scans are deterministic and need no network.
 */

#include <gtest/gtest.h>
#include <lanscope/utils/logger.hpp>
#include <lanscope/core/discovery_engine.hpp>
#include <lanscope/services/inspector_service.hpp>

#include "fake_components.hpp"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace lanscope;
using namespace std::chrono_literals;

class InspectorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        core::EngineConfig config;
        config.tool.flavor = core::ToolFlavor::None;
        config.orchestrator.browseWindow = 100ms;
        config.orchestrator.tickInterval = 10ms;
        config.orchestrator.arpTablePath = "";
        config.store.persist = false;

        core::EngineComponents components;
        auto browser = std::make_unique<testing::ScriptedBrowser>(
            std::vector<core::BrowseResult>{
                testing::browseResult("Eve Energy", core::ServiceCategory::Hap, "10.0.0.5",
                                      {{"md", "Eve Energy"}, {"ci", "7"}}),
                testing::browseResult("Living Room", core::ServiceCategory::AirPlay, "10.0.0.9"),
            },
            50ms);
        auto prober = std::make_unique<testing::ScriptedProber>(core::PortMap{{"10.0.0.5", {80}}});
        browser_ = browser.get();
        prober_ = prober.get();
        components.browser = std::move(browser);
        components.prober = std::move(prober);
        components.runner = std::make_unique<testing::ScriptedRunner>();

        engine_ = std::make_unique<core::DiscoveryEngine>(config, std::move(components));
        service_ = std::make_unique<services::InspectorServiceImpl>(*engine_);

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port, 0);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                                           grpc::InsecureChannelCredentials());
        stub_ = inspector::InspectorService::NewStub(channel);
    }

    void TearDown() override {
        engine_->cancelScan();
        server_->Shutdown(std::chrono::system_clock::now() + 2s);
        server_.reset();
        service_.reset();
        engine_.reset();
    }

    /// Runs StartScan to completion and returns every update received.
    grpc::Status scan(std::vector<inspector::ScanUpdate>& updates, const std::string& mode = "",
                      int64_t windowMs = 100) {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + 10s);
        inspector::StartScanRequest request;
        request.set_mode(mode);
        request.set_browse_window_ms(windowMs);

        auto reader = stub_->StartScan(&context, request);
        inspector::ScanUpdate update;
        while (reader->Read(&update)) {
            updates.push_back(update);
        }
        return reader->Finish();
    }

    std::string scanForSnapshot() {
        std::vector<inspector::ScanUpdate> updates;
        grpc::Status status = scan(updates);
        EXPECT_TRUE(status.ok()) << status.error_message();
        if (updates.empty()) {
            return "";
        }
        return updates.back().snapshot_id();
    }

    testing::ScriptedBrowser* browser_ = nullptr;
    testing::ScriptedProber* prober_ = nullptr;
    std::unique_ptr<core::DiscoveryEngine> engine_;
    std::unique_ptr<services::InspectorServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<inspector::InspectorService::Stub> stub_;
};

TEST_F(InspectorServiceTest, StartScanStreamsProgressThenResult) {
    std::vector<inspector::ScanUpdate> updates;
    grpc::Status status = scan(updates);
    ASSERT_TRUE(status.ok()) << status.error_message();
    ASSERT_GE(updates.size(), 2u);

    for (size_t i = 1; i < updates.size(); ++i) {
        EXPECT_LE(updates[i - 1].progress(), updates[i].progress());
    }
    for (size_t i = 0; i + 1 < updates.size(); ++i) {
        EXPECT_FALSE(updates[i].complete());
    }

    const auto& last = updates.back();
    EXPECT_TRUE(last.complete());
    EXPECT_FALSE(last.failed());
    EXPECT_EQ(last.phase(), "complete");
    EXPECT_DOUBLE_EQ(last.progress(), 1.0);
    EXPECT_FALSE(last.snapshot_id().empty());
    ASSERT_EQ(last.devices_size(), 2);
    EXPECT_EQ(last.devices(0).address(), "10.0.0.5");
    EXPECT_EQ(last.devices(0).hostname(), "Eve Energy");
    EXPECT_EQ(last.devices(0).device_type(), "Outlet");
    ASSERT_EQ(last.devices(0).open_ports_size(), 1);
    EXPECT_EQ(last.devices(0).open_ports(0), 80u);
    EXPECT_EQ(last.devices(0).metadata().at("md"), "Eve Energy");
    EXPECT_EQ(browser_->lastWindow(), 100ms);
}

TEST_F(InspectorServiceTest, StartScanModeSelectsWindow) {
    std::vector<inspector::ScanUpdate> updates;
    ASSERT_TRUE(scan(updates, "quick", 0).ok());
    EXPECT_EQ(browser_->lastWindow(), 5s);
}

TEST_F(InspectorServiceTest, StartScanRejectsUnknownMode) {
    std::vector<inspector::ScanUpdate> updates;
    grpc::Status status = scan(updates, "turbo", 0);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(updates.empty());
}

TEST_F(InspectorServiceTest, StartScanRejectsConcurrentScan) {
    browser_->setHoldFor(30s);
    std::promise<void> done;
    ASSERT_TRUE(engine_->startScan(core::ScanObserver(),
                                   [&done](const core::ScanResult&) { done.set_value(); }, 30s));

    std::vector<inspector::ScanUpdate> updates;
    grpc::Status status = scan(updates);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);

    engine_->cancelScan();
    EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
}

TEST_F(InspectorServiceTest, ListDevicesAndIdentities) {
    scanForSnapshot();

    grpc::ClientContext context;
    inspector::ListDevicesRequest request;
    request.set_include_identities(true);
    inspector::ListDevicesResponse response;
    ASSERT_TRUE(stub_->ListDevices(&context, request, &response).ok());

    EXPECT_EQ(response.devices_size(), 2);
    ASSERT_EQ(response.identities_size(), 2);
    bool sawEve = false;
    for (const auto& identity : response.identities()) {
        if (identity.name() == "Eve Energy") {
            sawEve = true;
            EXPECT_TRUE(identity.strong());
            EXPECT_EQ(identity.category(), "_hap._tcp");
            EXPECT_EQ(identity.address(), "10.0.0.5");
        }
    }
    EXPECT_TRUE(sawEve);
}

TEST_F(InspectorServiceTest, GetHistoryHonorsLimit) {
    scanForSnapshot();

    grpc::ClientContext context;
    inspector::GetHistoryRequest request;
    request.set_limit(1);
    inspector::GetHistoryResponse response;
    ASSERT_TRUE(stub_->GetHistory(&context, request, &response).ok());
    ASSERT_EQ(response.events_size(), 1);
    EXPECT_EQ(response.events(0).kind(), "discovered");
}

TEST_F(InspectorServiceTest, CompareSnapshotsLifecycle) {
    {
        grpc::ClientContext context;
        inspector::CompareSnapshotsResponse response;
        grpc::Status status = stub_->CompareSnapshots(&context, inspector::CompareSnapshotsRequest(),
                                                      &response);
        EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    }

    std::string first = scanForSnapshot();
    prober_->setOpen({{"10.0.0.5", {80, 443}}});
    std::string second = scanForSnapshot();
    ASSERT_FALSE(first.empty());
    ASSERT_FALSE(second.empty());

    {
        grpc::ClientContext context;
        inspector::CompareSnapshotsResponse response;
        ASSERT_TRUE(stub_->CompareSnapshots(&context, inspector::CompareSnapshotsRequest(),
                                            &response).ok());
        EXPECT_EQ(response.before().id(), first);
        EXPECT_EQ(response.after().id(), second);
        ASSERT_EQ(response.events_size(), 1);
        EXPECT_EQ(response.events(0).kind(), "ports-changed");
        EXPECT_EQ(response.events(0).severity(), "info");
        EXPECT_EQ(response.events(0).detail(), "Ports changed: Added 443");
        ASSERT_EQ(response.modified_addresses_size(), 1);
        EXPECT_EQ(response.modified_addresses(0), "10.0.0.5");
        EXPECT_EQ(response.summary(), "0 new, 0 removed, 1 modified, 1 unchanged");
    }

    {
        grpc::ClientContext context;
        inspector::CompareSnapshotsRequest request;
        request.set_before_id(first);
        request.set_after_id("no-such-snapshot");
        inspector::CompareSnapshotsResponse response;
        EXPECT_EQ(stub_->CompareSnapshots(&context, request, &response).error_code(),
                  grpc::StatusCode::NOT_FOUND);
    }

    {
        grpc::ClientContext context;
        inspector::CompareSnapshotsRequest request;
        request.set_before_id(first);
        inspector::CompareSnapshotsResponse response;
        EXPECT_EQ(stub_->CompareSnapshots(&context, request, &response).error_code(),
                  grpc::StatusCode::INVALID_ARGUMENT);
    }

    grpc::ClientContext context;
    inspector::ListSnapshotsRequest request;
    inspector::ListSnapshotsResponse response;
    ASSERT_TRUE(stub_->ListSnapshots(&context, request, &response).ok());
    ASSERT_EQ(response.snapshots_size(), 2);
    EXPECT_EQ(response.snapshots(0).id(), second);
    EXPECT_EQ(response.snapshots(0).open_port_count(), 2u);
}

TEST_F(InspectorServiceTest, SetTrustFlagsDevice) {
    scanForSnapshot();

    {
        grpc::ClientContext context;
        inspector::SetTrustRequest request;
        request.set_address("10.0.0.9");
        request.set_rogue(true);
        inspector::SetTrustResponse response;
        ASSERT_TRUE(stub_->SetTrust(&context, request, &response).ok());
        EXPECT_TRUE(response.success());
    }
    EXPECT_TRUE(engine_->inventory().find("10.0.0.9")->rogue);

    grpc::ClientContext context;
    inspector::SetTrustRequest request;
    request.set_address("10.0.0.200");
    inspector::SetTrustResponse response;
    EXPECT_EQ(stub_->SetTrust(&context, request, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
}
