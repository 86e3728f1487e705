/**
 * @file inspector_service.hpp
 * @brief Async gRPC service exposing the discovery engine.
 *
 * InspectorService is the API that lanscope-cli and other clients use:
 * - StartScan: run a scan and stream its progress
 * - ListDevices / GetHistory: current inventory and discovery events
 * - ListSnapshots / CompareSnapshots: stored scans and their diffs
 * - SetTrust: operator trust flag
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/discovery_engine.hpp"
#include "lanscope/services/export.hpp"

#include <grpcpp/grpcpp.h>

// Include generated gRPC service base
#include "lanscope/proto/inspector.grpc.pb.h"

namespace lanscope {
namespace services {

/**
 * @class InspectorServiceImpl
 * @brief Implementation of the InspectorService gRPC service.
 *
 * Usage:
 * @code
 * core::DiscoveryEngine engine(config);
 * InspectorServiceImpl service(engine);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:5680", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 *
 * The engine must outlive the server.
 */
class LANSCOPE_SERVICES_API InspectorServiceImpl final
    : public inspector::InspectorService::CallbackService {
public:
    explicit InspectorServiceImpl(core::DiscoveryEngine& engine);
    ~InspectorServiceImpl() override = default;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    /**
     * @brief Handle StartScan RPC (server-streaming).
     *
     * FAILED_PRECONDITION if a scan is already running, INVALID_ARGUMENT
     * for an unknown mode.
     */
    grpc::ServerWriteReactor<inspector::ScanUpdate>* StartScan(
        grpc::CallbackServerContext* context,
        const inspector::StartScanRequest* request) override;

    grpc::ServerUnaryReactor* ListDevices(
        grpc::CallbackServerContext* context,
        const inspector::ListDevicesRequest* request,
        inspector::ListDevicesResponse* response) override;

    grpc::ServerUnaryReactor* GetHistory(
        grpc::CallbackServerContext* context,
        const inspector::GetHistoryRequest* request,
        inspector::GetHistoryResponse* response) override;

    grpc::ServerUnaryReactor* ListSnapshots(
        grpc::CallbackServerContext* context,
        const inspector::ListSnapshotsRequest* request,
        inspector::ListSnapshotsResponse* response) override;

    /**
     * @brief Handle CompareSnapshots RPC.
     *
     * Empty ids compare the two most recent snapshots
     * (FAILED_PRECONDITION with fewer than two). NOT_FOUND for an
     * unknown id.
     */
    grpc::ServerUnaryReactor* CompareSnapshots(
        grpc::CallbackServerContext* context,
        const inspector::CompareSnapshotsRequest* request,
        inspector::CompareSnapshotsResponse* response) override;

    /**
     * @brief Handle SetTrust RPC. NOT_FOUND for an unknown address.
     */
    grpc::ServerUnaryReactor* SetTrust(
        grpc::CallbackServerContext* context,
        const inspector::SetTrustRequest* request,
        inspector::SetTrustResponse* response) override;

private:
    core::DiscoveryEngine& engine_;
};

}  // namespace services
}  // namespace lanscope
