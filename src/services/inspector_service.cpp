/**
 * @file inspector_service.cpp
 * @brief InspectorServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/services/inspector_service.hpp"
#include "lanscope/utils/logger.hpp"

#include <deque>
#include <memory>
#include <mutex>

namespace lanscope {
namespace services {

namespace {

// =============================================================================
// Conversions
// =============================================================================

void fillDevice(const core::InventoryDevice& device, inspector::Device* out) {
    out->set_address(device.address);
    out->set_mac_address(device.macAddress);
    out->set_hostname(device.hostname);
    out->set_manufacturer(device.manufacturer);
    out->set_device_type(device.deviceType);
    for (uint16_t port : device.openPorts) {
        out->add_open_ports(port);
    }
    out->set_online(device.online);
    out->set_rogue(device.rogue);
    out->set_source(core::deviceSourceToString(device.source));
    out->set_last_seen_ms(core::toEpochMillis(device.lastSeen));
    for (const auto& [key, value] : device.metadata) {
        (*out->mutable_metadata())[key] = value;
    }
}

void fillIdentity(const core::DeviceRecord& record, inspector::Identity* out) {
    out->set_name(record.key);
    out->set_category(core::serviceTypeOf(record.category));
    out->set_category_label(record.categoryLabel);
    for (const auto& seen : record.seenCategories) {
        out->add_seen_categories(seen);
    }
    out->set_strong(record.strong);
    out->set_address(record.address.value_or(""));
    out->set_discovered_at_ms(core::toEpochMillis(record.discoveredAt));
    for (const auto& [key, value] : record.metadata) {
        (*out->mutable_metadata())[key] = value;
    }
}

void fillSummary(const core::Snapshot& snapshot, inspector::SnapshotSummary* out) {
    out->set_id(snapshot.id);
    out->set_created_at_ms(core::toEpochMillis(snapshot.createdAt));
    out->set_device_count(static_cast<uint32_t>(snapshot.deviceCount));
    out->set_online_count(static_cast<uint32_t>(snapshot.onlineCount));
    out->set_open_port_count(static_cast<uint32_t>(snapshot.openPortCount));
    out->set_duration_ms(snapshot.duration.count());
}

// =============================================================================
// ScanStream - write queue shared by a StartScan reactor and engine callbacks
// =============================================================================

// Engine callbacks can outlive the reactor (client gone, scan still
// running), so they hold this instead of the reactor itself.
struct ScanStream {
    std::mutex mutex;
    grpc::ServerWriteReactor<inspector::ScanUpdate>* reactor{nullptr};
    std::deque<inspector::ScanUpdate> pending;
    inspector::ScanUpdate current;
    bool writing{false};
    bool finishRequested{false};
    bool finished{false};
    grpc::Status finalStatus;

    void enqueue(inspector::ScanUpdate update) {
        std::lock_guard<std::mutex> lock(mutex);
        if (reactor == nullptr || finishRequested) {
            return;
        }
        pending.push_back(std::move(update));
        pump();
    }

    void finish(const grpc::Status& status) {
        std::lock_guard<std::mutex> lock(mutex);
        if (reactor == nullptr || finishRequested) {
            return;
        }
        finishRequested = true;
        finalStatus = status;
        pump();
    }

    void writeDone(bool ok) {
        std::lock_guard<std::mutex> lock(mutex);
        writing = false;
        if (!ok) {
            pending.clear();
            if (!finishRequested) {
                finishRequested = true;
                finalStatus = grpc::Status(grpc::StatusCode::CANCELLED, "Stream closed");
            }
        }
        pump();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex);
        pending.clear();
        if (!finishRequested) {
            finishRequested = true;
            finalStatus = grpc::Status::CANCELLED;
        }
        pump();
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex);
        reactor = nullptr;
    }

private:
    // Caller holds mutex. Finish only once no write is outstanding.
    void pump() {
        if (writing || finished || reactor == nullptr) {
            return;
        }
        if (!pending.empty()) {
            current = std::move(pending.front());
            pending.pop_front();
            writing = true;
            reactor->StartWrite(&current);
            return;
        }
        if (finishRequested) {
            finished = true;
            reactor->Finish(finalStatus);
        }
    }
};

}  // namespace

InspectorServiceImpl::InspectorServiceImpl(core::DiscoveryEngine& engine)
    : engine_(engine)
{
    LOG_INFO("InspectorService", "Created inspector service");
}

// =============================================================================
// StartScan
// =============================================================================

class StartScanReactor : public grpc::ServerWriteReactor<inspector::ScanUpdate> {
public:
    StartScanReactor(core::DiscoveryEngine& engine, const inspector::StartScanRequest* request)
        : stream_(std::make_shared<ScanStream>())
    {
        stream_->reactor = this;

        std::optional<std::chrono::milliseconds> window;
        if (request->browse_window_ms() > 0) {
            window = std::chrono::milliseconds(request->browse_window_ms());
        } else if (!request->mode().empty()) {
            auto mode = core::parseScanMode(request->mode());
            if (!mode) {
                LOG_WARN("InspectorService", "StartScan: unknown mode {}", request->mode());
                stream_->finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                             "Unknown scan mode: " + request->mode()));
                return;
            }
            window = core::scanModeWindow(*mode);
        }

        std::shared_ptr<ScanStream> stream = stream_;

        core::ScanObserver observer;
        observer.onProgress = [stream](const core::ScanProgress& progress) {
            inspector::ScanUpdate update;
            update.set_phase(core::scanPhaseToString(progress.phase));
            update.set_progress(progress.fraction);
            update.set_status(progress.status);
            stream->enqueue(std::move(update));
        };

        auto onComplete = [stream](const core::ScanResult& result) {
            inspector::ScanUpdate update;
            update.set_phase(core::scanPhaseToString(core::ScanPhase::Complete));
            update.set_progress(1.0);
            update.set_status(result.report.status);
            update.set_complete(true);
            update.set_failed(result.report.failed);
            for (const auto& device : result.report.devices) {
                fillDevice(device, update.add_devices());
            }
            update.set_snapshot_id(result.snapshot.id);
            update.set_duration_ms(result.report.duration.count());
            stream->enqueue(std::move(update));
            stream->finish(grpc::Status::OK);
        };

        LOG_INFO("InspectorService", "StartScan: window={}ms",
                 window ? window->count() : static_cast<int64_t>(-1));

        if (!engine.startScan(std::move(observer), std::move(onComplete), window)) {
            stream_->finish(grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                         "A scan is already running"));
        }
    }

    void OnWriteDone(bool ok) override {
        stream_->writeDone(ok);
    }

    void OnCancel() override {
        LOG_INFO("InspectorService", "StartScan stream cancelled by client");
        stream_->cancel();
    }

    void OnDone() override {
        stream_->detach();
        delete this;
    }

private:
    std::shared_ptr<ScanStream> stream_;
};

grpc::ServerWriteReactor<inspector::ScanUpdate>* InspectorServiceImpl::StartScan(
    grpc::CallbackServerContext* context,
    const inspector::StartScanRequest* request) {

    return new StartScanReactor(engine_, request);
}

// =============================================================================
// ListDevices
// =============================================================================

class ListDevicesReactor : public grpc::ServerUnaryReactor {
public:
    ListDevicesReactor(core::DiscoveryEngine& engine,
                       const inspector::ListDevicesRequest* request,
                       inspector::ListDevicesResponse* response) {
        for (const auto& device : engine.devices()) {
            fillDevice(device, response->add_devices());
        }
        if (request->include_identities()) {
            for (const auto& record : engine.identities()) {
                fillIdentity(record, response->add_identities());
            }
        }
        LOG_DEBUG("InspectorService", "ListDevices: {} devices", response->devices_size());
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* InspectorServiceImpl::ListDevices(
    grpc::CallbackServerContext* context,
    const inspector::ListDevicesRequest* request,
    inspector::ListDevicesResponse* response) {

    return new ListDevicesReactor(engine_, request, response);
}

// =============================================================================
// GetHistory
// =============================================================================

class GetHistoryReactor : public grpc::ServerUnaryReactor {
public:
    GetHistoryReactor(core::DiscoveryEngine& engine,
                      const inspector::GetHistoryRequest* request,
                      inspector::GetHistoryResponse* response) {
        for (const auto& event : engine.history(request->limit())) {
            auto* out = response->add_events();
            out->set_timestamp_ms(core::toEpochMillis(event.timestamp));
            out->set_kind(core::discoveryEventKindToString(event.kind));
            out->set_device_name(event.deviceName);
            out->set_address(event.address.value_or(""));
            out->set_category(core::serviceTypeOf(event.category));
        }
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* InspectorServiceImpl::GetHistory(
    grpc::CallbackServerContext* context,
    const inspector::GetHistoryRequest* request,
    inspector::GetHistoryResponse* response) {

    return new GetHistoryReactor(engine_, request, response);
}

// =============================================================================
// ListSnapshots
// =============================================================================

class ListSnapshotsReactor : public grpc::ServerUnaryReactor {
public:
    ListSnapshotsReactor(core::DiscoveryEngine& engine,
                         const inspector::ListSnapshotsRequest* request,
                         inspector::ListSnapshotsResponse* response) {
        auto snapshots = engine.snapshots();
        size_t limit = request->limit();
        for (size_t i = 0; i < snapshots.size() && (limit == 0 || i < limit); ++i) {
            fillSummary(snapshots[i], response->add_snapshots());
        }
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* InspectorServiceImpl::ListSnapshots(
    grpc::CallbackServerContext* context,
    const inspector::ListSnapshotsRequest* request,
    inspector::ListSnapshotsResponse* response) {

    return new ListSnapshotsReactor(engine_, request, response);
}

// =============================================================================
// CompareSnapshots
// =============================================================================

class CompareSnapshotsReactor : public grpc::ServerUnaryReactor {
public:
    CompareSnapshotsReactor(core::DiscoveryEngine& engine,
                            const inspector::CompareSnapshotsRequest* request,
                            inspector::CompareSnapshotsResponse* response) {
        const std::string& beforeId = request->before_id();
        const std::string& afterId = request->after_id();

        std::optional<core::Comparison> comparison;
        if (beforeId.empty() && afterId.empty()) {
            comparison = engine.compareLatest();
            if (!comparison) {
                Finish(grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                    "At least two snapshots are needed"));
                return;
            }
        } else if (beforeId.empty() || afterId.empty()) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Give both snapshot ids or neither"));
            return;
        } else {
            comparison = engine.compare(beforeId, afterId);
            if (!comparison) {
                Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                    "Unknown snapshot id"));
                return;
            }
        }

        fillSummary(comparison->before(), response->mutable_before());
        fillSummary(comparison->after(), response->mutable_after());
        for (const auto& event : comparison->events()) {
            auto* out = response->add_events();
            out->set_address(event.address);
            out->set_kind(core::changeKindToString(event.kind));
            out->set_detail(event.detail);
            out->set_severity(core::severityToString(event.severity));
        }
        for (const auto& device : comparison->newDevices()) {
            response->add_new_addresses(device.address);
        }
        for (const auto& device : comparison->removedDevices()) {
            response->add_removed_addresses(device.address);
        }
        for (const auto& device : comparison->modifiedDevices()) {
            response->add_modified_addresses(device.address);
        }
        for (const auto& device : comparison->unchangedDevices()) {
            response->add_unchanged_addresses(device.address);
        }
        response->set_summary(comparison->summary());

        LOG_DEBUG("InspectorService", "CompareSnapshots: {}", response->summary());
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* InspectorServiceImpl::CompareSnapshots(
    grpc::CallbackServerContext* context,
    const inspector::CompareSnapshotsRequest* request,
    inspector::CompareSnapshotsResponse* response) {

    return new CompareSnapshotsReactor(engine_, request, response);
}

// =============================================================================
// SetTrust
// =============================================================================

class SetTrustReactor : public grpc::ServerUnaryReactor {
public:
    SetTrustReactor(core::DiscoveryEngine& engine,
                    const inspector::SetTrustRequest* request,
                    inspector::SetTrustResponse* response) {
        if (request->address().empty()) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Address is required"));
            return;
        }
        if (!engine.setTrust(request->address(), request->rogue())) {
            Finish(grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "Unknown device: " + request->address()));
            return;
        }
        LOG_INFO("InspectorService", "SetTrust: {} rogue={}", request->address(), request->rogue());
        response->set_success(true);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* InspectorServiceImpl::SetTrust(
    grpc::CallbackServerContext* context,
    const inspector::SetTrustRequest* request,
    inspector::SetTrustResponse* response) {

    return new SetTrustReactor(engine_, request, response);
}

}  // namespace services
}  // namespace lanscope
