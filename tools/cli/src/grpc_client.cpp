/**
 * @file grpc_client.cpp
 * @brief gRPC client implementation
 */

#include "grpc_client.hpp"

#include <grpcpp/grpcpp.h>
#include "lanscope/proto/inspector.grpc.pb.h"

#include <chrono>

namespace lanscope::cli {

namespace {

namespace proto = lanscope::inspector;

constexpr auto kCallTimeout = std::chrono::seconds(5);

void set_deadline(grpc::ClientContext& context) {
    context.set_deadline(std::chrono::system_clock::now() + kCallTimeout);
}

DeviceInfo to_device(const proto::Device& d) {
    DeviceInfo info;
    info.address = d.address();
    info.mac_address = d.mac_address();
    info.hostname = d.hostname();
    info.manufacturer = d.manufacturer();
    info.device_type = d.device_type();
    info.open_ports.assign(d.open_ports().begin(), d.open_ports().end());
    info.online = d.online();
    info.rogue = d.rogue();
    info.source = d.source();
    info.last_seen_ms = d.last_seen_ms();
    info.metadata.insert(d.metadata().begin(), d.metadata().end());
    return info;
}

SnapshotInfo to_snapshot(const proto::SnapshotSummary& s) {
    SnapshotInfo info;
    info.id = s.id();
    info.created_at_ms = s.created_at_ms();
    info.device_count = s.device_count();
    info.online_count = s.online_count();
    info.open_port_count = s.open_port_count();
    info.duration_ms = s.duration_ms();
    return info;
}

std::vector<std::string> to_strings(const google::protobuf::RepeatedPtrField<std::string>& field) {
    return std::vector<std::string>(field.begin(), field.end());
}

} // anonymous namespace

struct GrpcClient::Impl {
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<proto::InspectorService::Stub> stub;
    std::string address;
    std::string last_error;
    bool connected = false;

    bool check(const grpc::Status& status) {
        if (status.ok()) {
            last_error.clear();
            return true;
        }
        last_error = status.error_message().empty()
            ? "RPC failed with code " + std::to_string(static_cast<int>(status.error_code()))
            : status.error_message();
        return false;
    }
};

GrpcClient::GrpcClient() : impl_(std::make_unique<Impl>()) {}

GrpcClient::~GrpcClient() {
    disconnect();
}

bool GrpcClient::connect(const std::string& address) {
    disconnect();

    impl_->channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());

    // Wait for connection with timeout
    auto deadline = std::chrono::system_clock::now() + kCallTimeout;
    if (!impl_->channel->WaitForConnected(deadline)) {
        impl_->channel.reset();
        impl_->last_error = "Could not connect to " + address;
        return false;
    }

    impl_->stub = proto::InspectorService::NewStub(impl_->channel);
    impl_->address = address;
    impl_->connected = true;
    impl_->last_error.clear();
    return true;
}

void GrpcClient::disconnect() {
    if (impl_) {
        impl_->stub.reset();
        impl_->channel.reset();
        impl_->connected = false;
        impl_->address.clear();
    }
}

bool GrpcClient::is_connected() const {
    return impl_ && impl_->connected;
}

std::string GrpcClient::get_address() const {
    return impl_ ? impl_->address : "";
}

const std::string& GrpcClient::last_error() const {
    return impl_->last_error;
}

std::optional<ScanUpdateInfo> GrpcClient::start_scan(
    const std::string& mode, int64_t window_ms,
    const std::function<void(const ScanUpdateInfo&)>& on_update) {

    if (!is_connected()) return std::nullopt;

    // No deadline: a deep scan with a slow secondary tool can run for minutes
    grpc::ClientContext context;

    proto::StartScanRequest request;
    request.set_mode(mode);
    request.set_browse_window_ms(window_ms);

    auto reader = impl_->stub->StartScan(&context, request);

    std::optional<ScanUpdateInfo> final_update;
    proto::ScanUpdate update;
    while (reader->Read(&update)) {
        ScanUpdateInfo info;
        info.phase = update.phase();
        info.progress = update.progress();
        info.status = update.status();
        info.complete = update.complete();
        info.failed = update.failed();
        for (const auto& d : update.devices()) {
            info.devices.push_back(to_device(d));
        }
        info.snapshot_id = update.snapshot_id();
        info.duration_ms = update.duration_ms();

        if (on_update) {
            on_update(info);
        }
        if (info.complete) {
            final_update = std::move(info);
        }
    }

    if (!impl_->check(reader->Finish())) {
        return std::nullopt;
    }
    if (!final_update) {
        impl_->last_error = "Scan stream ended without a final update";
    }
    return final_update;
}

std::optional<std::vector<DeviceInfo>> GrpcClient::list_devices() {
    if (!is_connected()) return std::nullopt;

    grpc::ClientContext context;
    set_deadline(context);

    proto::ListDevicesRequest request;
    proto::ListDevicesResponse response;
    if (!impl_->check(impl_->stub->ListDevices(&context, request, &response))) {
        return std::nullopt;
    }

    std::vector<DeviceInfo> devices;
    for (const auto& d : response.devices()) {
        devices.push_back(to_device(d));
    }
    return devices;
}

std::optional<std::vector<IdentityInfo>> GrpcClient::list_identities() {
    if (!is_connected()) return std::nullopt;

    grpc::ClientContext context;
    set_deadline(context);

    proto::ListDevicesRequest request;
    request.set_include_identities(true);
    proto::ListDevicesResponse response;
    if (!impl_->check(impl_->stub->ListDevices(&context, request, &response))) {
        return std::nullopt;
    }

    std::vector<IdentityInfo> identities;
    for (const auto& i : response.identities()) {
        IdentityInfo info;
        info.name = i.name();
        info.category = i.category();
        info.category_label = i.category_label();
        info.seen_categories = to_strings(i.seen_categories());
        info.strong = i.strong();
        info.address = i.address();
        info.discovered_at_ms = i.discovered_at_ms();
        identities.push_back(std::move(info));
    }
    return identities;
}

std::optional<std::vector<HistoryEntry>> GrpcClient::get_history(uint32_t limit) {
    if (!is_connected()) return std::nullopt;

    grpc::ClientContext context;
    set_deadline(context);

    proto::GetHistoryRequest request;
    request.set_limit(limit);
    proto::GetHistoryResponse response;
    if (!impl_->check(impl_->stub->GetHistory(&context, request, &response))) {
        return std::nullopt;
    }

    std::vector<HistoryEntry> events;
    for (const auto& e : response.events()) {
        HistoryEntry entry;
        entry.timestamp_ms = e.timestamp_ms();
        entry.kind = e.kind();
        entry.device_name = e.device_name();
        entry.address = e.address();
        entry.category = e.category();
        events.push_back(std::move(entry));
    }
    return events;
}

std::optional<std::vector<SnapshotInfo>> GrpcClient::list_snapshots(uint32_t limit) {
    if (!is_connected()) return std::nullopt;

    grpc::ClientContext context;
    set_deadline(context);

    proto::ListSnapshotsRequest request;
    request.set_limit(limit);
    proto::ListSnapshotsResponse response;
    if (!impl_->check(impl_->stub->ListSnapshots(&context, request, &response))) {
        return std::nullopt;
    }

    std::vector<SnapshotInfo> snapshots;
    for (const auto& s : response.snapshots()) {
        snapshots.push_back(to_snapshot(s));
    }
    return snapshots;
}

std::optional<ComparisonInfo> GrpcClient::compare_snapshots(const std::string& before_id,
                                                             const std::string& after_id) {
    if (!is_connected()) return std::nullopt;

    grpc::ClientContext context;
    set_deadline(context);

    proto::CompareSnapshotsRequest request;
    request.set_before_id(before_id);
    request.set_after_id(after_id);
    proto::CompareSnapshotsResponse response;
    if (!impl_->check(impl_->stub->CompareSnapshots(&context, request, &response))) {
        return std::nullopt;
    }

    ComparisonInfo info;
    info.before = to_snapshot(response.before());
    info.after = to_snapshot(response.after());
    for (const auto& e : response.events()) {
        info.events.push_back({e.address(), e.kind(), e.detail(), e.severity()});
    }
    info.new_addresses = to_strings(response.new_addresses());
    info.removed_addresses = to_strings(response.removed_addresses());
    info.modified_addresses = to_strings(response.modified_addresses());
    info.unchanged_addresses = to_strings(response.unchanged_addresses());
    info.summary = response.summary();
    return info;
}

bool GrpcClient::set_trust(const std::string& address, bool rogue) {
    if (!is_connected()) return false;

    grpc::ClientContext context;
    set_deadline(context);

    proto::SetTrustRequest request;
    request.set_address(address);
    request.set_rogue(rogue);
    proto::SetTrustResponse response;
    if (!impl_->check(impl_->stub->SetTrust(&context, request, &response))) {
        return false;
    }
    if (!response.success()) {
        impl_->last_error = "Trust flag not changed for " + address;
    }
    return response.success();
}

} // namespace lanscope::cli
