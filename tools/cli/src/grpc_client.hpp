/**
 * @file grpc_client.hpp
 * @brief gRPC client for the lanscoped InspectorService
 */

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <cstdint>

// Forward declarations for gRPC types
namespace grpc {
    class Channel;
}

namespace lanscope::cli {

/**
 * @brief Inventory device as reported by the daemon
 */
struct DeviceInfo {
    std::string address;
    std::string mac_address;
    std::string hostname;
    std::string manufacturer;
    std::string device_type;
    std::vector<uint32_t> open_ports;
    bool online = false;
    bool rogue = false;
    std::string source;
    int64_t last_seen_ms = 0;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Merged advertisement identity
 */
struct IdentityInfo {
    std::string name;
    std::string category;
    std::string category_label;
    std::vector<std::string> seen_categories;
    bool strong = false;
    std::string address;
    int64_t discovered_at_ms = 0;
};

struct HistoryEntry {
    int64_t timestamp_ms = 0;
    std::string kind;
    std::string device_name;
    std::string address;
    std::string category;
};

struct SnapshotInfo {
    std::string id;
    int64_t created_at_ms = 0;
    uint32_t device_count = 0;
    uint32_t online_count = 0;
    uint32_t open_port_count = 0;
    int64_t duration_ms = 0;
};

struct ChangeInfo {
    std::string address;
    std::string kind;
    std::string detail;
    std::string severity;
};

/**
 * @brief Result of CompareSnapshots
 */
struct ComparisonInfo {
    SnapshotInfo before;
    SnapshotInfo after;
    std::vector<ChangeInfo> events;
    std::vector<std::string> new_addresses;
    std::vector<std::string> removed_addresses;
    std::vector<std::string> modified_addresses;
    std::vector<std::string> unchanged_addresses;
    std::string summary;
};

/**
 * @brief One update of a streamed scan
 */
struct ScanUpdateInfo {
    std::string phase;
    double progress = 0.0;
    std::string status;
    bool complete = false;
    bool failed = false;
    std::vector<DeviceInfo> devices;   // final update only
    std::string snapshot_id;           // final update only
    int64_t duration_ms = 0;           // final update only
};

/**
 * @brief gRPC client for lanscoped
 *
 * Calls return std::nullopt (or false) on failure; last_error() then
 * holds the gRPC status message.
 */
class GrpcClient {
public:
    GrpcClient();
    ~GrpcClient();

    /**
     * @brief Connect to lanscoped
     * @param address Host:port address
     * @return true if connected successfully
     */
    bool connect(const std::string& address);

    void disconnect();
    bool is_connected() const;
    std::string get_address() const;

    /**
     * @brief Error message from the last failed call
     */
    const std::string& last_error() const;

    /**
     * @brief Run a scan, invoking on_update for every streamed update
     * @param mode quick, standard, deep or empty for the daemon default
     * @param window_ms Explicit browse window, 0 to use the mode
     * @return The final update, or nullopt if the stream failed
     */
    std::optional<ScanUpdateInfo> start_scan(const std::string& mode, int64_t window_ms,
                                             const std::function<void(const ScanUpdateInfo&)>& on_update);

    std::optional<std::vector<DeviceInfo>> list_devices();
    std::optional<std::vector<IdentityInfo>> list_identities();
    std::optional<std::vector<HistoryEntry>> get_history(uint32_t limit);
    std::optional<std::vector<SnapshotInfo>> list_snapshots(uint32_t limit);

    /**
     * @brief Compare two snapshots; empty ids compare the two most recent
     */
    std::optional<ComparisonInfo> compare_snapshots(const std::string& before_id,
                                                    const std::string& after_id);

    bool set_trust(const std::string& address, bool rogue);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanscope::cli
