/**
 * @file snapshot_store.hpp
 * @brief Bounded, persisted ring of snapshots.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"
#include "lanscope/core/snapshot.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @struct SnapshotStoreConfig
 */
struct LANSCOPE_CORE_API SnapshotStoreConfig {
    std::string directory = ".";
    std::string name = "lanscope-scan-history";
    size_t capacity = 50;
    bool persist = true;      ///< false keeps everything in memory

    SnapshotStoreConfig() = default;
};

/**
 * @class SnapshotStore
 * @brief Most recent snapshots, oldest evicted first.
 *
 * The store file <directory>/<name>.pb holds a protobuf
 * lanscope.storage.SnapshotHistory. It is read on construction and
 * rewritten (write to a temporary file, then rename) after every
 * mutation. An unreadable or corrupt file is logged and the store
 * starts empty.
 */
class LANSCOPE_CORE_API SnapshotStore {
public:
    /**
     * @throws std::invalid_argument if capacity is 0.
     */
    explicit SnapshotStore(SnapshotStoreConfig config = SnapshotStoreConfig());

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * @brief Append a snapshot, evicting the oldest beyond capacity.
     */
    void add(Snapshot snapshot);

    std::optional<Snapshot> latest() const;

    std::optional<Snapshot> get(const std::string& id) const;

    /**
     * @brief All snapshots, newest first.
     */
    std::vector<Snapshot> list() const;

    /**
     * @brief Snapshots created within [from, to], newest first.
     */
    std::vector<Snapshot> range(SystemClock::time_point from, SystemClock::time_point to) const;

    void clear();

    size_t size() const;
    size_t capacity() const { return config_.capacity; }

    std::string filePath() const;

private:
    SnapshotStoreConfig config_;

    mutable std::mutex mutex_;
    std::deque<Snapshot> snapshots_;   // oldest first

    // Caller holds mutex_. Failures are logged; memory stays authoritative.
    void load();
    void save() const;
};

}  // namespace core
}  // namespace lanscope
