/**
 * @file identity_resolver.hpp
 * @brief Deduplication and upgrade-only merging of discovery results.
 *
 * The IdentityResolver owns the canonical device set and the discovery
 * history. Every mutation passes through its single mutex, so browse
 * threads, resolution threads and the orchestrator may all call it
 * concurrently.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_record.hpp"
#include "lanscope/core/export.hpp"
#include "lanscope/core/service_browser.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @enum MergeDecision
 * @brief What ingest() did with a result.
 */
enum class MergeDecision {
    Created,         ///< New record, "discovered" event
    Upgraded,        ///< Weak record replaced by strong signal, "updated" event
    AddressUpdated,  ///< Address changed in place, no event
    Ignored          ///< Nothing new
};

inline const char* mergeDecisionToString(MergeDecision decision) {
    switch (decision) {
        case MergeDecision::Created:        return "created";
        case MergeDecision::Upgraded:       return "upgraded";
        case MergeDecision::AddressUpdated: return "address-updated";
        case MergeDecision::Ignored:        return "ignored";
    }
    return "unknown";
}

using DiscoveryListener = std::function<void(const DiscoveryEvent&)>;

/**
 * @class IdentityResolver
 * @brief Canonical device set keyed by advertised name.
 *
 * Merge policy:
 * - unknown key: create, emit discovered
 * - strong signal for a weak record: replace, emit updated
 * - anything else: at most an in-place address update, never an event
 *
 * A weak signal never touches a strong record, and a resolved address
 * is never cleared. The final record for a key therefore does not
 * depend on whether weak or strong signals arrived first.
 *
 * Usage:
 * @code
 * IdentityResolver resolver;
 * auto token = resolver.subscribe([](const DiscoveryEvent& e) { ... });
 * resolver.ingest("Eve Energy._hap._tcp", ServiceCategory::Hap, "10.0.0.7");
 * auto history = resolver.history();   // most recent first
 * resolver.unsubscribe(token);
 * @endcode
 */
class LANSCOPE_CORE_API IdentityResolver {
public:
    /**
     * @param maxHistory Oldest events are dropped beyond this; 0 = unbounded.
     */
    explicit IdentityResolver(size_t maxHistory = 0);

    IdentityResolver(const IdentityResolver&) = delete;
    IdentityResolver& operator=(const IdentityResolver&) = delete;

    MergeDecision ingest(const std::string& advertisedName,
                         ServiceCategory category,
                         const std::optional<std::string>& address,
                         const TxtRecord& metadata = {});

    MergeDecision ingest(const BrowseResult& result);

    /**
     * @brief Remove records whose key is not in seenKeys.
     *
     * Emits one "disappeared" event per removed record.
     * @return Keys that were removed.
     */
    std::vector<std::string> retireUnseen(const std::set<std::string>& seenKeys);

    std::optional<DeviceRecord> find(const std::string& key) const;

    /**
     * @brief Copy of all records, ordered by key.
     */
    std::vector<DeviceRecord> records() const;

    /**
     * @brief Events, most recent first.
     * @param limit 0 = all.
     */
    std::vector<DiscoveryEvent> history(size_t limit = 0) const;

    size_t size() const;

    void clear();

    /**
     * @brief Register a listener for every appended event.
     *
     * Listeners run on the ingesting thread, outside the resolver lock.
     * @return Token for unsubscribe().
     */
    uint64_t subscribe(DiscoveryListener listener);
    void unsubscribe(uint64_t token);

private:
    size_t maxHistory_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceRecord> records_;
    std::deque<DiscoveryEvent> history_;   // oldest first
    SystemClock::time_point lastEventTime_{};

    mutable std::mutex listenerMutex_;
    std::map<uint64_t, DiscoveryListener> listeners_;
    uint64_t nextToken_ = 1;

    // Caller holds mutex_
    DiscoveryEvent appendEvent(DiscoveryEventKind kind, const DeviceRecord& record);
    SystemClock::time_point nextTimestamp();

    void notify(const std::vector<DiscoveryEvent>& events);
};

}  // namespace core
}  // namespace lanscope
