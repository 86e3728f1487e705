/**
 * @file identity_resolver.cpp
 * @brief IdentityResolver implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/identity_resolver.hpp"
#include "lanscope/utils/logger.hpp"

namespace lanscope {
namespace core {

IdentityResolver::IdentityResolver(size_t maxHistory)
    : maxHistory_(maxHistory)
{
}

MergeDecision IdentityResolver::ingest(const BrowseResult& result) {
    return ingest(result.name, result.category, result.address, result.txt);
}

MergeDecision IdentityResolver::ingest(const std::string& advertisedName,
                                       ServiceCategory category,
                                       const std::optional<std::string>& address,
                                       const TxtRecord& metadata) {
    const std::string key = canonicalDeviceName(advertisedName);
    const bool strong = isStrongCategory(category);
    std::vector<DiscoveryEvent> emitted;
    MergeDecision decision = MergeDecision::Ignored;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(key);

        if (it == records_.end()) {
            DeviceRecord record;
            record.key = key;
            record.category = category;
            record.categoryLabel = categoryLabel(category);
            record.seenCategories.insert(serviceTypeOf(category));
            record.strong = strong;
            record.address = address;
            record.discoveredAt = SystemClock::now();
            record.metadata = metadata;

            auto inserted = records_.emplace(key, std::move(record)).first;
            emitted.push_back(appendEvent(DiscoveryEventKind::Discovered, inserted->second));
            decision = MergeDecision::Created;
            LOG_INFO("Resolver", "Discovered {} via {}{}", key, serviceTypeOf(category),
                     address ? " at " + *address : std::string());
        } else {
            DeviceRecord& existing = it->second;

            if (strong && !existing.strong) {
                DeviceRecord upgraded;
                upgraded.key = key;
                upgraded.category = category;
                upgraded.categoryLabel = categoryLabel(category);
                upgraded.seenCategories = existing.seenCategories;
                upgraded.seenCategories.insert(serviceTypeOf(category));
                upgraded.strong = true;
                upgraded.address = address ? address : existing.address;
                upgraded.discoveredAt = SystemClock::now();
                upgraded.metadata = existing.metadata;
                for (const auto& [k, v] : metadata) {
                    upgraded.metadata[k] = v;
                }

                existing = std::move(upgraded);
                emitted.push_back(appendEvent(DiscoveryEventKind::Updated, existing));
                decision = MergeDecision::Upgraded;
                LOG_INFO("Resolver", "Upgraded {} to {}", key, serviceTypeOf(category));
            } else {
                existing.seenCategories.insert(serviceTypeOf(category));
                if (address && address != existing.address && (strong || !existing.strong)) {
                    LOG_DEBUG("Resolver", "Address of {} is now {}", key, *address);
                    existing.address = address;
                    decision = MergeDecision::AddressUpdated;
                }
            }
        }
    }

    notify(emitted);
    return decision;
}

std::vector<std::string> IdentityResolver::retireUnseen(const std::set<std::string>& seenKeys) {
    std::vector<std::string> removed;
    std::vector<DiscoveryEvent> emitted;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = records_.begin(); it != records_.end();) {
            if (seenKeys.count(it->first) != 0) {
                ++it;
                continue;
            }
            emitted.push_back(appendEvent(DiscoveryEventKind::Disappeared, it->second));
            removed.push_back(it->first);
            it = records_.erase(it);
        }
    }

    if (!removed.empty()) {
        LOG_INFO("Resolver", "{} devices disappeared", removed.size());
    }
    notify(emitted);
    return removed;
}

std::optional<DeviceRecord> IdentityResolver::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeviceRecord> IdentityResolver::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(records_.size());
    for (const auto& [key, record] : records_) {
        result.push_back(record);
    }
    return result;
}

std::vector<DiscoveryEvent> IdentityResolver::history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = (limit == 0 || limit > history_.size()) ? history_.size() : limit;
    return std::vector<DiscoveryEvent>(history_.rbegin(), history_.rbegin() + count);
}

size_t IdentityResolver::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void IdentityResolver::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    history_.clear();
}

uint64_t IdentityResolver::subscribe(DiscoveryListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    uint64_t token = nextToken_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void IdentityResolver::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(token);
}

SystemClock::time_point IdentityResolver::nextTimestamp() {
    // Wall clock can step backwards; history must not
    auto now = SystemClock::now();
    if (now < lastEventTime_) {
        now = lastEventTime_;
    }
    lastEventTime_ = now;
    return now;
}

DiscoveryEvent IdentityResolver::appendEvent(DiscoveryEventKind kind, const DeviceRecord& record) {
    DiscoveryEvent event;
    event.timestamp = nextTimestamp();
    event.kind = kind;
    event.deviceName = record.key;
    event.address = record.address;
    event.category = record.category;

    history_.push_back(event);
    if (maxHistory_ > 0 && history_.size() > maxHistory_) {
        history_.pop_front();
    }
    return event;
}

void IdentityResolver::notify(const std::vector<DiscoveryEvent>& events) {
    if (events.empty()) {
        return;
    }
    std::vector<DiscoveryListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (const auto& [token, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            listener(event);
        }
    }
}

}  // namespace core
}  // namespace lanscope
