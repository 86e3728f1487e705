/**
 * @file service_browser.hpp
 * @brief Concurrent, fixed-window service advertisement browsing.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/device_record.hpp"
#include "lanscope/core/export.hpp"
#include "lanscope/core/service_category.hpp"
#include "lanscope/core/settle_once.hpp"
#include "lanscope/net/dns_message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/**
 * @struct BrowseResult
 * @brief One advertised service instance.
 */
struct LANSCOPE_CORE_API BrowseResult {
    std::string name;                       ///< Instance name as advertised
    ServiceCategory category = ServiceCategory::Hap;
    std::string interfaceName;
    std::optional<std::string> address;
    std::string host;                       ///< SRV target, if seen
    uint16_t port = 0;
    TxtRecord txt;
};

/**
 * @brief Receives results as they arrive. Calls are serialized.
 */
using BrowseSink = std::function<void(const BrowseResult&)>;

/**
 * @class ServiceBrowser
 * @brief Browses several advertisement categories at once.
 */
class LANSCOPE_CORE_API ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    /**
     * @brief Browse every category concurrently for window, then return.
     *
     * A result may be delivered twice: first without an address, then
     * again once resolution succeeds. Blocks until the window has
     * elapsed and outstanding resolution attempts have settled.
     */
    virtual void browse(const std::vector<ServiceCategory>& categories,
                        std::chrono::milliseconds window,
                        const BrowseSink& sink) = 0;

    /**
     * @brief End the current browse early (e.g. on shutdown).
     */
    virtual void cancel() {}
};

/**
 * @struct MdnsBrowserConfig
 */
struct LANSCOPE_CORE_API MdnsBrowserConfig {
    std::string interfaceAddress;                       ///< Empty = kernel default
    std::chrono::milliseconds resolveTimeout{2000};     ///< Per-result address resolution
    int multicastTtl = 255;

    MdnsBrowserConfig() = default;
};

/**
 * @brief Results for one category carried by an mDNS response.
 *
 * Matches PTR records for "<service>.local" and joins the SRV, TXT and
 * A records for the same instance found in the same message. Goodbye
 * records (TTL 0) are ignored.
 */
LANSCOPE_CORE_API std::vector<BrowseResult> collectBrowseResults(const net::dns::Message& message,
                                                                 ServiceCategory category);

/**
 * @class ResolutionAttempt
 * @brief Address lookup for one result announced without an address.
 *
 * Responses offered to the attempt and its deadline race to settle it;
 * exactly one of them wins. The SRV target is learned from the first
 * response carrying it, and the attempt settles on the first live A
 * record for that host.
 */
class LANSCOPE_CORE_API ResolutionAttempt {
public:
    explicit ResolutionAttempt(BrowseResult result);

    ResolutionAttempt(const ResolutionAttempt&) = delete;
    ResolutionAttempt& operator=(const ResolutionAttempt&) = delete;

    /**
     * @return True if this response settled the attempt.
     */
    bool offer(const net::dns::Message& message);

    /**
     * @brief Settle with no address; a no-op once an answer has won.
     * @return True if the deadline won.
     */
    bool expire();

    bool isSettled() const { return outcome_.isSettled(); }

    /**
     * @brief The result completed with address and host.
     *
     * Blocks until settled. nullopt if the attempt expired, in which case
     * the unresolved result already delivered stands.
     */
    std::optional<BrowseResult> resolved();

    const BrowseResult& result() const { return result_; }
    const net::dns::Labels& instance() const { return instance_; }
    net::dns::Labels host() const;

private:
    BrowseResult result_;
    net::dns::Labels instance_;             ///< <instance>.<service>.local
    mutable std::mutex mutex_;              ///< guards host_
    net::dns::Labels host_;
    SettleOnce<std::optional<std::string>> outcome_;
};

/**
 * @class ResolutionTracker
 * @brief The resolution attempts of one browse, keyed by category and name.
 *
 * Names compare case-insensitively, so a result re-announced with other
 * casing does not start a second attempt.
 */
class LANSCOPE_CORE_API ResolutionTracker {
public:
    ResolutionTracker() = default;

    ResolutionTracker(const ResolutionTracker&) = delete;
    ResolutionTracker& operator=(const ResolutionTracker&) = delete;

    /**
     * @return The new attempt, or nullptr if the result already has one.
     */
    std::shared_ptr<ResolutionAttempt> begin(const BrowseResult& result);

    /**
     * @brief Offer a response to every unsettled attempt.
     * @return Number of attempts it settled.
     */
    size_t offer(const net::dns::Message& message);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ResolutionAttempt>> attempts_;
};

/**
 * @class MdnsServiceBrowser
 * @brief ServiceBrowser speaking multicast DNS directly.
 *
 * One thread per category shares UDP port 5353 (SO_REUSEPORT) with
 * any system responder and re-sends its PTR query with a doubling
 * interval (1s, 2s, 4s, capped at 5s). When 5353 is unavailable it falls back to an
 * ephemeral port and asks for unicast replies.
 *
 * Every result lacking an address gets exactly one resolution attempt
 * on its own short-lived socket (SRV then A). The attempt settles on
 * the first address seen, by its own socket or by any category
 * listener, or with no address when resolveTimeout expires.
 */
class LANSCOPE_CORE_API MdnsServiceBrowser : public ServiceBrowser {
public:
    explicit MdnsServiceBrowser(MdnsBrowserConfig config = MdnsBrowserConfig());
    ~MdnsServiceBrowser() override;

    MdnsServiceBrowser(const MdnsServiceBrowser&) = delete;
    MdnsServiceBrowser& operator=(const MdnsServiceBrowser&) = delete;

    void browse(const std::vector<ServiceCategory>& categories,
                std::chrono::milliseconds window,
                const BrowseSink& sink) override;

    void cancel() override;

private:
    struct Session;

    MdnsBrowserConfig config_;
    std::atomic<bool> cancelled_{false};

    void browseCategory(ServiceCategory category, Session& session);
    void startResolution(const BrowseResult& result, Session& session);
    void resolveEndpoint(std::shared_ptr<ResolutionAttempt> attempt, Session& session);
};

}  // namespace core
}  // namespace lanscope
