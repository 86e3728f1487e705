/**
 * @file service_browser.cpp
 * @brief MdnsServiceBrowser implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/service_browser.hpp"
#include "lanscope/net/udp_socket.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <thread>

namespace lanscope {
namespace core {

namespace dns = net::dns;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr size_t kReceiveBufferSize = 9000;
constexpr int kPollSliceMs = 250;
constexpr int kResolvePollSliceMs = 100;

dns::Labels serviceLabels(ServiceCategory category) {
    return dns::splitName(std::string(serviceTypeOf(category)) + ".local");
}

std::string resultKey(ServiceCategory category, const std::string& name) {
    std::string key = std::string(serviceTypeOf(category)) + "|";
    for (char c : name) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

std::optional<std::string> findAddress(const dns::Message& message, const dns::Labels& host) {
    if (host.empty()) {
        return std::nullopt;
    }
    for (const auto& rr : message.records) {
        if (rr.is(dns::RecordType::A) && rr.ttl > 0 && dns::sameName(rr.name, host)) {
            return rr.address;
        }
    }
    return std::nullopt;
}

const dns::ResourceRecord* findRecord(const dns::Message& message, dns::RecordType type,
                                      const dns::Labels& name) {
    for (const auto& rr : message.records) {
        if (rr.is(type) && dns::sameName(rr.name, name)) {
            return &rr;
        }
    }
    return nullptr;
}

int millisUntil(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return static_cast<int>(std::max<int64_t>(0, left.count()));
}

}  // namespace

std::vector<BrowseResult> collectBrowseResults(const dns::Message& message,
                                               ServiceCategory category) {
    std::vector<BrowseResult> results;
    const dns::Labels service = serviceLabels(category);

    for (const auto& rr : message.records) {
        if (!rr.is(dns::RecordType::PTR) || rr.ttl == 0 || !dns::sameName(rr.name, service)) {
            continue;
        }
        if (rr.target.size() <= service.size() || !dns::endsWith(rr.target, service)) {
            continue;
        }

        BrowseResult result;
        result.category = category;
        dns::Labels instance(rr.target.begin(), rr.target.end() - service.size());
        result.name = instance.size() == 1 ? instance.front() : dns::joinName(instance);

        if (const auto* srv = findRecord(message, dns::RecordType::SRV, rr.target)) {
            result.host = dns::joinName(srv->target);
            result.port = srv->port;
            result.address = findAddress(message, srv->target);
        }
        if (const auto* txt = findRecord(message, dns::RecordType::TXT, rr.target)) {
            result.txt = txt->txt;
        }
        results.push_back(std::move(result));
    }
    return results;
}

// =============================================================================
// Resolution
// =============================================================================

ResolutionAttempt::ResolutionAttempt(BrowseResult result)
    : result_(std::move(result))
    , instance_(dns::splitName(dns::joinName({result_.name}) + "." +
                               serviceTypeOf(result_.category) + ".local"))
    , host_(dns::splitName(result_.host))
{
}

dns::Labels ResolutionAttempt::host() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return host_;
}

bool ResolutionAttempt::offer(const dns::Message& message) {
    if (outcome_.isSettled()) {
        return false;
    }
    dns::Labels host;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (host_.empty()) {
            if (const auto* srv = findRecord(message, dns::RecordType::SRV, instance_)) {
                host_ = srv->target;
            }
        }
        host = host_;
    }
    auto address = findAddress(message, host);
    return address && outcome_.settle(address);
}

bool ResolutionAttempt::expire() {
    return outcome_.settle(std::nullopt);
}

std::optional<BrowseResult> ResolutionAttempt::resolved() {
    auto address = outcome_.wait();
    if (!address) {
        return std::nullopt;
    }
    BrowseResult result = result_;
    result.address = *address;
    if (result.host.empty()) {
        result.host = dns::joinName(host());
    }
    return result;
}

std::shared_ptr<ResolutionAttempt> ResolutionTracker::begin(const BrowseResult& result) {
    const std::string key = resultKey(result.category, result.name);

    std::lock_guard<std::mutex> lock(mutex_);
    if (attempts_.count(key) != 0) {
        return nullptr;
    }
    auto attempt = std::make_shared<ResolutionAttempt>(result);
    attempts_.emplace(key, attempt);
    return attempt;
}

size_t ResolutionTracker::offer(const dns::Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t settled = 0;
    for (auto& [key, attempt] : attempts_) {
        if (attempt->offer(message)) {
            ++settled;
        }
    }
    return settled;
}

size_t ResolutionTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_.size();
}

// =============================================================================
// Per-browse shared state
// =============================================================================

struct MdnsServiceBrowser::Session {
    explicit Session(const BrowseSink& s) : sink(s) {}

    const BrowseSink& sink;
    std::mutex sinkMutex;
    SteadyClock::time_point deadline;
    std::string interfaceName;

    ResolutionTracker tracker;
    std::mutex resolverMutex;    // guards resolvers
    std::vector<std::thread> resolvers;

    void emit(const BrowseResult& result) {
        std::lock_guard<std::mutex> lock(sinkMutex);
        sink(result);
    }
};

// =============================================================================
// MdnsServiceBrowser
// =============================================================================

MdnsServiceBrowser::MdnsServiceBrowser(MdnsBrowserConfig config)
    : config_(std::move(config))
{
}

MdnsServiceBrowser::~MdnsServiceBrowser() {
    cancel();
}

void MdnsServiceBrowser::cancel() {
    cancelled_.store(true);
}

void MdnsServiceBrowser::browse(const std::vector<ServiceCategory>& categories,
                                std::chrono::milliseconds window,
                                const BrowseSink& sink) {
    cancelled_.store(false);

    Session session(sink);
    session.deadline = SteadyClock::now() + window;
    session.interfaceName = config_.interfaceAddress.empty() ? "default" : config_.interfaceAddress;

    LOG_INFO("Browser", "Browsing {} categories for {}ms", categories.size(), window.count());

    std::vector<std::thread> workers;
    workers.reserve(categories.size());
    for (ServiceCategory category : categories) {
        workers.emplace_back(&MdnsServiceBrowser::browseCategory, this, category, std::ref(session));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // Category threads are gone, so nothing can add resolvers any more
    std::vector<std::thread> resolvers;
    {
        std::lock_guard<std::mutex> lock(session.resolverMutex);
        resolvers.swap(session.resolvers);
    }
    for (auto& resolver : resolvers) {
        resolver.join();
    }

    LOG_INFO("Browser", "Browse window closed ({} resolution attempts)", resolvers.size());
}

void MdnsServiceBrowser::browseCategory(ServiceCategory category, Session& session) {
    const char* type = serviceTypeOf(category);

    net::UdpSocket socket;
    socket.setReuseAddress(true);
    bool shared = socket.bind(dns::kMdnsPort);
    if (!shared && !socket.bind(0)) {
        LOG_WARN("Browser", "No socket for {}: error {}", type, socket.getLastError());
        return;
    }
    if (shared && !socket.joinMulticastGroup(dns::kMdnsGroup, config_.interfaceAddress)) {
        shared = false;
    }
    socket.setMulticastTTL(config_.multicastTtl);

    dns::Question question;
    question.name = serviceLabels(category);
    question.type = dns::RecordType::PTR;
    question.unicastResponse = !shared;
    const std::vector<uint8_t> query = dns::encodeQuery({question});
    const net::SocketAddress group(dns::kMdnsGroup, dns::kMdnsPort);

    // Query schedule: 0s, 1s, 3s, then every 5s
    auto nextQuery = SteadyClock::now();
    std::chrono::milliseconds backoff(1000);

    std::map<std::string, bool> seen;  // result key -> had address
    std::vector<uint8_t> buffer(kReceiveBufferSize);

    while (!cancelled_.load() && SteadyClock::now() < session.deadline) {
        if (SteadyClock::now() >= nextQuery) {
            if (socket.sendTo(group, query.data(), query.size()) < 0) {
                LOG_DEBUG("Browser", "Query for {} not sent: error {}", type, socket.getLastError());
            }
            nextQuery += backoff;
            backoff = std::min(backoff * 2, std::chrono::milliseconds(5000));
        }

        int waitMs = std::min({kPollSliceMs, millisUntil(session.deadline), millisUntil(nextQuery)});
        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(), std::max(waitMs, 1), sender);
        if (received < 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (received == 0) {
            continue;
        }

        auto message = dns::decodeMessage(buffer.data(), static_cast<size_t>(received));
        if (!message || !message->isResponse()) {
            continue;
        }

        session.tracker.offer(*message);

        for (auto& result : collectBrowseResults(*message, category)) {
            result.interfaceName = session.interfaceName;
            const std::string key = resultKey(category, result.name);
            auto it = seen.find(key);
            if (it != seen.end() && (it->second || !result.address)) {
                continue;
            }
            seen[key] = result.address.has_value();

            LOG_DEBUG("Browser", "{} {} from {}", type, result.name, sender.ip);
            session.emit(result);
            if (!result.address) {
                startResolution(result, session);
            }
        }
    }

    if (shared) {
        socket.leaveMulticastGroup(dns::kMdnsGroup, config_.interfaceAddress);
    }
}

void MdnsServiceBrowser::startResolution(const BrowseResult& result, Session& session) {
    auto attempt = session.tracker.begin(result);
    if (!attempt) {
        return;
    }
    std::lock_guard<std::mutex> lock(session.resolverMutex);
    session.resolvers.emplace_back(&MdnsServiceBrowser::resolveEndpoint, this,
                                   std::move(attempt), std::ref(session));
}

void MdnsServiceBrowser::resolveEndpoint(std::shared_ptr<ResolutionAttempt> attempt,
                                         Session& session) {
    const auto deadline = SteadyClock::now() + config_.resolveTimeout;
    const net::SocketAddress group(dns::kMdnsGroup, dns::kMdnsPort);

    net::UdpSocket socket;
    bool usable = socket.isValid() && socket.bind(0);

    auto ask = [&](const dns::Labels& name, dns::RecordType type) {
        dns::Question question;
        question.name = name;
        question.type = type;
        question.unicastResponse = true;
        auto query = dns::encodeQuery({question});
        if (!query.empty()) {
            socket.sendTo(group, query.data(), query.size());
        }
    };

    if (usable) {
        dns::Labels host = attempt->host();
        if (host.empty()) {
            ask(attempt->instance(), dns::RecordType::SRV);
        } else {
            ask(host, dns::RecordType::A);
        }
    }

    std::vector<uint8_t> buffer(kReceiveBufferSize);
    while (usable && !attempt->isSettled() && !cancelled_.load() &&
           SteadyClock::now() < deadline) {
        net::SocketAddress sender;
        int waitMs = std::min(kResolvePollSliceMs, millisUntil(deadline));
        int received = socket.receiveFrom(buffer.data(), buffer.size(), std::max(waitMs, 1), sender);
        if (received <= 0) {
            continue;
        }
        auto message = dns::decodeMessage(buffer.data(), static_cast<size_t>(received));
        if (!message || !message->isResponse()) {
            continue;
        }

        bool hadHost = !attempt->host().empty();
        if (attempt->offer(*message)) {
            break;
        }
        if (!hadHost) {
            dns::Labels host = attempt->host();
            if (!host.empty()) {
                ask(host, dns::RecordType::A);
            }
        }
    }

    // Deadline source; a no-op if an answer already settled it
    attempt->expire();
    auto resolved = attempt->resolved();

    if (!resolved) {
        LOG_DEBUG("Browser", "No address for {} within {}ms",
                  attempt->result().name, config_.resolveTimeout.count());
        return;
    }
    LOG_DEBUG("Browser", "Resolved {} -> {}", resolved->name, *resolved->address);
    session.emit(*resolved);
}

}  // namespace core
}  // namespace lanscope
