/**
 * @file port_prober.cpp
 * @brief TcpConnectProber implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/port_prober.hpp"
#include "lanscope/net/platform.hpp"
#include "lanscope/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <thread>

namespace lanscope {
namespace core {

const std::vector<uint16_t>& homeKitPorts() {
    static const std::vector<uint16_t> ports = {80, 443, 5000, 7000, 8080, 49152};
    return ports;
}

TcpConnectProber::TcpConnectProber(std::chrono::milliseconds timeout, size_t maxWorkers)
    : timeout_(timeout)
    , maxWorkers_(std::max<size_t>(maxWorkers, 1))
{
}

bool TcpConnectProber::isPortOpen(const std::string& address, uint16_t port) const {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LOG_DEBUG("PortProber", "Skipping non-IPv4 address {}", address);
        return false;
    }

    net::UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        LOG_WARN("PortProber", "socket() failed: {}", std::strerror(errno));
        return false;
    }
    if (!net::setNonBlocking(fd.get())) {
        return false;
    }

    int rc = ::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = fd.get();
    pfd.events = POLLOUT;

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    if (rc <= 0) {
        return false;
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
        return false;
    }
    return error == 0;
}

PortMap TcpConnectProber::probe(const std::vector<std::string>& addresses,
                                const std::vector<uint16_t>& ports,
                                const Progress& progress) {
    PortMap result;
    for (const auto& address : addresses) {
        result[address];
    }
    if (addresses.empty()) {
        if (progress) {
            progress(1.0);
        }
        return result;
    }

    std::mutex resultMutex;
    std::atomic<size_t> next{0};
    size_t finished = 0;

    // One work item per address keeps progress per-device
    auto worker = [&]() {
        while (true) {
            size_t index = next.fetch_add(1);
            if (index >= addresses.size()) {
                break;
            }
            const std::string& address = addresses[index];
            std::set<uint16_t> open;
            for (uint16_t port : ports) {
                if (isPortOpen(address, port)) {
                    open.insert(port);
                }
            }

            std::lock_guard<std::mutex> lock(resultMutex);
            result[address] = std::move(open);
            ++finished;
            if (progress) {
                progress(static_cast<double>(finished) / addresses.size());
            }
        }
    };

    size_t workerCount = std::min(maxWorkers_, addresses.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    size_t openCount = 0;
    for (const auto& [address, open] : result) {
        openCount += open.size();
    }
    LOG_INFO("PortProber", "Probed {} addresses, {} open ports", addresses.size(), openCount);
    return result;
}

}  // namespace core
}  // namespace lanscope
