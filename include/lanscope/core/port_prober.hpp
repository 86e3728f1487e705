/**
 * @file port_prober.hpp
 * @brief Open-port enrichment for discovered addresses.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace lanscope {
namespace core {

/// address -> open ports, ascending
using PortMap = std::map<std::string, std::set<uint16_t>>;

/**
 * @brief Ports probed on every discovered accessory.
 *
 * 80, 443, 5000, 7000, 8080 and 49152.
 */
LANSCOPE_CORE_API const std::vector<uint16_t>& homeKitPorts();

/**
 * @class PortProber
 * @brief Supplies the open-port list of a set of addresses.
 */
class LANSCOPE_CORE_API PortProber {
public:
    /// Fraction of addresses finished, 0.0 to 1.0.
    using Progress = std::function<void(double)>;

    virtual ~PortProber() = default;

    /**
     * @brief Probe every (address, port) pair.
     *
     * Every input address appears in the result, possibly with an
     * empty set.
     */
    virtual PortMap probe(const std::vector<std::string>& addresses,
                          const std::vector<uint16_t>& ports,
                          const Progress& progress = nullptr) = 0;
};

/**
 * @class TcpConnectProber
 * @brief PortProber using non-blocking connect() and poll().
 *
 * A port is open when the connection completes within the timeout.
 * Refused, unreachable and timed out connections count as closed.
 */
class LANSCOPE_CORE_API TcpConnectProber : public PortProber {
public:
    explicit TcpConnectProber(std::chrono::milliseconds timeout = std::chrono::milliseconds(500),
                              size_t maxWorkers = 16);

    PortMap probe(const std::vector<std::string>& addresses,
                  const std::vector<uint16_t>& ports,
                  const Progress& progress = nullptr) override;

    /**
     * @brief Single connect attempt.
     */
    bool isPortOpen(const std::string& address, uint16_t port) const;

private:
    std::chrono::milliseconds timeout_;
    size_t maxWorkers_;
};

}  // namespace core
}  // namespace lanscope
