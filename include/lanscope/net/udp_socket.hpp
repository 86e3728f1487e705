/**
 * @file udp_socket.hpp
 * @brief UDP socket with multicast group membership.
 *
 * Used by the mDNS browser both for the shared 5353 listener and for
 * the short-lived per-service resolution queries.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/net/export.hpp"
#include "lanscope/net/platform.hpp"

#include <cstdint>
#include <string>

namespace lanscope {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct LANSCOPE_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII IPv4 UDP socket.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(5353);
 * sock.joinMulticastGroup("224.0.0.251");
 *
 * std::vector<uint8_t> buffer(9000);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 250, sender);
 * @endcode
 */
class LANSCOPE_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local port (0 = ephemeral).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Local port after bind(), or 0 if unbound.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief SO_REUSEADDR plus SO_REUSEPORT where available. Call before bind().
     *
     * Needed to share 5353 with a system mDNS responder.
     */
    bool setReuseAddress(bool enable);

    bool setMulticastTTL(int ttl);
    bool setMulticastLoopback(bool enable);

    /**
     * @brief Join a multicast group on the given interface (empty = any).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @return Bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs 0 = poll once, -1 = block.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    template <typename T>
    bool setOption(int level, int name, const T& value);

    bool updateMembership(int option, const std::string& groupAddress,
                          const std::string& interfaceAddress);

    void setLastError();
};

}  // namespace net
}  // namespace lanscope
