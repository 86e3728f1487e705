/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/net/udp_socket.hpp"
#include "lanscope/utils/logger.hpp"

#include <cstring>

namespace lanscope {
namespace net {

namespace {

bool parseAddress(const std::string& text, struct in_addr& out) {
    if (text.empty() || text == "0.0.0.0") {
        out.s_addr = INADDR_ANY;
        return true;
    }
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: {}", std::strerror(lastError_));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

template <typename T>
bool UdpSocket::setOption(int level, int name, const T& value) {
    if (!isValid()) {
        return false;
    }
    if (setsockopt(socket_, level, name, &value, sizeof(value)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseAddress(address, addr.sin_addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_DEBUG("UdpSocket", "Bind to {}:{} failed: {}",
                  address, port, std::strerror(lastError_));
        return false;
    }

    LOG_TRACE("UdpSocket", "Bound to {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    int optval = enable ? 1 : 0;
    if (!setOption(SOL_SOCKET, SO_REUSEADDR, optval)) {
        return false;
    }
#ifdef SO_REUSEPORT
    // Best effort: some kernels refuse SO_REUSEPORT for unprivileged sockets
    setOption(SOL_SOCKET, SO_REUSEPORT, optval);
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char value = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, value);
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    unsigned char value = enable ? 1 : 0;
    return setOption(IPPROTO_IP, IP_MULTICAST_LOOP, value);
}

bool UdpSocket::updateMembership(int option, const std::string& groupAddress,
                                 const std::string& interfaceAddress) {
    if (!isValid()) {
        return false;
    }

    struct ip_mreq mreq{};
    if (inet_pton(AF_INET, groupAddress.c_str(), &mreq.imr_multiaddr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid multicast group address: {}", groupAddress);
        return false;
    }
    if (!parseAddress(interfaceAddress, mreq.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    if (!interfaceAddress.empty() && option == IP_ADD_MEMBERSHIP) {
        setOption(IPPROTO_IP, IP_MULTICAST_IF, mreq.imr_interface);
    }
    return setOption(IPPROTO_IP, option, mreq);
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    if (!updateMembership(IP_ADD_MEMBERSHIP, groupAddress, interfaceAddress)) {
        LOG_WARN("UdpSocket", "Failed to join multicast group {}: {}",
                 groupAddress, std::strerror(lastError_));
        return false;
    }
    LOG_DEBUG("UdpSocket", "Joined multicast group {}", groupAddress);
    return true;
}

bool UdpSocket::leaveMulticastGroup(const std::string& groupAddress,
                                    const std::string& interfaceAddress) {
    if (!updateMembership(IP_DROP_MEMBERSHIP, groupAddress, interfaceAddress)) {
        return false;
    }
    LOG_DEBUG("UdpSocket", "Left multicast group {}", groupAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    struct pollfd pfd{};
    pfd.fd = socket_;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready < 0) {
        setLastError();
        return lastError_ == EINTR ? 0 : -1;
    }
    if (ready == 0) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    if (result < 0) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    sender.ip = ipStr;
    sender.port = ntohs(addr.sin_port);

    return static_cast<int>(result);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace lanscope
