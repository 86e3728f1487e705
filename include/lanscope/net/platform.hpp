/**
 * @file platform.hpp
 * @brief POSIX socket and file-descriptor helpers.
 *
 * LanScope spawns child processes and probes TCP ports, both of which
 * rely on POSIX primitives, so only POSIX targets are supported.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

namespace lanscope {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

/**
 * @brief Put a descriptor into non-blocking mode.
 */
inline bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/**
 * @brief Check that a string is a dotted-quad IPv4 address.
 */
inline bool isIPv4Address(const std::string& text) {
    struct in_addr addr{};
    return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

/**
 * @class UniqueFd
 * @brief Owns a file descriptor and closes it on destruction.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}  // namespace net
}  // namespace lanscope
