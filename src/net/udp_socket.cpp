/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/net/udp_socket.hpp"
#include "huedisc/utils/logger.hpp"

#include <cstring>

namespace huedisc {
namespace net {

namespace {

bool toSockaddr(const std::string& ip, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        out.sin_addr.s_addr = INADDR_ANY;
        return true;
    }
    return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = getLastSocketError();
        LOG_ERROR("UdpSocket", "Failed to create socket: error {}", lastError_);
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

template<typename T>
bool UdpSocket::setOption(int level, int name, const T& value) {
    if (!isValid()) {
        return false;
    }
    if (setsockopt(socket_, level, name, &value, sizeof(value)) != 0) {
        lastError_ = getLastSocketError();
        return false;
    }
    return true;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    sockaddr_in addr{};
    if (!toSockaddr(address, port, addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        lastError_ = getLastSocketError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - error {}",
                  address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", address, getLocalPort());
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char ttlVal = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, ttlVal);
}

bool UdpSocket::setMulticastInterface(const std::string& interfaceAddress) {
    in_addr addr{};
    if (interfaceAddress.empty()) {
        addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, interfaceAddress.c_str(), &addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, IP_MULTICAST_IF, addr);
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    sockaddr_in addr{};
    if (dest.ip.empty() || !toSockaddr(dest.ip, dest.port, addr)) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (result < 0) {
        lastError_ = getLastSocketError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socket_, &readSet);

        timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;

        int ready = ::select(socket_ + 1, &readSet, nullptr, nullptr, &tv);
        if (ready < 0) {
            lastError_ = getLastSocketError();
            // A signal interrupting select() is not a socket failure.
            return lastError_ == EINTR ? 0 : -1;
        }
        if (ready == 0) {
            return 0;
        }
    }

    sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<sockaddr*>(&addr), &addrLen);
    if (result < 0) {
        lastError_ = getLastSocketError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN] = {0};
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

}  // namespace net
}  // namespace huedisc
