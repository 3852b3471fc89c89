/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket used for SSDP searches.
 *
 * Unicast and multicast sends, multicast TTL/interface selection and a
 * select()-based receive with timeout.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/net/export.hpp"
#include "huedisc/net/platform.hpp"

#include <cstdint>
#include <string>

namespace huedisc {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct HUEDISC_NET_API SocketAddress {
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
 * @brief Owning wrapper around an IPv4 datagram socket.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(0);
 * sock.setMulticastTTL(2);
 * sock.sendTo(SocketAddress("239.255.255.250", 1900), req.data(), req.size());
 *
 * char buffer[2048];
 * SocketAddress sender;
 * int n = sock.receiveFrom(buffer, sizeof(buffer), 250, sender);
 * @endcode
 */
class HUEDISC_NET_API UdpSocket {
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
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Port the socket is bound to, or 0 if unbound.
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Multicast hop limit (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Outgoing interface for multicast packets (empty = kernel default).
     */
    bool setMulticastInterface(const std::string& interfaceAddress);

    /**
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs 0 = poll, negative = block.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    template<typename T>
    bool setOption(int level, int name, const T& value);

    SocketHandle socket_;
    int lastError_;
};

}  // namespace net
}  // namespace huedisc
