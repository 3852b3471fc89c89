/**
 * @file interface_info.hpp
 * @brief Local IPv4 interface and default gateway inspection.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace huedisc {
namespace net {

/**
 * @struct Ipv4Interface
 * @brief One IPv4 address assigned to a local interface.
 */
struct HUEDISC_NET_API Ipv4Interface {
    std::string name;
    std::string address;
    std::string netmask;
    bool is_up = false;
    bool is_loopback = false;
};

/**
 * @struct NetworkSnapshot
 * @brief Interface configuration captured at the start of a scan.
 */
struct HUEDISC_NET_API NetworkSnapshot {
    std::optional<Ipv4Interface> primary;   ///< Interface used to reach the LAN
    std::optional<std::string> gateway;     ///< Default IPv4 gateway, if any
};

/**
 * @brief Parse a dotted-quad IPv4 address.
 * @return Address in host byte order, or std::nullopt if malformed.
 */
HUEDISC_NET_API std::optional<uint32_t> parseIpv4(const std::string& text);

/**
 * @brief Format a host-byte-order IPv4 address as a dotted quad.
 */
HUEDISC_NET_API std::string formatIpv4(uint32_t address);

/**
 * @brief RFC 1918 private ranges (10/8, 172.16/12, 192.168/16).
 */
HUEDISC_NET_API bool isPrivateIpv4(const std::string& address);

/**
 * @brief Enumerate IPv4 addresses on local interfaces (getifaddrs).
 */
HUEDISC_NET_API std::vector<Ipv4Interface> listIpv4Interfaces();

/**
 * @brief Extract the default gateway from Linux /proc/net/route text.
 * @param routeTable Full contents of the routing table file.
 * @param interfaceName Receives the gateway's interface name when non-null.
 */
HUEDISC_NET_API std::optional<std::string> parseDefaultGateway(const std::string& routeTable,
                                                               std::string* interfaceName = nullptr);

/**
 * @brief Pick the interface that most likely faces the bridge's LAN.
 *
 * Prefers the interface carrying the default route, then the first up,
 * non-loopback interface with a private address, then any up non-loopback
 * interface.
 */
HUEDISC_NET_API std::optional<Ipv4Interface> choosePrimaryInterface(
    const std::vector<Ipv4Interface>& interfaces,
    const std::string& gatewayInterface);

/**
 * @brief Capture the primary interface and default gateway of this host.
 */
HUEDISC_NET_API NetworkSnapshot captureNetworkSnapshot();

}  // namespace net
}  // namespace huedisc
