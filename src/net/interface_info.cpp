/**
 * @file interface_info.cpp
 * @brief Interface enumeration via getifaddrs and /proc/net/route parsing.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/net/interface_info.hpp"
#include "huedisc/net/platform.hpp"
#include "huedisc/utils/logger.hpp"

#include <ifaddrs.h>
#include <net/if.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace huedisc {
namespace net {

namespace {

constexpr const char* kRouteTablePath = "/proc/net/route";
constexpr unsigned long kRouteFlagUp = 0x0001;
constexpr unsigned long kRouteFlagGateway = 0x0002;

std::string sockaddrToString(const sockaddr* addr) {
    char buffer[INET_ADDRSTRLEN] = {0};
    const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
        return "";
    }
    return buffer;
}

}  // namespace

std::optional<uint32_t> parseIpv4(const std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string formatIpv4(uint32_t address) {
    std::ostringstream oss;
    oss << ((address >> 24) & 0xFF) << '.'
        << ((address >> 16) & 0xFF) << '.'
        << ((address >> 8) & 0xFF) << '.'
        << (address & 0xFF);
    return oss.str();
}

bool isPrivateIpv4(const std::string& address) {
    auto parsed = parseIpv4(address);
    if (!parsed) {
        return false;
    }
    uint32_t ip = *parsed;
    return (ip & 0xFF000000u) == 0x0A000000u ||   // 10.0.0.0/8
           (ip & 0xFFF00000u) == 0xAC100000u ||   // 172.16.0.0/12
           (ip & 0xFFFF0000u) == 0xC0A80000u;     // 192.168.0.0/16
}

std::vector<Ipv4Interface> listIpv4Interfaces() {
    std::vector<Ipv4Interface> result;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_WARN("Network", "getifaddrs failed: error {}", getLastSocketError());
        return result;
    }

    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        Ipv4Interface iface;
        iface.name = it->ifa_name ? it->ifa_name : "";
        iface.address = sockaddrToString(it->ifa_addr);
        if (it->ifa_netmask != nullptr) {
            iface.netmask = sockaddrToString(it->ifa_netmask);
        }
        iface.is_up = (it->ifa_flags & IFF_UP) != 0;
        iface.is_loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
        if (!iface.address.empty()) {
            result.push_back(std::move(iface));
        }
    }

    freeifaddrs(list);
    return result;
}

std::optional<std::string> parseDefaultGateway(const std::string& routeTable,
                                               std::string* interfaceName) {
    std::istringstream stream(routeTable);
    std::string line;

    // Header: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flagsText;
        if (!(fields >> iface >> destination >> gateway >> flagsText)) {
            continue;
        }
        if (destination != "00000000") {
            continue;
        }

        char* end = nullptr;
        unsigned long flags = std::strtoul(flagsText.c_str(), &end, 16);
        if (end == flagsText.c_str() ||
            (flags & (kRouteFlagUp | kRouteFlagGateway)) != (kRouteFlagUp | kRouteFlagGateway)) {
            continue;
        }

        unsigned long raw = std::strtoul(gateway.c_str(), &end, 16);
        if (end == gateway.c_str() || raw == 0) {
            continue;
        }

        // The kernel prints the address in network byte order as a native integer.
        in_addr addr{};
        addr.s_addr = static_cast<in_addr_t>(raw);
        if (interfaceName != nullptr) {
            *interfaceName = iface;
        }
        return formatIpv4(ntohl(addr.s_addr));
    }

    return std::nullopt;
}

std::optional<Ipv4Interface> choosePrimaryInterface(
    const std::vector<Ipv4Interface>& interfaces,
    const std::string& gatewayInterface) {

    const Ipv4Interface* anyUp = nullptr;
    const Ipv4Interface* privateUp = nullptr;

    for (const auto& iface : interfaces) {
        if (!iface.is_up || iface.is_loopback) {
            continue;
        }
        if (!gatewayInterface.empty() && iface.name == gatewayInterface) {
            return iface;
        }
        if (privateUp == nullptr && isPrivateIpv4(iface.address)) {
            privateUp = &iface;
        }
        if (anyUp == nullptr) {
            anyUp = &iface;
        }
    }

    if (privateUp != nullptr) {
        return *privateUp;
    }
    if (anyUp != nullptr) {
        return *anyUp;
    }
    return std::nullopt;
}

NetworkSnapshot captureNetworkSnapshot() {
    NetworkSnapshot snapshot;

    std::string gatewayInterface;
    std::ifstream routes(kRouteTablePath);
    if (routes) {
        std::stringstream contents;
        contents << routes.rdbuf();
        snapshot.gateway = parseDefaultGateway(contents.str(), &gatewayInterface);
    } else {
        LOG_DEBUG("Network", "{} not readable, gateway unknown", kRouteTablePath);
    }

    snapshot.primary = choosePrimaryInterface(listIpv4Interfaces(), gatewayInterface);

    LOG_DEBUG("Network", "Primary interface: {} ({}), gateway: {}",
              snapshot.primary ? snapshot.primary->name : std::string("none"),
              snapshot.primary ? snapshot.primary->address : std::string("-"),
              snapshot.gateway ? *snapshot.gateway : std::string("unknown"));
    return snapshot;
}

}  // namespace net
}  // namespace huedisc
