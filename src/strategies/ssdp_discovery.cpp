/**
 * @file ssdp_discovery.cpp
 * @brief SsdpDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/ssdp_discovery.hpp"
#include "huedisc/core/bridge_registry.hpp"
#include "huedisc/net/udp_socket.hpp"
#include "huedisc/utils/logger.hpp"
#include "huedisc/utils/string_utils.hpp"

#include <algorithm>
#include <sstream>

namespace huedisc {
namespace strategies {

namespace {

constexpr size_t kReceiveBufferSize = 2048;
constexpr int kReceivePollMs = 200;

}  // namespace

std::string buildMSearchRequest(const std::string& searchTarget,
                                int mx,
                                const std::string& host,
                                uint16_t port) {
    std::ostringstream request;
    request << "M-SEARCH * HTTP/1.1\r\n"
            << "HOST: " << host << ":" << port << "\r\n"
            << "MAN: \"ssdp:discover\"\r\n"
            << "MX: " << mx << "\r\n"
            << "ST: " << searchTarget << "\r\n"
            << "\r\n";
    return request.str();
}

std::optional<std::string> extractLocationHeader(const std::string& response) {
    std::istringstream stream(response);
    std::string line;
    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (utils::to_lower(utils::trim(line.substr(0, colon))) != "location") {
            continue;
        }
        std::string value = utils::trim(line.substr(colon + 1));
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

bool looksLikeHueResponse(const std::string& response) {
    return utils::icontains(response, "ipbridge") || utils::icontains(response, "hue");
}

SsdpDiscovery::SsdpDiscovery(std::shared_ptr<core::BridgeProber> prober, SsdpOptions options)
    : prober_(std::move(prober))
    , options_(std::move(options))
{
}

std::chrono::milliseconds SsdpDiscovery::budget() const {
    return options_.window + options_.location_timeout * 2;
}

std::vector<std::string> SsdpDiscovery::collectLocations(const core::StrategyContext& context) {
    std::vector<std::string> locations;

    net::UdpSocket socket;
    if (!socket.isValid() || !socket.bind(0)) {
        LOG_WARN("Ssdp", "Cannot open UDP socket (error {})", socket.getLastError());
        return locations;
    }
    if (!socket.setMulticastTTL(options_.multicast_ttl)) {
        LOG_DEBUG("Ssdp", "Could not set multicast TTL {}, using default", options_.multicast_ttl);
    }
    if (!options_.interface_address.empty() &&
        !socket.setMulticastInterface(options_.interface_address)) {
        LOG_WARN("Ssdp", "Cannot send M-SEARCH through interface {}", options_.interface_address);
        return locations;
    }

    net::SocketAddress target(options_.target_address, options_.target_port);
    for (const auto& st : options_.search_targets) {
        std::string request = buildMSearchRequest(st, options_.mx,
                                                  options_.target_address, options_.target_port);
        if (socket.sendTo(target, request.data(), request.size()) < 0) {
            LOG_WARN("Ssdp", "M-SEARCH for {} not sent (error {})", st, socket.getLastError());
        }
    }

    auto windowEnd = std::min(std::chrono::steady_clock::now() + options_.window, context.deadline);
    char buffer[kReceiveBufferSize];

    while (!context.token.isCancelled()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            windowEnd - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            break;
        }

        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer, sizeof(buffer),
                                          static_cast<int>(std::min<long long>(left, kReceivePollMs)),
                                          sender);
        if (received < 0) {
            LOG_WARN("Ssdp", "Receive failed (error {})", socket.getLastError());
            break;
        }
        if (received == 0) {
            continue;
        }

        std::string reply(buffer, static_cast<size_t>(received));
        if (!looksLikeHueResponse(reply)) {
            continue;
        }
        auto location = extractLocationHeader(reply);
        if (!location) {
            LOG_DEBUG("Ssdp", "Reply from {} without LOCATION", sender.toString());
            continue;
        }
        if (std::find(locations.begin(), locations.end(), *location) == locations.end()) {
            LOG_DEBUG("Ssdp", "Candidate {} from {}", *location, sender.toString());
            locations.push_back(*location);
        }
    }
    return locations;
}

std::vector<core::BridgeRecord> SsdpDiscovery::run(const core::StrategyContext& context) {
    auto locations = collectLocations(context);
    if (locations.empty()) {
        LOG_INFO("Ssdp", "No Hue replies to M-SEARCH");
        return {};
    }

    core::BridgeRegistry found;
    for (const auto& location : locations) {
        auto timeout = std::min(options_.location_timeout, context.remaining());
        if (context.shouldStop() || timeout.count() <= 0) {
            break;
        }
        if (auto record = prober_->validateLocation(location, timeout, context.token)) {
            found.add(*record);
        }
    }

    LOG_INFO("Ssdp", "{} of {} location(s) validated as bridges", found.size(), locations.size());
    return found.snapshot();
}

}  // namespace strategies
}  // namespace huedisc
