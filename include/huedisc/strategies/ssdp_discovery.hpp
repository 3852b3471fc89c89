/**
 * @file ssdp_discovery.hpp
 * @brief UPnP SSDP M-SEARCH for bridges on the local segment.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_probe.hpp"
#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/strategies/export.hpp"

#include <optional>

namespace huedisc {
namespace strategies {

struct HUEDISC_STRATEGIES_API SsdpOptions {
    std::string target_address = "239.255.255.250";
    uint16_t target_port = 1900;
    std::vector<std::string> search_targets = {
        "urn:schemas-upnp-org:device:basic:1",
        "upnp:rootdevice",
        "urn:schemas-upnp-org:device:IpBridge:1",
    };
    int mx = 3;                                      ///< Max response delay requested from devices
    int multicast_ttl = 2;
    std::string interface_address;                   ///< Outgoing interface for M-SEARCH (empty = kernel default)
    std::chrono::milliseconds window{5000};          ///< How long replies are collected
    std::chrono::milliseconds location_timeout{3000}; ///< Per LOCATION fetch
};

/**
 * @brief Build an M-SEARCH request for one search target.
 */
HUEDISC_STRATEGIES_API std::string buildMSearchRequest(const std::string& searchTarget,
                                                      int mx,
                                                      const std::string& host,
                                                      uint16_t port);

/**
 * @brief Value of the LOCATION header (name matched case-insensitively).
 */
HUEDISC_STRATEGIES_API std::optional<std::string> extractLocationHeader(const std::string& response);

/**
 * @brief Whether an SSDP reply may come from a Hue Bridge ("IpBridge" or "hue").
 */
HUEDISC_STRATEGIES_API bool looksLikeHueResponse(const std::string& response);

/**
 * @class SsdpDiscovery
 * @brief Collects LOCATION URLs from SSDP replies and validates each one.
 */
class HUEDISC_STRATEGIES_API SsdpDiscovery final : public core::DiscoveryStrategy {
public:
    SsdpDiscovery(std::shared_ptr<core::BridgeProber> prober, SsdpOptions options = SsdpOptions());

    std::string name() const override { return "ssdp"; }
    std::chrono::milliseconds budget() const override;
    std::vector<core::BridgeRecord> run(const core::StrategyContext& context) override;

private:
    std::vector<std::string> collectLocations(const core::StrategyContext& context);

    std::shared_ptr<core::BridgeProber> prober_;
    SsdpOptions options_;
};

}  // namespace strategies
}  // namespace huedisc
