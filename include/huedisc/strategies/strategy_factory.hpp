/**
 * @file strategy_factory.hpp
 * @brief Resolves platform capabilities and assembles the strategy set.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/discovery_coordinator.hpp"
#include "huedisc/net/http_client.hpp"
#include "huedisc/strategies/cloud_discovery.hpp"
#include "huedisc/strategies/export.hpp"
#include "huedisc/strategies/ip_scan_discovery.hpp"
#include "huedisc/strategies/mdns_discovery.hpp"
#include "huedisc/strategies/smart_discovery.hpp"
#include "huedisc/strategies/ssdp_discovery.hpp"

namespace huedisc {
namespace strategies {

/**
 * @struct PlatformCapabilities
 * @brief Features resolved once at startup.
 */
struct HUEDISC_STRATEGIES_API PlatformCapabilities {
    bool mdns = false;
};

/**
 * @brief mDNS is available when built with Avahi and not disabled.
 */
HUEDISC_STRATEGIES_API PlatformCapabilities detectPlatformCapabilities(bool disableMdns = false);

/**
 * @struct DiscoveryOptions
 * @brief Everything configurable about a discovery engine.
 */
struct HUEDISC_STRATEGIES_API DiscoveryOptions {
    core::CoordinatorConfig coordinator;
    CloudOptions cloud;
    MdnsOptions mdns;
    SsdpOptions ssdp;
    IpScanOptions ip_scan;
    SmartOptions smart;
    bool enable_ssdp = false;   ///< Add SSDP to the fallback stage
};

/**
 * @brief Build the tagged strategy set.
 *
 * With mDNS: concurrent fan-out, fast path [mDNS, Cloud], fallback
 * [Smart, IP Scan]. Without: sequential fallback, fast path [Cloud],
 * then Smart, then IP Scan. SSDP joins the fallback when enabled.
 */
HUEDISC_STRATEGIES_API core::StrategySet buildStrategySet(const DiscoveryOptions& options,
                                                          const PlatformCapabilities& capabilities,
                                                          net::HttpClientPtr http);

}  // namespace strategies
}  // namespace huedisc
