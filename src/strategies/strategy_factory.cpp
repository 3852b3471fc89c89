/**
 * @file strategy_factory.cpp
 * @brief Strategy set assembly.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/strategy_factory.hpp"
#include "huedisc/utils/logger.hpp"

namespace huedisc {
namespace strategies {

PlatformCapabilities detectPlatformCapabilities(bool disableMdns) {
    PlatformCapabilities caps;
#if defined(HUEDISC_HAVE_AVAHI)
    caps.mdns = !disableMdns;
#else
    if (!disableMdns) {
        LOG_DEBUG("Strategies", "Built without Avahi, mDNS unavailable");
    }
#endif
    return caps;
}

core::StrategySet buildStrategySet(const DiscoveryOptions& options,
                                   const PlatformCapabilities& capabilities,
                                   net::HttpClientPtr http) {
    auto prober = std::make_shared<core::BridgeProber>(http);

    core::StrategySet set;
    set.mode = capabilities.mdns ? core::DiscoveryMode::ConcurrentFanOut
                                 : core::DiscoveryMode::SequentialFallback;

#if defined(HUEDISC_HAVE_AVAHI)
    if (capabilities.mdns) {
        set.fast_path.push_back(std::make_shared<MdnsDiscovery>(options.mdns));
    }
#endif
    set.fast_path.push_back(std::make_shared<CloudDiscovery>(http, options.cloud));

    set.fallback.push_back(std::make_shared<SmartDiscovery>(prober, options.smart));
    set.fallback.push_back(std::make_shared<IpScanDiscovery>(prober, options.ip_scan));
    if (options.enable_ssdp) {
        set.fallback.push_back(std::make_shared<SsdpDiscovery>(prober, options.ssdp));
    }

    LOG_INFO("Strategies", "Mode {}: {} fast-path, {} fallback strategies",
             core::toString(set.mode), set.fast_path.size(), set.fallback.size());
    return set;
}

}  // namespace strategies
}  // namespace huedisc
