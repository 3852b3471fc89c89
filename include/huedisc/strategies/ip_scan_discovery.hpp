/**
 * @file ip_scan_discovery.hpp
 * @brief Probe a fixed list of common home-network addresses.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/strategies/export.hpp"
#include "huedisc/strategies/probe_scanner.hpp"

namespace huedisc {
namespace strategies {

struct HUEDISC_STRATEGIES_API IpScanOptions {
    ProbeScanOptions scan;
    std::chrono::milliseconds budget{15000};
    bool include_local_subnet = true;   ///< Also probe .2-.20 of the host's own /24
};

/**
 * @brief Low addresses that routers commonly hand out in popular home subnets.
 */
HUEDISC_STRATEGIES_API std::vector<std::string> defaultCandidateAddresses();

/**
 * @brief Fixed list followed by .2-.20 of the primary interface's /24,
 *        without duplicates and without the host's own address.
 */
HUEDISC_STRATEGIES_API std::vector<std::string> buildIpScanCandidates(const net::NetworkSnapshot& snapshot,
                                                                      bool includeLocalSubnet = true);

/**
 * @class IpScanDiscovery
 * @brief Last-resort strategy that needs nothing but HTTP reachability.
 */
class HUEDISC_STRATEGIES_API IpScanDiscovery final : public core::DiscoveryStrategy {
public:
    IpScanDiscovery(std::shared_ptr<core::BridgeProber> prober,
                    IpScanOptions options = IpScanOptions(),
                    SnapshotProvider snapshots = net::captureNetworkSnapshot);

    std::string name() const override { return "ip-scan"; }
    std::chrono::milliseconds budget() const override { return options_.budget; }
    std::vector<core::BridgeRecord> run(const core::StrategyContext& context) override;

private:
    IpScanOptions options_;
    ProbeScanner scanner_;
    SnapshotProvider snapshots_;
};

}  // namespace strategies
}  // namespace huedisc
