/**
 * @file smart_discovery.hpp
 * @brief Probe addresses derived from the live interface configuration.
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

struct HUEDISC_STRATEGIES_API SmartOptions {
    SmartOptions() {
        scan.attempts = 1;
        scan.probe.config_timeout = std::chrono::milliseconds(2000);
        scan.probe.description_timeout = std::chrono::milliseconds(2000);
    }

    ProbeScanOptions scan;
    std::chrono::milliseconds budget{15000};
    int gateway_window = 10;   ///< Addresses probed on each side of the gateway
};

/**
 * @brief Candidate list for the host's /24.
 *
 * Priority host numbers (1-10, 20-25, 50-55, 100-105, 200-205) first,
 * then the addresses within @p gatewayWindow of the default gateway.
 * The host's own address is never included. Empty when there is no
 * usable IPv4 interface.
 */
HUEDISC_STRATEGIES_API std::vector<std::string> deriveSmartCandidates(const net::NetworkSnapshot& snapshot,
                                                                      int gatewayWindow = 10);

/**
 * @class SmartDiscovery
 * @brief Targeted scan of the addresses a DHCP server most likely assigned.
 */
class HUEDISC_STRATEGIES_API SmartDiscovery final : public core::DiscoveryStrategy {
public:
    SmartDiscovery(std::shared_ptr<core::BridgeProber> prober,
                   SmartOptions options = SmartOptions(),
                   SnapshotProvider snapshots = net::captureNetworkSnapshot);

    std::string name() const override { return "smart"; }
    std::chrono::milliseconds budget() const override { return options_.budget; }
    std::vector<core::BridgeRecord> run(const core::StrategyContext& context) override;

private:
    SmartOptions options_;
    ProbeScanner scanner_;
    SnapshotProvider snapshots_;
};

}  // namespace strategies
}  // namespace huedisc
