/**
 * @file smart_discovery.cpp
 * @brief SmartDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/smart_discovery.hpp"
#include "huedisc/utils/logger.hpp"

namespace huedisc {
namespace strategies {

namespace {

struct HostRange {
    uint32_t first;
    uint32_t last;
};

const HostRange kPriorityHosts[] = {
    {1, 10}, {20, 25}, {50, 55}, {100, 105}, {200, 205},
};

}  // namespace

std::vector<std::string> deriveSmartCandidates(const net::NetworkSnapshot& snapshot,
                                               int gatewayWindow) {
    std::vector<std::string> candidates;
    if (!snapshot.primary) {
        return candidates;
    }

    const std::string& self = snapshot.primary->address;
    auto own = net::parseIpv4(self);
    if (!own) {
        return candidates;
    }

    uint32_t base = *own & 0xFFFFFF00u;
    for (const auto& range : kPriorityHosts) {
        for (uint32_t host = range.first; host <= range.last; ++host) {
            appendCandidate(candidates, net::formatIpv4(base | host), self);
        }
    }

    if (snapshot.gateway) {
        if (auto gateway = net::parseIpv4(*snapshot.gateway)) {
            uint32_t gatewayBase = *gateway & 0xFFFFFF00u;
            int gatewayHost = static_cast<int>(*gateway & 0xFFu);
            for (int offset = -gatewayWindow; offset <= gatewayWindow; ++offset) {
                int host = gatewayHost + offset;
                if (offset == 0 || host < 1 || host > 254) {
                    continue;
                }
                appendCandidate(candidates,
                                net::formatIpv4(gatewayBase | static_cast<uint32_t>(host)), self);
            }
        }
    }

    return candidates;
}

SmartDiscovery::SmartDiscovery(std::shared_ptr<core::BridgeProber> prober,
                               SmartOptions options,
                               SnapshotProvider snapshots)
    : options_(options)
    , scanner_(std::move(prober), options.scan)
    , snapshots_(std::move(snapshots))
{
}

std::vector<core::BridgeRecord> SmartDiscovery::run(const core::StrategyContext& context) {
    if (!snapshots_) {
        return {};
    }
    net::NetworkSnapshot snapshot = snapshots_();
    if (!snapshot.primary) {
        LOG_INFO("Smart", "No usable IPv4 interface, skipping");
        return {};
    }

    auto candidates = deriveSmartCandidates(snapshot, options_.gateway_window);
    LOG_INFO("Smart", "Probing {} address(es) around {} (gateway {})",
             candidates.size(), snapshot.primary->address,
             snapshot.gateway ? *snapshot.gateway : std::string("unknown"));

    auto bridges = scanner_.scan(candidates, context, "Smart");
    if (bridges.empty()) {
        LOG_INFO("Smart", "No bridge among derived candidates");
    }
    return bridges;
}

}  // namespace strategies
}  // namespace huedisc
