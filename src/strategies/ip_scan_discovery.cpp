/**
 * @file ip_scan_discovery.cpp
 * @brief IpScanDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/ip_scan_discovery.hpp"
#include "huedisc/utils/logger.hpp"

namespace huedisc {
namespace strategies {

namespace {

struct SubnetHosts {
    const char* prefix;
    std::vector<int> hosts;
};

}  // namespace

std::vector<std::string> defaultCandidateAddresses() {
    static const SubnetHosts kSubnets[] = {
        {"192.168.1.",   {2, 3, 4, 5, 6, 7, 8, 10}},
        {"192.168.0.",   {2, 3, 4, 5, 6, 7, 8, 10}},
        {"192.168.100.", {2, 3, 4, 5}},
        {"192.168.86.",  {2, 3, 4, 5}},
        {"10.0.0.",      {2, 3, 4, 5}},
        {"10.0.1.",      {2, 3}},
        {"172.16.0.",    {2, 3}},
        {"172.16.1.",    {2, 3}},
    };

    std::vector<std::string> result;
    for (const auto& subnet : kSubnets) {
        for (int host : subnet.hosts) {
            result.push_back(subnet.prefix + std::to_string(host));
        }
    }
    return result;
}

std::vector<std::string> buildIpScanCandidates(const net::NetworkSnapshot& snapshot,
                                               bool includeLocalSubnet) {
    std::string self = snapshot.primary ? snapshot.primary->address : std::string();

    std::vector<std::string> candidates;
    for (const auto& address : defaultCandidateAddresses()) {
        appendCandidate(candidates, address, self);
    }

    if (!includeLocalSubnet || self.empty()) {
        return candidates;
    }
    auto own = net::parseIpv4(self);
    if (!own) {
        return candidates;
    }

    uint32_t base = *own & 0xFFFFFF00u;
    for (uint32_t host = 2; host <= 20; ++host) {
        appendCandidate(candidates, net::formatIpv4(base | host), self);
    }
    return candidates;
}

IpScanDiscovery::IpScanDiscovery(std::shared_ptr<core::BridgeProber> prober,
                                 IpScanOptions options,
                                 SnapshotProvider snapshots)
    : options_(options)
    , scanner_(std::move(prober), options.scan)
    , snapshots_(std::move(snapshots))
{
}

std::vector<core::BridgeRecord> IpScanDiscovery::run(const core::StrategyContext& context) {
    net::NetworkSnapshot snapshot;
    if (snapshots_) {
        snapshot = snapshots_();
    }

    auto candidates = buildIpScanCandidates(snapshot, options_.include_local_subnet);
    LOG_INFO("IpScan", "Probing {} candidate address(es)", candidates.size());

    auto bridges = scanner_.scan(candidates, context, "IpScan");
    if (bridges.empty()) {
        LOG_INFO("IpScan", "No bridge answered{}",
                 context.token.isCancelled() ? " before cancellation" : "");
    }
    return bridges;
}

}  // namespace strategies
}  // namespace huedisc
