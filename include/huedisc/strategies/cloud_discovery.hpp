/**
 * @file cloud_discovery.hpp
 * @brief Ask the vendor's discovery endpoint which bridges share our public IP.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/net/http_client.hpp"
#include "huedisc/strategies/export.hpp"

#include <optional>

namespace huedisc {
namespace strategies {

constexpr const char* kDefaultCloudDiscoveryUrl = "https://discovery.meethue.com";

struct HUEDISC_STRATEGIES_API CloudOptions {
    std::string url = kDefaultCloudDiscoveryUrl;
    std::chrono::milliseconds timeout{5000};
    int max_attempts = 1;                        ///< Total requests, including the first
    std::chrono::milliseconds backoff_step{1000}; ///< Wait attempt * step before a retry
};

/**
 * @brief Decode the endpoint's JSON array of {id, internalipaddress, port}.
 *
 * Entries without an id or a valid IPv4 address are skipped.
 *
 * @return std::nullopt if the body is not a JSON array or object.
 */
HUEDISC_STRATEGIES_API std::optional<std::vector<core::BridgeRecord>> decodeCloudResponse(const std::string& body);

/**
 * @class CloudDiscovery
 * @brief Fast-path strategy; cloud results are trusted without probing.
 */
class HUEDISC_STRATEGIES_API CloudDiscovery final : public core::DiscoveryStrategy {
public:
    CloudDiscovery(net::HttpClientPtr http, CloudOptions options = CloudOptions());

    std::string name() const override { return "cloud"; }
    std::chrono::milliseconds budget() const override;
    std::vector<core::BridgeRecord> run(const core::StrategyContext& context) override;

private:
    net::HttpClientPtr http_;
    CloudOptions options_;
};

}  // namespace strategies
}  // namespace huedisc
