/**
 * @file probe_scanner.hpp
 * @brief Bounded worker pool that probes candidate addresses for bridges.
 *
 * Shared by the IP Scan and Smart strategies. Each candidate gets two
 * probes, /api/0/config and /description.xml, which run concurrently;
 * either one validating is enough.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_probe.hpp"
#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/net/interface_info.hpp"
#include "huedisc/strategies/export.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace huedisc {
namespace strategies {

/**
 * @brief Supplies the interface configuration; replaced in tests.
 */
using SnapshotProvider = std::function<net::NetworkSnapshot()>;

/**
 * @struct ProbeScanOptions
 */
struct HUEDISC_STRATEGIES_API ProbeScanOptions {
    size_t max_parallel = 16;                    ///< Probes in flight at once
    int attempts = 2;                            ///< Tries per probe
    std::chrono::milliseconds retry_delay{500};  ///< Pause before a retry
    core::ProbeOptions probe;                    ///< Per-request timeouts and port
};

/**
 * @class ProbeScanner
 * @brief Probes a list of addresses and returns the validated bridges.
 */
class HUEDISC_STRATEGIES_API ProbeScanner {
public:
    ProbeScanner(std::shared_ptr<core::BridgeProber> prober, ProbeScanOptions options);

    /**
     * @brief Probe every candidate until done, cancelled or past the deadline.
     *
     * Request timeouts are clipped to the context deadline. Addresses that
     * already produced a bridge are not probed again.
     *
     * @param component Log component of the calling strategy.
     */
    std::vector<core::BridgeRecord> scan(const std::vector<std::string>& candidates,
                                         const core::StrategyContext& context,
                                         const char* component) const;

    const ProbeScanOptions& options() const { return options_; }

private:
    std::shared_ptr<core::BridgeProber> prober_;
    ProbeScanOptions options_;
};

/**
 * @brief Append @p address to @p list unless present, malformed or excluded.
 */
HUEDISC_STRATEGIES_API void appendCandidate(std::vector<std::string>& list,
                                            const std::string& address,
                                            const std::string& exclude = "");

}  // namespace strategies
}  // namespace huedisc
