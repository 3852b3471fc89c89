/**
 * @file discovery_strategy.hpp
 * @brief Interface implemented by every bridge discovery strategy.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_record.hpp"
#include "huedisc/core/export.hpp"
#include "huedisc/utils/cancellation.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace huedisc {
namespace core {

/**
 * @struct StrategyContext
 * @brief Cancellation and deadline handed to DiscoveryStrategy::run().
 */
struct HUEDISC_CORE_API StrategyContext {
    utils::CancellationToken token;
    std::chrono::steady_clock::time_point deadline;

    StrategyContext()
        : deadline(std::chrono::steady_clock::time_point::max()) {}

    StrategyContext(utils::CancellationToken token_, std::chrono::steady_clock::time_point deadline_)
        : token(std::move(token_)), deadline(deadline_) {}

    /**
     * @brief True once the token is cancelled or the deadline has passed.
     */
    bool shouldStop() const {
        return token.isCancelled() || std::chrono::steady_clock::now() >= deadline;
    }

    /**
     * @brief Time left before the deadline, never negative.
     */
    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    /**
     * @brief Sleep for @p duration, clipped to the deadline.
     * @return True if the strategy should stop.
     */
    bool sleepFor(std::chrono::milliseconds duration) const {
        if (token.waitFor(std::min(duration, remaining()))) {
            return true;
        }
        return shouldStop();
    }
};

/**
 * @class DiscoveryStrategy
 * @brief One way of locating bridges (cloud lookup, mDNS, SSDP, scanning).
 *
 * run() blocks until the strategy has finished, its budget is used up or
 * the context is cancelled. It must not throw; failures produce an empty
 * result and a log line.
 */
class HUEDISC_CORE_API DiscoveryStrategy {
public:
    virtual ~DiscoveryStrategy() = default;

    /**
     * @brief Short name used in logs ("cloud", "mdns", ...).
     */
    virtual std::string name() const = 0;

    /**
     * @brief Maximum time the strategy needs when left alone.
     */
    virtual std::chrono::milliseconds budget() const = 0;

    virtual std::vector<BridgeRecord> run(const StrategyContext& context) = 0;
};

using DiscoveryStrategyPtr = std::shared_ptr<DiscoveryStrategy>;

}  // namespace core
}  // namespace huedisc
