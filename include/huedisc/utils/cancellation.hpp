/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared between a coordinator and its workers.
 *
 * A CancellationSource owns the flag; any number of CancellationToken copies
 * observe it. Tokens are cheap to copy and remain valid after the source is
 * destroyed.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace huedisc {
namespace utils {

namespace detail {
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};
}  // namespace detail

/**
 * @class CancellationToken
 * @brief Read side of a cancellation flag.
 *
 * A default-constructed token is never cancelled.
 */
class HUEDISC_UTILS_API CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for up to @p duration, waking early on cancellation.
     * @return True if the token was cancelled.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @class CancellationSource
 * @brief Write side of a cancellation flag.
 */
class HUEDISC_UTILS_API CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }

    /**
     * @brief Cancel and wake every waiter. Idempotent.
     */
    void cancel();

    bool isCancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace utils
}  // namespace huedisc
