/**
 * @file cancellation.cpp
 * @brief CancellationSource / CancellationToken implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/utils/cancellation.hpp"

#include <thread>

namespace huedisc {
namespace utils {

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>())
{
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
}

}  // namespace utils
}  // namespace huedisc
