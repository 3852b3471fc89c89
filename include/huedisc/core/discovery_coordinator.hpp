/**
 * @file discovery_coordinator.hpp
 * @brief Staged orchestration of the discovery strategies.
 *
 * A session runs the fast path (mDNS, then Cloud) one strategy at a time
 * and stops at the first non-empty result. Otherwise it runs the fallback
 * strategies, concurrently or one after another depending on the strategy
 * set, until one reports bridges, all have reported, or the session timer
 * expires. Results are normalized and deduplicated, and the completion
 * callback fires exactly once per accepted call.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_record.hpp"
#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/core/export.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace huedisc {
namespace core {

enum class DiscoveryState {
    Idle,
    Running,
    Completed
};

enum class DiscoveryStage {
    None,
    FastPath,
    ParallelFallback,
    SequentialFallback,
    TimedOut
};

/**
 * @enum DiscoveryOutcome
 * @brief Why the last session completed.
 */
enum class DiscoveryOutcome {
    None,       ///< No session has completed yet
    Found,      ///< A strategy reported at least one bridge
    Exhausted,  ///< Every strategy reported nothing
    TimedOut,   ///< The session timer expired
    Stopped,    ///< stopDiscovery() was called
    Rejected    ///< A session was already running
};

/**
 * @enum DiscoveryMode
 * @brief Shape of the fallback stage.
 */
enum class DiscoveryMode {
    ConcurrentFanOut,    ///< Fallback strategies race each other
    SequentialFallback   ///< Fallback strategies run one after another
};

HUEDISC_CORE_API const char* toString(DiscoveryState state);
HUEDISC_CORE_API const char* toString(DiscoveryStage stage);
HUEDISC_CORE_API const char* toString(DiscoveryOutcome outcome);
HUEDISC_CORE_API const char* toString(DiscoveryMode mode);

/**
 * @struct StrategySet
 * @brief The strategies a coordinator runs, grouped by stage.
 */
struct HUEDISC_CORE_API StrategySet {
    DiscoveryMode mode = DiscoveryMode::ConcurrentFanOut;
    std::vector<DiscoveryStrategyPtr> fast_path;
    std::vector<DiscoveryStrategyPtr> fallback;
};

/**
 * @struct CoordinatorConfig
 * @brief Session-wide timing.
 */
struct HUEDISC_CORE_API CoordinatorConfig {
    /// Hard limit for a whole session, measured from discoverBridges().
    std::chrono::milliseconds session_timeout{40000};
    /// Extra time granted to a strategy past its own budget before it is abandoned.
    std::chrono::milliseconds strategy_grace{2000};
};

using DiscoveryCallback = std::function<void(std::vector<BridgeRecord>)>;

/**
 * @brief Completion that also receives the outcome of its own session.
 */
using OutcomeCallback = std::function<void(std::vector<BridgeRecord>, DiscoveryOutcome)>;

/**
 * @brief Runs a completion task. The default runs it inline on the
 *        delivering thread.
 *
 * Completions, rejected calls included, are always delivered from a
 * coordinator-owned thread and never from the thread that called
 * discoverBridges().
 */
using CallbackExecutor = std::function<void(std::function<void()>)>;

/**
 * @class DiscoveryCoordinator
 * @brief Owns discovery sessions and their worker threads.
 *
 * Usage:
 * @code
 * DiscoveryCoordinator coordinator(buildStrategySet(options, caps, http));
 * coordinator.discoverBridges([](std::vector<BridgeRecord> bridges) {
 *     for (const auto& bridge : bridges) { ... }
 * });
 * @endcode
 *
 * The coordinator must not be destroyed from inside its own completion
 * callback.
 */
class HUEDISC_CORE_API DiscoveryCoordinator {
public:
    explicit DiscoveryCoordinator(StrategySet strategies,
                                  CoordinatorConfig config = CoordinatorConfig(),
                                  CallbackExecutor executor = CallbackExecutor());

    /**
     * @brief Stops any running session and joins all threads.
     */
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    /**
     * @brief Start a session; returns immediately.
     *
     * If a session is already running the new caller receives an empty
     * result right away, delivered from a coordinator thread, and the
     * running session is left untouched.
     *
     * @return True if a new session was started.
     */
    bool discoverBridges(DiscoveryCallback completion);

    /**
     * @brief Same as discoverBridges(), also reporting the outcome of this
     *        call's own session (Rejected when it was refused).
     */
    bool discoverBridgesWithOutcome(OutcomeCallback completion);

    /**
     * @brief Cancel the running session. Its completion fires with an empty
     *        list. No-op when idle.
     */
    void stopDiscovery();

    bool isRunning() const;
    DiscoveryState state() const;
    DiscoveryStage stage() const;
    DiscoveryOutcome lastOutcome() const;
    DiscoveryMode mode() const { return strategies_.mode; }

private:
    struct Session;
    struct Report;

    void runSession(const std::shared_ptr<Session>& session);
    void runFastPath(const std::shared_ptr<Session>& session);
    void runConcurrentFallback(const std::shared_ptr<Session>& session);
    void runSequentialFallback(const std::shared_ptr<Session>& session);
    void deliver(const std::shared_ptr<Session>& session);

    /**
     * @brief Start @p strategy on a worker thread.
     * Must be called with mutex_ held.
     */
    std::shared_ptr<Report> launchLocked(const std::shared_ptr<Session>& session,
                                         const DiscoveryStrategyPtr& strategy);

    /**
     * @brief Wait for a launched strategy, at most until @p waitUntil.
     * @return Its records, or empty if it overran or the session completed.
     */
    std::vector<BridgeRecord> awaitReport(std::unique_lock<std::mutex>& lock,
                                          const std::shared_ptr<Session>& session,
                                          const std::shared_ptr<Report>& report,
                                          std::chrono::steady_clock::time_point waitUntil);

    /**
     * @brief Mark the session completed. Idempotent; mutex_ must be held.
     * @return True on the first call for this session.
     */
    bool completeLocked(const std::shared_ptr<Session>& session,
                        const std::vector<BridgeRecord>& results,
                        DiscoveryOutcome outcome);

    void reapFinishedLocked(std::vector<std::thread>& toJoin);

    const StrategySet strategies_;
    const CoordinatorConfig config_;
    CallbackExecutor executor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool running_ = false;
    DiscoveryState state_ = DiscoveryState::Idle;
    DiscoveryStage stage_ = DiscoveryStage::None;
    DiscoveryOutcome outcome_ = DiscoveryOutcome::None;
    uint64_t nextSessionId_ = 1;
    std::shared_ptr<Session> current_;

    struct SessionThread {
        std::thread thread;
        std::shared_ptr<Session> session;
    };
    std::vector<SessionThread> sessionThreads_;
};

}  // namespace core
}  // namespace huedisc
