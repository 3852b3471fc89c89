/**
 * @file discovery_coordinator.cpp
 * @brief DiscoveryCoordinator implementation.
 *
 * Every piece of session state is guarded by the coordinator's single
 * mutex. Strategy workers only publish their report and signal the
 * condition variable; all decisions are taken on the session thread.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/core/discovery_coordinator.hpp"
#include "huedisc/core/bridge_registry.hpp"
#include "huedisc/utils/logger.hpp"

#include <algorithm>
#include <system_error>

namespace huedisc {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

long long millisSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

}  // namespace

const char* toString(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::Idle:      return "idle";
        case DiscoveryState::Running:   return "running";
        case DiscoveryState::Completed: return "completed";
    }
    return "unknown";
}

const char* toString(DiscoveryStage stage) {
    switch (stage) {
        case DiscoveryStage::None:               return "none";
        case DiscoveryStage::FastPath:           return "fast_path";
        case DiscoveryStage::ParallelFallback:   return "parallel_fallback";
        case DiscoveryStage::SequentialFallback: return "sequential_fallback";
        case DiscoveryStage::TimedOut:           return "timed_out";
    }
    return "unknown";
}

const char* toString(DiscoveryOutcome outcome) {
    switch (outcome) {
        case DiscoveryOutcome::None:      return "none";
        case DiscoveryOutcome::Found:     return "found";
        case DiscoveryOutcome::Exhausted: return "exhausted";
        case DiscoveryOutcome::TimedOut:  return "timed_out";
        case DiscoveryOutcome::Stopped:   return "stopped";
        case DiscoveryOutcome::Rejected:  return "rejected";
    }
    return "unknown";
}

const char* toString(DiscoveryMode mode) {
    switch (mode) {
        case DiscoveryMode::ConcurrentFanOut:   return "concurrent_fan_out";
        case DiscoveryMode::SequentialFallback: return "sequential_fallback";
    }
    return "unknown";
}

// =============================================================================
// Session state
// =============================================================================

struct DiscoveryCoordinator::Report {
    std::string strategy;
    std::shared_ptr<utils::CancellationSource> source;
    bool done = false;
    bool consumed = false;
    std::vector<BridgeRecord> records;
};

struct DiscoveryCoordinator::Session {
    uint64_t id = 0;
    OutcomeCallback completion;
    Clock::time_point started;
    Clock::time_point deadline;

    bool has_completed = false;
    bool finished = false;          ///< Session thread has delivered and joined its workers
    DiscoveryOutcome outcome = DiscoveryOutcome::None;
    std::vector<BridgeRecord> results;

    BridgeRegistry accumulated;
    size_t completed_count = 0;
    size_t expected_count = 0;

    std::vector<std::shared_ptr<utils::CancellationSource>> sources;
    std::vector<std::thread> workers;
};

// =============================================================================
// Construction
// =============================================================================

DiscoveryCoordinator::DiscoveryCoordinator(StrategySet strategies,
                                           CoordinatorConfig config,
                                           CallbackExecutor executor)
    : strategies_(std::move(strategies))
    , config_(config)
    , executor_(std::move(executor))
{
    if (!executor_) {
        executor_ = [](std::function<void()> task) { task(); };
    }
    LOG_DEBUG("Coordinator", "Created in {} mode: {} fast-path, {} fallback strategies",
              toString(strategies_.mode), strategies_.fast_path.size(), strategies_.fallback.size());
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    stopDiscovery();

    std::vector<std::thread> toJoin;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : sessionThreads_) {
            if (entry.thread.get_id() == std::this_thread::get_id()) {
                LOG_ERROR("Coordinator", "Destroyed from its own completion callback");
                entry.thread.detach();
            } else {
                toJoin.push_back(std::move(entry.thread));
            }
        }
        sessionThreads_.clear();
    }

    for (auto& thread : toJoin) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

// =============================================================================
// Public API
// =============================================================================

bool DiscoveryCoordinator::discoverBridges(DiscoveryCallback completion) {
    OutcomeCallback wrapped;
    if (completion) {
        wrapped = [completion](std::vector<BridgeRecord> bridges, DiscoveryOutcome) {
            completion(std::move(bridges));
        };
    }
    return discoverBridgesWithOutcome(std::move(wrapped));
}

bool DiscoveryCoordinator::discoverBridgesWithOutcome(OutcomeCallback completion) {
    std::vector<std::thread> toJoin;
    OutcomeCallback undelivered;
    bool accepted = false;
    bool delivered = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reapFinishedLocked(toJoin);

        auto session = std::make_shared<Session>();
        session->id = nextSessionId_++;
        session->completion = std::move(completion);
        session->started = Clock::now();
        session->deadline = session->started + config_.session_timeout;

        if (running_) {
            LOG_WARN("Coordinator", "Discovery already running (session {}), rejecting request {}",
                     current_ ? current_->id : 0, session->id);

            // Rejected sessions are delivered from their own thread like accepted ones.
            session->has_completed = true;
            session->outcome = DiscoveryOutcome::Rejected;
            try {
                sessionThreads_.push_back(
                    {std::thread(&DiscoveryCoordinator::deliver, this, session), session});
                delivered = true;
            } catch (const std::system_error& e) {
                LOG_ERROR("Coordinator", "Failed to start delivery thread: {}", e.what());
            }
        } else {
            try {
                sessionThreads_.push_back(
                    {std::thread(&DiscoveryCoordinator::runSession, this, session), session});
                current_ = session;
                running_ = true;
                state_ = DiscoveryState::Running;
                stage_ = DiscoveryStage::None;
                accepted = true;
                delivered = true;
                LOG_INFO("Coordinator", "Session {} started ({} ms timeout)",
                         session->id, config_.session_timeout.count());
            } catch (const std::system_error& e) {
                LOG_ERROR("Coordinator", "Failed to start session thread: {}", e.what());
            }
        }

        if (!delivered) {
            undelivered = std::move(session->completion);
        }
    }

    for (auto& thread : toJoin) {
        thread.join();
    }

    if (undelivered) {
        executor_([undelivered]() { undelivered({}, DiscoveryOutcome::Rejected); });
    }
    return accepted;
}

void DiscoveryCoordinator::stopDiscovery() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || !current_) {
        return;
    }
    LOG_INFO("Coordinator", "Stopping session {}", current_->id);
    completeLocked(current_, {}, DiscoveryOutcome::Stopped);
}

bool DiscoveryCoordinator::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

DiscoveryState DiscoveryCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

DiscoveryStage DiscoveryCoordinator::stage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stage_;
}

DiscoveryOutcome DiscoveryCoordinator::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

// =============================================================================
// Session thread
// =============================================================================

void DiscoveryCoordinator::runSession(const std::shared_ptr<Session>& session) {
    runFastPath(session);

    bool proceed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session->has_completed && Clock::now() >= session->deadline) {
            stage_ = DiscoveryStage::TimedOut;
            completeLocked(session, {}, DiscoveryOutcome::TimedOut);
        }
        proceed = !session->has_completed;
    }

    if (proceed) {
        if (strategies_.mode == DiscoveryMode::ConcurrentFanOut) {
            runConcurrentFallback(session);
        } else {
            runSequentialFallback(session);
        }
    }

    deliver(session);
}

void DiscoveryCoordinator::runFastPath(const std::shared_ptr<Session>& session) {
    std::unique_lock<std::mutex> lock(mutex_);

    for (const auto& strategy : strategies_.fast_path) {
        auto now = Clock::now();
        if (session->has_completed || now >= session->deadline) {
            return;
        }

        stage_ = DiscoveryStage::FastPath;
        LOG_INFO("Coordinator", "Session {}: trying {}", session->id, strategy->name());

        auto report = launchLocked(session, strategy);
        auto waitUntil = std::min(now + strategy->budget() + config_.strategy_grace,
                                  session->deadline);
        auto records = awaitReport(lock, session, report, waitUntil);
        if (!records.empty()) {
            LOG_INFO("Coordinator", "Session {}: {} found {} bridge(s)",
                     session->id, strategy->name(), records.size());
            completeLocked(session, records, DiscoveryOutcome::Found);
            return;
        }
        LOG_INFO("Coordinator", "Session {}: {} found nothing", session->id, strategy->name());
    }
}

void DiscoveryCoordinator::runConcurrentFallback(const std::shared_ptr<Session>& session) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (session->has_completed) {
        return;
    }
    if (strategies_.fallback.empty()) {
        completeLocked(session, {}, DiscoveryOutcome::Exhausted);
        return;
    }

    stage_ = DiscoveryStage::ParallelFallback;
    LOG_INFO("Coordinator", "Session {}: starting {} fallback strategies in parallel",
             session->id, strategies_.fallback.size());

    std::vector<std::shared_ptr<Report>> reports;
    session->expected_count = strategies_.fallback.size();
    for (const auto& strategy : strategies_.fallback) {
        reports.push_back(launchLocked(session, strategy));
    }

    auto hasPending = [&reports]() {
        return std::any_of(reports.begin(), reports.end(),
                           [](const std::shared_ptr<Report>& r) { return r->done && !r->consumed; });
    };

    while (!session->has_completed) {
        cv_.wait_until(lock, session->deadline, [&]() {
            return session->has_completed || hasPending();
        });
        if (session->has_completed) {
            break;
        }

        for (const auto& report : reports) {
            if (!report->done || report->consumed) {
                continue;
            }
            report->consumed = true;
            ++session->completed_count;
            LOG_INFO("Coordinator", "Session {}: {} reported {} bridge(s) ({}/{})",
                     session->id, report->strategy, report->records.size(),
                     session->completed_count, session->expected_count);

            if (!report->records.empty()) {
                session->accumulated.merge(report->records);
                completeLocked(session, session->accumulated.snapshot(), DiscoveryOutcome::Found);
                break;
            }
        }
        if (session->has_completed) {
            break;
        }

        if (session->completed_count >= session->expected_count) {
            completeLocked(session, session->accumulated.snapshot(), DiscoveryOutcome::Exhausted);
        } else if (Clock::now() >= session->deadline) {
            LOG_WARN("Coordinator", "Session {}: timed out with {}/{} strategies reported",
                     session->id, session->completed_count, session->expected_count);
            stage_ = DiscoveryStage::TimedOut;
            completeLocked(session, session->accumulated.snapshot(), DiscoveryOutcome::TimedOut);
        }
    }
}

void DiscoveryCoordinator::runSequentialFallback(const std::shared_ptr<Session>& session) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (session->has_completed) {
        return;
    }
    stage_ = DiscoveryStage::SequentialFallback;

    for (const auto& strategy : strategies_.fallback) {
        if (session->has_completed) {
            return;
        }
        auto now = Clock::now();
        if (now >= session->deadline) {
            break;
        }

        LOG_INFO("Coordinator", "Session {}: trying {}", session->id, strategy->name());
        auto report = launchLocked(session, strategy);
        auto waitUntil = std::min(now + strategy->budget() + config_.strategy_grace,
                                  session->deadline);
        auto records = awaitReport(lock, session, report, waitUntil);
        if (!records.empty()) {
            completeLocked(session, records, DiscoveryOutcome::Found);
            return;
        }
    }

    if (session->has_completed) {
        return;
    }
    if (Clock::now() >= session->deadline) {
        stage_ = DiscoveryStage::TimedOut;
        completeLocked(session, {}, DiscoveryOutcome::TimedOut);
    } else {
        completeLocked(session, {}, DiscoveryOutcome::Exhausted);
    }
}

void DiscoveryCoordinator::deliver(const std::shared_ptr<Session>& session) {
    OutcomeCallback completion;
    std::vector<BridgeRecord> results;
    DiscoveryOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completion = std::move(session->completion);
        results = session->results;
        outcome = session->outcome;
    }

    if (completion) {
        uint64_t id = session->id;
        executor_([completion, results, outcome, id]() {
            try {
                completion(results, outcome);
            } catch (const std::exception& e) {
                LOG_ERROR("Coordinator", "Session {}: completion callback threw: {}", id, e.what());
            }
        });
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers = std::move(session->workers);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    session->finished = true;
    LOG_DEBUG("Coordinator", "Session {} finished", session->id);
}

// =============================================================================
// Helpers
// =============================================================================

std::shared_ptr<DiscoveryCoordinator::Report> DiscoveryCoordinator::launchLocked(
    const std::shared_ptr<Session>& session,
    const DiscoveryStrategyPtr& strategy) {

    auto report = std::make_shared<Report>();
    report->strategy = strategy->name();
    report->source = std::make_shared<utils::CancellationSource>();
    if (session->has_completed) {
        report->source->cancel();
    }
    session->sources.push_back(report->source);

    StrategyContext context(report->source->token(),
                            std::min(Clock::now() + strategy->budget(), session->deadline));

    try {
        session->workers.emplace_back([this, strategy, report, context]() {
            std::vector<BridgeRecord> records;
            try {
                records = strategy->run(context);
            } catch (const std::exception& e) {
                LOG_ERROR("Coordinator", "Strategy {} failed: {}", report->strategy, e.what());
            }

            std::lock_guard<std::mutex> lock(mutex_);
            report->records = std::move(records);
            report->done = true;
            cv_.notify_all();
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Coordinator", "Failed to start {}: {}", report->strategy, e.what());
        report->done = true;
    }
    return report;
}

std::vector<BridgeRecord> DiscoveryCoordinator::awaitReport(
    std::unique_lock<std::mutex>& lock,
    const std::shared_ptr<Session>& session,
    const std::shared_ptr<Report>& report,
    Clock::time_point waitUntil) {

    cv_.wait_until(lock, waitUntil, [&]() {
        return report->done || session->has_completed;
    });

    if (session->has_completed) {
        return {};
    }
    if (!report->done) {
        LOG_WARN("Coordinator", "Session {}: {} overran its budget, abandoning it",
                 session->id, report->strategy);
        report->source->cancel();
        return {};
    }

    report->consumed = true;
    return report->records;
}

bool DiscoveryCoordinator::completeLocked(const std::shared_ptr<Session>& session,
                                          const std::vector<BridgeRecord>& results,
                                          DiscoveryOutcome outcome) {
    if (session->has_completed) {
        return false;
    }

    session->has_completed = true;
    session->outcome = outcome;
    session->results = dedupeBridges(results);

    for (const auto& source : session->sources) {
        source->cancel();
    }

    if (current_ == session) {
        running_ = false;
        state_ = DiscoveryState::Completed;
        outcome_ = outcome;
    }

    LOG_INFO("Coordinator", "Session {} completed ({}) with {} bridge(s) after {} ms",
             session->id, toString(outcome), session->results.size(), millisSince(session->started));

    cv_.notify_all();
    return true;
}

void DiscoveryCoordinator::reapFinishedLocked(std::vector<std::thread>& toJoin) {
    auto self = std::this_thread::get_id();
    for (auto it = sessionThreads_.begin(); it != sessionThreads_.end();) {
        if (it->session->finished && it->thread.get_id() != self) {
            toJoin.push_back(std::move(it->thread));
            it = sessionThreads_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace core
}  // namespace huedisc
