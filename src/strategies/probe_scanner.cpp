/**
 * @file probe_scanner.cpp
 * @brief ProbeScanner implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/probe_scanner.hpp"
#include "huedisc/core/bridge_registry.hpp"
#include "huedisc/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace huedisc {
namespace strategies {

namespace {

struct ProbeTask {
    std::string ip;
    core::ContentKind kind;
};

}  // namespace

void appendCandidate(std::vector<std::string>& list,
                     const std::string& address,
                     const std::string& exclude) {
    if (address.empty() || address == exclude || !net::parseIpv4(address)) {
        return;
    }
    if (std::find(list.begin(), list.end(), address) == list.end()) {
        list.push_back(address);
    }
}

ProbeScanner::ProbeScanner(std::shared_ptr<core::BridgeProber> prober, ProbeScanOptions options)
    : prober_(std::move(prober))
    , options_(std::move(options))
{
    if (options_.max_parallel == 0) {
        options_.max_parallel = 1;
    }
    if (options_.attempts < 1) {
        options_.attempts = 1;
    }
}

std::vector<core::BridgeRecord> ProbeScanner::scan(const std::vector<std::string>& candidates,
                                                   const core::StrategyContext& context,
                                                   const char* component) const {
    std::vector<ProbeTask> tasks;
    tasks.reserve(candidates.size() * 2);
    for (const auto& ip : candidates) {
        tasks.push_back({ip, core::ContentKind::Json});
        tasks.push_back({ip, core::ContentKind::Xml});
    }
    if (tasks.empty()) {
        return {};
    }

    core::BridgeRegistry found;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (!context.shouldStop()) {
            size_t index = next.fetch_add(1);
            if (index >= tasks.size()) {
                return;
            }
            const ProbeTask& task = tasks[index];
            if (found.containsIp(task.ip)) {
                continue;
            }

            const auto configured = task.kind == core::ContentKind::Json
                                        ? options_.probe.config_timeout
                                        : options_.probe.description_timeout;

            for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
                auto timeout = std::min(configured, context.remaining());
                if (timeout.count() <= 0 || context.token.isCancelled()) {
                    return;
                }

                auto record = task.kind == core::ContentKind::Json
                    ? prober_->probeConfig(task.ip, options_.probe, context.token, timeout)
                    : prober_->probeDescription(task.ip, options_.probe, context.token, timeout);
                if (record) {
                    if (found.add(*record)) {
                        LOG_INFO(component, "Bridge {} answered at {}", record->normalized_id, task.ip);
                    }
                    break;
                }
                if (attempt < options_.attempts && context.sleepFor(options_.retry_delay)) {
                    return;
                }
            }
        }
    };

    size_t workerCount = std::min(options_.max_parallel, tasks.size());
    std::vector<std::thread> threads;
    threads.reserve(workerCount - 1);
    for (size_t i = 1; i < workerCount; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            LOG_WARN(component, "Probe pool limited to {} workers: {}", threads.size() + 1, e.what());
            break;
        }
    }

    // The calling thread is a worker too.
    worker();

    for (auto& thread : threads) {
        thread.join();
    }

    LOG_DEBUG(component, "Probed {} candidate(s), {} bridge(s) found{}",
              candidates.size(), found.size(),
              context.token.isCancelled() ? " (cancelled)" : "");
    return found.snapshot();
}

}  // namespace strategies
}  // namespace huedisc
