/**
 * @file main.cpp
 * @brief huedisc one-shot discovery tool entry point
 *
 * Runs a single discovery session in-process and prints the bridges found.
 * Exit status is 0 when at least one bridge was found, 2 when none were,
 * 1 on a startup error.
 */

#include "output_formatter.hpp"

#include <huedisc/daemon/config.hpp>
#include <huedisc/core/discovery_coordinator.hpp>
#include <huedisc/net/http_client.hpp>
#include <huedisc/strategies/strategy_factory.hpp>
#include <huedisc/utils/logger.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <memory>

using namespace huedisc;

namespace {

constexpr int kExitFound = 0;
constexpr int kExitError = 1;
constexpr int kExitNoBridges = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void signalHandler(int /*signal*/) {
    g_interrupted = 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    daemon::Config config = daemon::parseArgs(argc, argv);

    if (config.help) {
        daemon::printUsage(argv[0], false);
        return 0;
    }

    utils::Logger::instance().setLevel(daemon::parseLogLevel(config.log_level));

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto capabilities = strategies::detectPlatformCapabilities(config.no_mdns);
        auto options = daemon::toDiscoveryOptions(config);
        auto http = std::make_shared<net::CurlHttpClient>();

        auto coordinator = std::make_shared<core::DiscoveryCoordinator>(
            strategies::buildStrategySet(options, capabilities, http),
            options.coordinator);

        std::promise<std::vector<core::BridgeRecord>> promise;
        auto future = promise.get_future();
        auto started = std::chrono::steady_clock::now();

        coordinator->discoverBridges([&promise](std::vector<core::BridgeRecord> bridges) {
            promise.set_value(std::move(bridges));
        });

        // Poll so an interrupt can cancel the session.
        while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (g_interrupted) {
                LOG_INFO("Cli", "Interrupted, stopping discovery");
                coordinator->stopDiscovery();
                g_interrupted = 0;
            }
        }

        cli::DiscoveryReport report;
        report.bridges = future.get();
        report.outcome = core::toString(coordinator->lastOutcome());
        report.mode = core::toString(coordinator->mode());
        report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        cli::OutputFormatter formatter(std::cout, config.json);
        formatter.print_report(report);

        return report.bridges.empty() ? kExitNoBridges : kExitFound;

    } catch (const std::exception& e) {
        LOG_ERROR("Cli", "Discovery failed: {}", e.what());
        return kExitError;
    }
}
