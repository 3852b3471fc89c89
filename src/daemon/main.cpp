/**
 * @file main.cpp
 * @brief huediscd daemon entry point
 *
 * This is the thin executable that wires together the library components:
 * - Platform capability detection (mDNS availability)
 * - Strategy set and discovery coordinator
 * - BridgeDiscovery gRPC service for local clients
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include <huedisc/daemon/config.hpp>
#include <huedisc/utils/logger.hpp>
#include <huedisc/net/http_client.hpp>
#include <huedisc/core/discovery_coordinator.hpp>
#include <huedisc/strategies/strategy_factory.hpp>
#include <huedisc/services/discovery_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace huedisc;
using namespace huedisc::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "huediscd starting...");
    LOG_INFO("Daemon", "Listen: {}", config.listen_addr);
    LOG_INFO("Daemon", "Session timeout: {} ms", config.session_timeout_ms);
    LOG_INFO("Daemon", "Cloud endpoint: {}", config.cloud_url);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto capabilities = strategies::detectPlatformCapabilities(config.no_mdns);
        LOG_INFO("Daemon", "mDNS: {}", capabilities.mdns ? "available" : "unavailable");

        auto options = toDiscoveryOptions(config);
        auto http = std::make_shared<net::CurlHttpClient>();

        // Create shared coordinator
        auto coordinator = std::make_shared<core::DiscoveryCoordinator>(
            strategies::buildStrategySet(options, capabilities, http),
            options.coordinator
        );

        // Create discovery service
        auto discovery_service = std::make_unique<services::DiscoveryServiceImpl>(
            coordinator,
            capabilities.mdns
        );

        // Build and start gRPC server
        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(discovery_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_FATAL("Daemon", "Failed to start server on {}", config.listen_addr);
            return 1;
        }
        LOG_INFO("Daemon", "BridgeDiscovery listening on {}", config.listen_addr);
        LOG_INFO("Daemon", "huediscd is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        // Cancel the running session so pending calls finish before the deadline
        coordinator->stopDiscovery();

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        LOG_INFO("Daemon", "huediscd stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
