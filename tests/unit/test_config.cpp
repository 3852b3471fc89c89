/**
 * @file test_config.cpp
 * @brief Unit tests for huediscd / huedisc configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Numeric validation and error handling
 * - Log level parsing
 * - Mapping onto engine options
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <huedisc/daemon/config.hpp>

#include <string>
#include <vector>

using namespace huedisc;
using namespace huedisc::daemon;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.listen_addr, "127.0.0.1:5680");
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.json);

    EXPECT_EQ(config.session_timeout_ms, 40000);

    EXPECT_EQ(config.cloud_url, "https://discovery.meethue.com");
    EXPECT_EQ(config.cloud_timeout_ms, 5000);
    EXPECT_EQ(config.cloud_attempts, 1);

    EXPECT_EQ(config.config_probe_timeout_ms, 4000);
    EXPECT_EQ(config.description_probe_timeout_ms, 3000);
    EXPECT_EQ(config.smart_probe_timeout_ms, 2000);
    EXPECT_EQ(config.max_parallel_probes, 16u);

    EXPECT_FALSE(config.no_mdns);
    EXPECT_FALSE(config.ssdp);
    EXPECT_TRUE(config.ssdp_interface.empty());
}

// =============================================================================
// Basic CLI Parsing
// =============================================================================

TEST_F(ConfigTest, ParseNoArgs) {
    auto [argc, argv] = makeArgs({"huediscd"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.session_timeout_ms, 40000);
}

TEST_F(ConfigTest, ParseHelp) {
    auto [argc, argv] = makeArgs({"huediscd", "--help"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ParseHelpShort) {
    auto [argc, argv] = makeArgs({"huediscd", "-h"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ParseListen) {
    auto [argc, argv] = makeArgs({"huediscd", "--listen", "0.0.0.0:7000"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_EQ(config.listen_addr, "0.0.0.0:7000");
}

// =============================================================================
// Flags
// =============================================================================

TEST_F(ConfigTest, ParseFlags) {
    auto [argc, argv] = makeArgs({"huedisc", "--no-mdns", "--ssdp", "--json"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.no_mdns);
    EXPECT_TRUE(config.ssdp);
    EXPECT_TRUE(config.json);
}

TEST_F(ConfigTest, FlagBetweenValuedOptions) {
    auto [argc, argv] = makeArgs({"huedisc", "--cloud-attempts", "3", "--ssdp",
                                  "--session-timeout-ms", "10000"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.cloud_attempts, 3);
    EXPECT_TRUE(config.ssdp);
    EXPECT_EQ(config.session_timeout_ms, 10000);
}

// =============================================================================
// Cloud and Probe Options
// =============================================================================

TEST_F(ConfigTest, ParseCloudOptions) {
    auto [argc, argv] = makeArgs({"huedisc",
                                  "--cloud-url", "http://127.0.0.1:8080/",
                                  "--cloud-timeout-ms", "1500",
                                  "--cloud-attempts", "2"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.cloud_url, "http://127.0.0.1:8080/");
    EXPECT_EQ(config.cloud_timeout_ms, 1500);
    EXPECT_EQ(config.cloud_attempts, 2);
}

TEST_F(ConfigTest, ParseProbeOptions) {
    auto [argc, argv] = makeArgs({"huedisc",
                                  "--config-probe-timeout-ms", "800",
                                  "--description-probe-timeout-ms", "600",
                                  "--smart-probe-timeout-ms", "400",
                                  "--max-parallel-probes", "32"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.config_probe_timeout_ms, 800);
    EXPECT_EQ(config.description_probe_timeout_ms, 600);
    EXPECT_EQ(config.smart_probe_timeout_ms, 400);
    EXPECT_EQ(config.max_parallel_probes, 32u);
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, MissingValueSetsHelp) {
    auto [argc, argv] = makeArgs({"huedisc", "--session-timeout-ms"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, UnknownOptionSetsHelp) {
    auto [argc, argv] = makeArgs({"huedisc", "--cluster", "default"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, NonNumericValueSetsHelp) {
    auto [argc, argv] = makeArgs({"huedisc", "--cloud-timeout-ms", "fast"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
    EXPECT_EQ(config.cloud_timeout_ms, 5000);
}

TEST_F(ConfigTest, TrailingGarbageSetsHelp) {
    auto [argc, argv] = makeArgs({"huedisc", "--max-parallel-probes", "8x"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ZeroAndNegativeRejected) {
    {
        auto [argc, argv] = makeArgs({"huedisc", "--session-timeout-ms", "0"});
        EXPECT_TRUE(parseArgs(argc, argv.data()).help);
    }
    {
        auto [argc, argv] = makeArgs({"huedisc", "--cloud-attempts", "-1"});
        EXPECT_TRUE(parseArgs(argc, argv.data()).help);
    }
}

// =============================================================================
// Log Level
// =============================================================================

TEST_F(ConfigTest, ParseLogLevelOption) {
    auto [argc, argv] = makeArgs({"huedisc", "--log-level", "DEBUG"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(parseLogLevel(config.log_level), utils::LogLevel::DEBUG);
}

TEST_F(ConfigTest, InvalidLogLevelSetsHelp) {
    auto [argc, argv] = makeArgs({"huedisc", "--log-level", "CHATTY"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ParseLogLevelFallsBackToInfo) {
    EXPECT_EQ(parseLogLevel("TRACE"), utils::LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("WARN"), utils::LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("OFF"), utils::LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("nonsense"), utils::LogLevel::INFO);
}

// =============================================================================
// Engine Options
// =============================================================================

TEST_F(ConfigTest, DefaultsMapOntoDiscoveryOptions) {
    auto options = toDiscoveryOptions(Config());

    EXPECT_EQ(options.coordinator.session_timeout, 40000ms);
    EXPECT_EQ(options.cloud.url, "https://discovery.meethue.com");
    EXPECT_EQ(options.cloud.timeout, 5000ms);
    EXPECT_EQ(options.cloud.max_attempts, 1);
    EXPECT_EQ(options.ip_scan.scan.probe.config_timeout, 4000ms);
    EXPECT_EQ(options.ip_scan.scan.probe.description_timeout, 3000ms);
    EXPECT_EQ(options.smart.scan.probe.config_timeout, 2000ms);
    EXPECT_EQ(options.smart.scan.probe.description_timeout, 2000ms);
    EXPECT_FALSE(options.enable_ssdp);
}

TEST_F(ConfigTest, ParsedValuesMapOntoDiscoveryOptions) {
    auto [argc, argv] = makeArgs({"huedisc", "--ssdp",
                                  "--session-timeout-ms", "12000",
                                  "--cloud-url", "http://localhost/",
                                  "--max-parallel-probes", "4"});
    auto options = toDiscoveryOptions(parseArgs(argc, argv.data()));

    EXPECT_EQ(options.coordinator.session_timeout, 12000ms);
    EXPECT_EQ(options.cloud.url, "http://localhost/");
    EXPECT_EQ(options.ip_scan.scan.max_parallel, 4u);
    EXPECT_EQ(options.smart.scan.max_parallel, 4u);
    EXPECT_TRUE(options.enable_ssdp);
}

TEST_F(ConfigTest, SsdpInterfaceMapsOntoSsdpOptions) {
    auto [argc, argv] = makeArgs({"huedisc", "--ssdp", "--ssdp-interface", "192.168.1.20"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.ssdp_interface, "192.168.1.20");
    EXPECT_EQ(toDiscoveryOptions(config).ssdp.interface_address, "192.168.1.20");
}
