/**
 * @file config.hpp
 * @brief huedisc daemon and CLI configuration parsing
 */

#pragma once

#include "huedisc/strategies/strategy_factory.hpp"
#include "huedisc/utils/logger.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace huedisc {
namespace daemon {

/**
 * @brief Configuration shared by huediscd and the huedisc tool
 */
struct Config {
    std::string listen_addr = "127.0.0.1:5680";   ///< gRPC listen address (daemon only)
    std::string log_level = "INFO";
    bool help = false;
    bool json = false;                             ///< JSON output (tool only)

    // Session
    int64_t session_timeout_ms = 40000;

    // Cloud
    std::string cloud_url = strategies::kDefaultCloudDiscoveryUrl;
    int64_t cloud_timeout_ms = 5000;
    int cloud_attempts = 1;

    // Probing
    int64_t config_probe_timeout_ms = 4000;        ///< GET /api/0/config during IP scan
    int64_t description_probe_timeout_ms = 3000;   ///< GET /description.xml during IP scan
    int64_t smart_probe_timeout_ms = 2000;         ///< Both probes during smart discovery
    uint32_t max_parallel_probes = 16;

    // Strategy selection
    bool no_mdns = false;
    bool ssdp = false;
    std::string ssdp_interface;                    ///< Local IPv4 address for M-SEARCH (empty = default route)
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 * @param daemon_mode Include daemon-only options
 */
inline void printUsage(const char* program_name, bool daemon_mode = true) {
    std::cout << (daemon_mode ? "huediscd - Hue Bridge discovery sidecar\n\n"
                              : "huedisc - find Philips Hue Bridges on the local network\n\n")
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n";
    if (daemon_mode) {
        std::cout << "  --listen <addr:port>               gRPC listen address (default: 127.0.0.1:5680)\n";
    } else {
        std::cout << "  --json                             Print results as JSON\n";
    }
    std::cout << "  --log-level <level>                TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "  --session-timeout-ms <ms>          Whole-session limit (default: 40000)\n"
              << "\nCloud Options:\n"
              << "  --cloud-url <url>                  Discovery endpoint (default: https://discovery.meethue.com)\n"
              << "  --cloud-timeout-ms <ms>            Request timeout (default: 5000)\n"
              << "  --cloud-attempts <n>               Requests including retries (default: 1)\n"
              << "\nProbe Options:\n"
              << "  --config-probe-timeout-ms <ms>     /api/0/config timeout (default: 4000)\n"
              << "  --description-probe-timeout-ms <ms> /description.xml timeout (default: 3000)\n"
              << "  --smart-probe-timeout-ms <ms>      Smart discovery probe timeout (default: 2000)\n"
              << "  --max-parallel-probes <n>          Probes in flight (default: 16)\n"
              << "\nStrategy Options:\n"
              << "  --no-mdns                          Do not browse _hue._tcp\n"
              << "  --ssdp                             Add SSDP M-SEARCH to the fallback stage\n"
              << "  --ssdp-interface <ipv4>            Local address M-SEARCH is sent from\n"
              << "\n  --help                             Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --log-level DEBUG --ssdp\n";
}

namespace detail {

inline bool parsePositive(const char* option, const char* value, int64_t& out) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != std::strlen(value) || parsed <= 0) {
            throw std::invalid_argument(value);
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Option " << option << " expects a positive integer, got '" << value << "'\n";
        return false;
    }
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set on --help or invalid input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags
        if (std::strcmp(arg, "--no-mdns") == 0) {
            config.no_mdns = true;
            continue;
        }
        if (std::strcmp(arg, "--ssdp") == 0) {
            config.ssdp = true;
            continue;
        }
        if (std::strcmp(arg, "--json") == 0) {
            config.json = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];
        int64_t number = 0;
        bool ok = true;

        if (std::strcmp(arg, "--listen") == 0) {
            config.listen_addr = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else if (std::strcmp(arg, "--ssdp-interface") == 0) {
            config.ssdp_interface = value;
        } else if (std::strcmp(arg, "--cloud-url") == 0) {
            config.cloud_url = value;
        } else if (std::strcmp(arg, "--session-timeout-ms") == 0) {
            ok = detail::parsePositive(arg, value, config.session_timeout_ms);
        } else if (std::strcmp(arg, "--cloud-timeout-ms") == 0) {
            ok = detail::parsePositive(arg, value, config.cloud_timeout_ms);
        } else if (std::strcmp(arg, "--cloud-attempts") == 0) {
            ok = detail::parsePositive(arg, value, number);
            config.cloud_attempts = static_cast<int>(number);
        } else if (std::strcmp(arg, "--config-probe-timeout-ms") == 0) {
            ok = detail::parsePositive(arg, value, config.config_probe_timeout_ms);
        } else if (std::strcmp(arg, "--description-probe-timeout-ms") == 0) {
            ok = detail::parsePositive(arg, value, config.description_probe_timeout_ms);
        } else if (std::strcmp(arg, "--smart-probe-timeout-ms") == 0) {
            ok = detail::parsePositive(arg, value, config.smart_probe_timeout_ms);
        } else if (std::strcmp(arg, "--max-parallel-probes") == 0) {
            ok = detail::parsePositive(arg, value, number);
            config.max_parallel_probes = static_cast<uint32_t>(number);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            ok = false;
        }

        if (!ok) {
            config.help = true;
            return config;
        }
    }

    utils::LogLevel level;
    if (!utils::parseLogLevel(config.log_level, level)) {
        std::cerr << "Error: Unknown log level " << config.log_level << "\n";
        config.help = true;
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel, INFO if unknown
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::parseLogLevel(level_str, level)) {
        return utils::LogLevel::INFO;
    }
    return level;
}

/**
 * @brief Map the configuration onto engine options
 */
inline strategies::DiscoveryOptions toDiscoveryOptions(const Config& config) {
    using std::chrono::milliseconds;

    strategies::DiscoveryOptions options;
    options.coordinator.session_timeout = milliseconds(config.session_timeout_ms);

    options.cloud.url = config.cloud_url;
    options.cloud.timeout = milliseconds(config.cloud_timeout_ms);
    options.cloud.max_attempts = config.cloud_attempts;

    options.ip_scan.scan.max_parallel = config.max_parallel_probes;
    options.ip_scan.scan.probe.config_timeout = milliseconds(config.config_probe_timeout_ms);
    options.ip_scan.scan.probe.description_timeout = milliseconds(config.description_probe_timeout_ms);

    options.smart.scan.max_parallel = config.max_parallel_probes;
    options.smart.scan.probe.config_timeout = milliseconds(config.smart_probe_timeout_ms);
    options.smart.scan.probe.description_timeout = milliseconds(config.smart_probe_timeout_ms);

    options.enable_ssdp = config.ssdp;
    options.ssdp.interface_address = config.ssdp_interface;
    return options;
}

} // namespace daemon
} // namespace huedisc
