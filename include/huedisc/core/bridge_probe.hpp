/**
 * @file bridge_probe.hpp
 * @brief HTTP probes that turn a candidate address into a validated bridge.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_record.hpp"
#include "huedisc/core/export.hpp"
#include "huedisc/core/validator.hpp"
#include "huedisc/net/http_client.hpp"
#include "huedisc/utils/cancellation.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace huedisc {
namespace core {

/**
 * @struct ProbeOptions
 * @brief Timeouts and port used when probing a candidate.
 */
struct HUEDISC_CORE_API ProbeOptions {
    std::chrono::milliseconds config_timeout{4000};       ///< GET /api/0/config
    std::chrono::milliseconds description_timeout{3000};  ///< GET /description.xml
    uint16_t port = kDefaultBridgePort;
};

/**
 * @class BridgeProber
 * @brief Fetches bridge descriptors and validates them.
 *
 * Every failure (transport error, non-2xx status, validation failure)
 * yields std::nullopt. Thread-safe if the HttpClient is.
 */
class HUEDISC_CORE_API BridgeProber {
public:
    explicit BridgeProber(net::HttpClientPtr http);

    /**
     * @brief Probe http://ip[:port]/api/0/config.
     * @param timeout Overrides the configured timeout when set.
     */
    std::optional<BridgeRecord> probeConfig(const std::string& ip,
                                            const ProbeOptions& options,
                                            const utils::CancellationToken& token,
                                            std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /**
     * @brief Probe http://ip[:port]/description.xml.
     */
    std::optional<BridgeRecord> probeDescription(const std::string& ip,
                                                 const ProbeOptions& options,
                                                 const utils::CancellationToken& token,
                                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /**
     * @brief Fetch an arbitrary description URL (an SSDP LOCATION).
     *
     * The record's address and port are taken from the URL. Locations
     * whose host is not an IPv4 address are rejected.
     */
    std::optional<BridgeRecord> validateLocation(const std::string& url,
                                                 std::chrono::milliseconds timeout,
                                                 const utils::CancellationToken& token) const;

    const net::HttpClientPtr& httpClient() const { return http_; }

private:
    std::optional<BridgeRecord> fetchAndValidate(const std::string& url,
                                                 const std::string& ip,
                                                 uint16_t port,
                                                 ContentKind kind,
                                                 std::chrono::milliseconds timeout,
                                                 const utils::CancellationToken& token) const;

    net::HttpClientPtr http_;
};

/**
 * @brief Base URL "http://ip" or "http://ip:port" for a bridge address.
 */
HUEDISC_CORE_API std::string bridgeBaseUrl(const std::string& ip, uint16_t port);

}  // namespace core
}  // namespace huedisc
