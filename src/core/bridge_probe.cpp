/**
 * @file bridge_probe.cpp
 * @brief BridgeProber implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/core/bridge_probe.hpp"
#include "huedisc/net/interface_info.hpp"
#include "huedisc/utils/logger.hpp"
#include "huedisc/utils/string_utils.hpp"

namespace huedisc {
namespace core {

std::string bridgeBaseUrl(const std::string& ip, uint16_t port) {
    if (port == 0 || port == kDefaultBridgePort) {
        return "http://" + ip;
    }
    return "http://" + ip + ":" + std::to_string(port);
}

BridgeProber::BridgeProber(net::HttpClientPtr http)
    : http_(std::move(http))
{
}

std::optional<BridgeRecord> BridgeProber::probeConfig(
    const std::string& ip,
    const ProbeOptions& options,
    const utils::CancellationToken& token,
    std::optional<std::chrono::milliseconds> timeout) const {

    return fetchAndValidate(bridgeBaseUrl(ip, options.port) + "/api/0/config",
                            ip, options.port, ContentKind::Json,
                            timeout.value_or(options.config_timeout), token);
}

std::optional<BridgeRecord> BridgeProber::probeDescription(
    const std::string& ip,
    const ProbeOptions& options,
    const utils::CancellationToken& token,
    std::optional<std::chrono::milliseconds> timeout) const {

    return fetchAndValidate(bridgeBaseUrl(ip, options.port) + "/description.xml",
                            ip, options.port, ContentKind::Xml,
                            timeout.value_or(options.description_timeout), token);
}

std::optional<BridgeRecord> BridgeProber::validateLocation(
    const std::string& url,
    std::chrono::milliseconds timeout,
    const utils::CancellationToken& token) const {

    auto parts = utils::parse_http_url(url);
    if (!parts) {
        LOG_DEBUG("Probe", "Ignoring unusable location {}", url);
        return std::nullopt;
    }
    if (!net::parseIpv4(parts->host)) {
        LOG_DEBUG("Probe", "Ignoring location {}: host is not an IPv4 address", url);
        return std::nullopt;
    }
    return fetchAndValidate(url, parts->host, parts->port, ContentKind::Xml, timeout, token);
}

std::optional<BridgeRecord> BridgeProber::fetchAndValidate(
    const std::string& url,
    const std::string& ip,
    uint16_t port,
    ContentKind kind,
    std::chrono::milliseconds timeout,
    const utils::CancellationToken& token) const {

    if (!http_ || token.isCancelled()) {
        return std::nullopt;
    }

    net::HttpRequestOptions request;
    request.timeout = timeout;
    request.accept = kind == ContentKind::Json ? "application/json" : "text/xml, application/xml";

    net::HttpResult response = http_->get(url, request, token);
    if (!response.ok) {
        LOG_TRACE("Probe", "{} unreachable: {}", url, response.error);
        return std::nullopt;
    }
    if (!response.isSuccess()) {
        LOG_TRACE("Probe", "{} answered HTTP {}", url, response.status_code);
        return std::nullopt;
    }

    auto identity = validateDescriptor(response.body, kind);
    if (!identity) {
        LOG_TRACE("Probe", "{} is not a Hue Bridge", url);
        return std::nullopt;
    }

    BridgeRecord record = BridgeRecord::make(identity->id, ip, port, identity->name);
    LOG_DEBUG("Probe", "Validated bridge {} via {}", record.normalized_id, url);
    return record;
}

}  // namespace core
}  // namespace huedisc
