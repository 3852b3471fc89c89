/**
 * @file cloud_discovery.cpp
 * @brief CloudDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/cloud_discovery.hpp"
#include "huedisc/net/interface_info.hpp"
#include "huedisc/utils/logger.hpp"
#include "huedisc/utils/string_utils.hpp"

#include "huedisc/proto/hue_wire.pb.h"

#include <google/protobuf/util/json_util.h>

namespace huedisc {
namespace strategies {

namespace {

bool isRetryable(const net::HttpResult& result) {
    if (result.cancelled) {
        return false;
    }
    if (!result.ok) {
        return true;   // timeout, connection reset, DNS hiccup
    }
    return result.status_code >= 500 || result.status_code == 408;
}

}  // namespace

std::optional<std::vector<core::BridgeRecord>> decodeCloudResponse(const std::string& body) {
    std::string trimmed = utils::trim(body);
    if (trimmed.empty() || (trimmed[0] != '[' && trimmed[0] != '{')) {
        return std::nullopt;
    }

    // The protobuf JSON parser needs an object at the top level.
    std::string document = trimmed[0] == '[' ? "{\"bridges\":" + trimmed + "}" : trimmed;

    wire::CloudDiscoveryResponse response;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(document, &response, options);
    if (!status.ok()) {
        LOG_WARN("Cloud", "Undecodable discovery response: {}", status.ToString());
        return std::nullopt;
    }

    std::vector<core::BridgeRecord> bridges;
    for (const auto& entry : response.bridges()) {
        std::string ip = utils::trim(entry.internalipaddress());
        if (utils::trim(entry.id()).empty() || !net::parseIpv4(ip)) {
            LOG_DEBUG("Cloud", "Skipping incomplete entry id='{}' ip='{}'", entry.id(), ip);
            continue;
        }
        uint16_t port = (entry.port() > 0 && entry.port() <= 65535)
                            ? static_cast<uint16_t>(entry.port())
                            : core::kDefaultBridgePort;
        bridges.push_back(core::BridgeRecord::make(entry.id(), ip, port));
    }
    return bridges;
}

CloudDiscovery::CloudDiscovery(net::HttpClientPtr http, CloudOptions options)
    : http_(std::move(http))
    , options_(std::move(options))
{
    if (options_.max_attempts < 1) {
        options_.max_attempts = 1;
    }
}

std::chrono::milliseconds CloudDiscovery::budget() const {
    // Sum of request timeouts plus back-off pauses 1*step, 2*step, ...
    int n = options_.max_attempts;
    return options_.timeout * n + options_.backoff_step * (n * (n - 1) / 2);
}

std::vector<core::BridgeRecord> CloudDiscovery::run(const core::StrategyContext& context) {
    if (!http_) {
        return {};
    }

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        auto timeout = std::min(options_.timeout, context.remaining());
        if (context.shouldStop() || timeout.count() <= 0) {
            LOG_INFO("Cloud", "Stopped before attempt {}", attempt);
            return {};
        }

        net::HttpRequestOptions request;
        request.timeout = timeout;
        request.accept = "application/json";

        LOG_DEBUG("Cloud", "GET {} (attempt {}/{})", options_.url, attempt, options_.max_attempts);
        net::HttpResult result = http_->get(options_.url, request, context.token);

        if (result.isSuccess()) {
            auto bridges = decodeCloudResponse(result.body);
            if (!bridges) {
                return {};
            }
            LOG_INFO("Cloud", "Discovery endpoint listed {} bridge(s)", bridges->size());
            return *bridges;
        }

        if (result.ok) {
            LOG_WARN("Cloud", "Discovery endpoint answered HTTP {}", result.status_code);
        } else {
            LOG_WARN("Cloud", "Discovery request failed: {}", result.error);
        }

        if (!isRetryable(result) || attempt == options_.max_attempts) {
            break;
        }
        if (context.sleepFor(options_.backoff_step * attempt)) {
            break;
        }
    }
    return {};
}

}  // namespace strategies
}  // namespace huedisc
