/**
 * @file mdns_discovery.hpp
 * @brief DNS-SD browse for the `_hue._tcp` service.
 *
 * The record-building helpers are always available. The strategy itself
 * is compiled only when the Avahi client library was found at build time
 * (HUEDISC_HAVE_AVAHI), which is also what detectPlatformCapabilities()
 * reports.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/discovery_strategy.hpp"
#include "huedisc/strategies/export.hpp"

#include <map>
#include <optional>

namespace huedisc {
namespace strategies {

constexpr const char* kHueServiceType = "_hue._tcp";

struct HUEDISC_STRATEGIES_API MdnsOptions {
    std::string service_type = kHueServiceType;
    std::chrono::milliseconds timeout{8000};
};

/**
 * @struct MdnsServiceInfo
 * @brief A resolved service instance.
 */
struct HUEDISC_STRATEGIES_API MdnsServiceInfo {
    std::string service_name;   ///< e.g. "Philips Hue - 1A2B3C"
    std::string host_name;      ///< e.g. "ecb5fa1a2b3c.local"
    std::string address;        ///< IPv4 dotted quad
    uint16_t port = 0;
    std::map<std::string, std::string> txt;   ///< Keys lowercased
};

/**
 * @brief Parse "key=value" TXT strings; keys are lowercased, a bare key maps to "".
 */
HUEDISC_STRATEGIES_API std::map<std::string, std::string> parseTxtRecords(const std::vector<std::string>& entries);

/**
 * @brief Build a record from a resolved instance without HTTP validation.
 *
 * The id comes from the `bridgeid` TXT entry, else the service-name suffix
 * after " - ", else the first label of the host name.
 *
 * @return std::nullopt without an IPv4 address or any usable id.
 */
HUEDISC_STRATEGIES_API std::optional<core::BridgeRecord> bridgeFromMdnsService(const MdnsServiceInfo& info);

#if defined(HUEDISC_HAVE_AVAHI)

/**
 * @class MdnsDiscovery
 * @brief Fast-path strategy; stops at the first resolved instance.
 */
class HUEDISC_STRATEGIES_API MdnsDiscovery final : public core::DiscoveryStrategy {
public:
    explicit MdnsDiscovery(MdnsOptions options = MdnsOptions());

    std::string name() const override { return "mdns"; }
    std::chrono::milliseconds budget() const override { return options_.timeout; }
    std::vector<core::BridgeRecord> run(const core::StrategyContext& context) override;

private:
    MdnsOptions options_;
};

#endif

}  // namespace strategies
}  // namespace huedisc
