/**
 * @file mdns_discovery.cpp
 * @brief mDNS record building and the Avahi browse loop.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/strategies/mdns_discovery.hpp"
#include "huedisc/net/interface_info.hpp"
#include "huedisc/utils/logger.hpp"
#include "huedisc/utils/string_utils.hpp"

#if defined(HUEDISC_HAVE_AVAHI)
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/strlst.h>

#include <algorithm>
#include <memory>
#endif

namespace huedisc {
namespace strategies {

std::map<std::string, std::string> parseTxtRecords(const std::vector<std::string>& entries) {
    std::map<std::string, std::string> txt;
    for (const auto& entry : entries) {
        size_t eq = entry.find('=');
        std::string key = utils::to_lower(utils::trim(entry.substr(0, eq)));
        if (key.empty()) {
            continue;
        }
        txt[key] = eq == std::string::npos ? std::string() : entry.substr(eq + 1);
    }
    return txt;
}

std::optional<core::BridgeRecord> bridgeFromMdnsService(const MdnsServiceInfo& info) {
    if (!net::parseIpv4(info.address)) {
        return std::nullopt;
    }

    std::string id;
    auto it = info.txt.find("bridgeid");
    if (it != info.txt.end()) {
        id = utils::trim(it->second);
    }
    if (id.empty()) {
        size_t dash = info.service_name.rfind(" - ");
        if (dash != std::string::npos) {
            id = utils::trim(info.service_name.substr(dash + 3));
        }
    }
    if (id.empty()) {
        id = utils::trim(info.host_name.substr(0, info.host_name.find('.')));
    }
    if (id.empty()) {
        return std::nullopt;
    }

    return core::BridgeRecord::make(id, info.address, core::kDefaultBridgePort, info.service_name);
}

#if defined(HUEDISC_HAVE_AVAHI)

namespace {

struct BrowseState {
    bool failed = false;
    std::optional<MdnsServiceInfo> resolved;
};

struct SimplePollDeleter {
    void operator()(AvahiSimplePoll* poll) const { avahi_simple_poll_free(poll); }
};
struct ClientDeleter {
    void operator()(AvahiClient* client) const { avahi_client_free(client); }
};
struct BrowserDeleter {
    void operator()(AvahiServiceBrowser* browser) const { avahi_service_browser_free(browser); }
};

void resolveCallback(AvahiServiceResolver* resolver,
                     AvahiIfIndex /*interface*/,
                     AvahiProtocol /*protocol*/,
                     AvahiResolverEvent event,
                     const char* name,
                     const char* /*type*/,
                     const char* /*domain*/,
                     const char* hostName,
                     const AvahiAddress* address,
                     uint16_t port,
                     AvahiStringList* txt,
                     AvahiLookupResultFlags /*flags*/,
                     void* userdata) {
    auto* state = static_cast<BrowseState*>(userdata);

    if (event == AVAHI_RESOLVER_FOUND && !state->resolved && address != nullptr) {
        char addressText[AVAHI_ADDRESS_STR_MAX] = {0};
        avahi_address_snprint(addressText, sizeof(addressText), address);

        std::vector<std::string> entries;
        for (AvahiStringList* item = txt; item != nullptr; item = avahi_string_list_get_next(item)) {
            entries.emplace_back(reinterpret_cast<const char*>(avahi_string_list_get_text(item)),
                                 avahi_string_list_get_size(item));
        }

        MdnsServiceInfo info;
        info.service_name = name ? name : "";
        info.host_name = hostName ? hostName : "";
        info.address = addressText;
        info.port = port;
        info.txt = parseTxtRecords(entries);
        state->resolved = std::move(info);
    } else if (event == AVAHI_RESOLVER_FAILURE) {
        LOG_DEBUG("Mdns", "Failed to resolve '{}': {}", name ? name : "",
                  avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))));
    }

    avahi_service_resolver_free(resolver);
}

void browseCallback(AvahiServiceBrowser* browser,
                    AvahiIfIndex interface,
                    AvahiProtocol protocol,
                    AvahiBrowserEvent event,
                    const char* name,
                    const char* type,
                    const char* domain,
                    AvahiLookupResultFlags /*flags*/,
                    void* userdata) {
    auto* state = static_cast<BrowseState*>(userdata);
    AvahiClient* client = avahi_service_browser_get_client(browser);

    switch (event) {
        case AVAHI_BROWSER_NEW:
            if (state->resolved) {
                break;
            }
            LOG_DEBUG("Mdns", "Found instance '{}', resolving", name);
            if (avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                           AVAHI_PROTO_INET, AvahiLookupFlags(0),
                                           resolveCallback, state) == nullptr) {
                LOG_WARN("Mdns", "Cannot resolve '{}': {}", name,
                         avahi_strerror(avahi_client_errno(client)));
            }
            break;
        case AVAHI_BROWSER_FAILURE:
            LOG_WARN("Mdns", "Browse failed: {}", avahi_strerror(avahi_client_errno(client)));
            state->failed = true;
            break;
        default:
            break;
    }
}

}  // namespace

MdnsDiscovery::MdnsDiscovery(MdnsOptions options)
    : options_(std::move(options))
{
}

std::vector<core::BridgeRecord> MdnsDiscovery::run(const core::StrategyContext& context) {
    std::unique_ptr<AvahiSimplePoll, SimplePollDeleter> poll(avahi_simple_poll_new());
    if (!poll) {
        LOG_WARN("Mdns", "Failed to create Avahi poll object");
        return {};
    }

    int error = 0;
    std::unique_ptr<AvahiClient, ClientDeleter> client(
        avahi_client_new(avahi_simple_poll_get(poll.get()), AvahiClientFlags(0),
                         nullptr, nullptr, &error));
    if (!client) {
        LOG_WARN("Mdns", "Avahi daemon unavailable: {}", avahi_strerror(error));
        return {};
    }

    BrowseState state;
    std::unique_ptr<AvahiServiceBrowser, BrowserDeleter> browser(
        avahi_service_browser_new(client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_INET,
                                  options_.service_type.c_str(), nullptr, AvahiLookupFlags(0),
                                  browseCallback, &state));
    if (!browser) {
        LOG_WARN("Mdns", "Cannot browse {}: {}", options_.service_type,
                 avahi_strerror(avahi_client_errno(client.get())));
        return {};
    }

    auto browseEnd = std::min(std::chrono::steady_clock::now() + options_.timeout, context.deadline);
    while (!state.resolved && !state.failed && !context.token.isCancelled() &&
           std::chrono::steady_clock::now() < browseEnd) {
        if (avahi_simple_poll_iterate(poll.get(), 100) != 0) {
            LOG_WARN("Mdns", "Avahi poll loop ended unexpectedly");
            break;
        }
    }

    if (!state.resolved) {
        LOG_INFO("Mdns", "No {} instance resolved", options_.service_type);
        return {};
    }

    auto record = bridgeFromMdnsService(*state.resolved);
    if (!record) {
        LOG_INFO("Mdns", "Instance '{}' has no usable address or id", state.resolved->service_name);
        return {};
    }
    LOG_INFO("Mdns", "Resolved bridge {} at {}", record->normalized_id, record->ip_address);
    return {*record};
}

#endif

}  // namespace strategies
}  // namespace huedisc
