/**
 * @file validator.cpp
 * @brief Hue Bridge descriptor recognition and identity extraction.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/core/validator.hpp"
#include "huedisc/core/bridge_record.hpp"
#include "huedisc/utils/logger.hpp"
#include "huedisc/utils/string_utils.hpp"

#include "huedisc/proto/hue_wire.pb.h"

#include <google/protobuf/util/json_util.h>

#include <cctype>

namespace huedisc {
namespace core {

namespace {

constexpr size_t kUuidSuffixLength = 12;

const char* const kVendorMarkers[] = {
    "philips hue",
    "royal philips",
    "signify",
    "ipbridge",
};

std::string decodeEntities(const std::string& text) {
    if (text.find('&') == std::string::npos) {
        return text;
    }
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& entity : kEntities) {
                if (text.compare(i, std::char_traits<char>::length(entity.first), entity.first) == 0) {
                    out += entity.second;
                    i += std::char_traits<char>::length(entity.first);
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == ':' || c == '_' || c == '-' || c == '.';
}

std::optional<BridgeIdentity> identityFromJson(const std::string& body) {
    wire::BridgeConfig config;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(body, &config, options);
    if (!status.ok()) {
        LOG_TRACE("Validator", "Config body is not a bridge config object: {}", status.ToString());
        return std::nullopt;
    }

    std::string bridgeId = utils::trim(config.bridgeid());
    if (bridgeId.empty()) {
        return std::nullopt;
    }

    std::string modelId = utils::trim(config.modelid());
    if (!modelId.empty() && !utils::icontains(modelId, "hue") && !utils::icontains(modelId, "bsb")) {
        LOG_DEBUG("Validator", "Rejecting config with foreign modelid {}", modelId);
        return std::nullopt;
    }

    BridgeIdentity identity;
    identity.id = bridgeId;
    identity.name = utils::trim(config.name());
    if (identity.name.empty()) {
        identity.name = kDefaultBridgeName;
    }
    return identity;
}

std::optional<BridgeIdentity> identityFromXml(const std::string& body) {
    BridgeIdentity identity;

    if (auto serial = findXmlElementText(body, "serialNumber")) {
        identity.id = *serial;
    } else if (auto udn = findXmlElementText(body, "UDN")) {
        std::string uuid = *udn;
        if (utils::to_lower(uuid.substr(0, 5)) == "uuid:") {
            uuid = utils::trim(uuid.substr(5));
        }
        identity.id = uuid.size() > kUuidSuffixLength
                          ? uuid.substr(uuid.size() - kUuidSuffixLength)
                          : uuid;
    }

    if (identity.id.empty()) {
        return std::nullopt;
    }

    if (auto friendly = findXmlElementText(body, "friendlyName")) {
        identity.name = *friendly;
    } else if (auto description = findXmlElementText(body, "modelDescription")) {
        identity.name = *description;
    } else {
        identity.name = kDefaultBridgeName;
    }
    return identity;
}

}  // namespace

std::optional<std::string> findXmlElementText(const std::string& body, const std::string& tag) {
    const std::string wanted = utils::to_lower(tag);

    size_t pos = 0;
    while ((pos = body.find('<', pos)) != std::string::npos) {
        size_t nameStart = pos + 1;
        size_t nameEnd = nameStart;
        while (nameEnd < body.size() && isNameChar(body[nameEnd])) {
            ++nameEnd;
        }
        pos = nameEnd;
        if (nameEnd == nameStart) {
            continue;  // closing tag, comment or declaration
        }

        std::string name = body.substr(nameStart, nameEnd - nameStart);
        size_t colon = name.rfind(':');
        if (colon != std::string::npos) {
            name = name.substr(colon + 1);
        }
        if (utils::to_lower(name) != wanted) {
            continue;
        }

        size_t openEnd = body.find('>', nameEnd);
        if (openEnd == std::string::npos) {
            return std::nullopt;
        }
        if (body[openEnd - 1] == '/') {
            continue;  // <tag/>
        }

        size_t textEnd = body.find('<', openEnd + 1);
        if (textEnd == std::string::npos) {
            return std::nullopt;
        }
        std::string text = utils::trim(decodeEntities(body.substr(openEnd + 1, textEnd - openEnd - 1)));
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    return std::nullopt;
}

bool isHueBridgeDescriptor(const std::string& body, ContentKind kind) {
    if (kind == ContentKind::Json) {
        return identityFromJson(body).has_value();
    }

    for (const char* marker : kVendorMarkers) {
        if (utils::icontains(body, marker)) {
            return true;
        }
    }

    auto modelName = findXmlElementText(body, "modelName");
    if (modelName && utils::icontains(*modelName, "hue bridge")) {
        return true;
    }

    auto manufacturer = findXmlElementText(body, "manufacturer");
    return manufacturer &&
           (utils::icontains(*manufacturer, "signify") || utils::icontains(*manufacturer, "royal philips")) &&
           utils::icontains(body, "hue");
}

std::optional<BridgeIdentity> extractIdentity(const std::string& body, ContentKind kind) {
    if (body.empty()) {
        return std::nullopt;
    }
    return kind == ContentKind::Json ? identityFromJson(body) : identityFromXml(body);
}

std::optional<BridgeIdentity> validateDescriptor(const std::string& body, ContentKind kind) {
    if (kind == ContentKind::Json) {
        return extractIdentity(body, kind);
    }
    if (!isHueBridgeDescriptor(body, kind)) {
        return std::nullopt;
    }
    auto identity = extractIdentity(body, kind);
    if (!identity) {
        LOG_DEBUG("Validator", "Hue descriptor without serialNumber or UDN, skipping");
    }
    return identity;
}

}  // namespace core
}  // namespace huedisc
