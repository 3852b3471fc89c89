/**
 * @file validator.hpp
 * @brief Decides whether a probed document describes a Hue Bridge.
 *
 * Bridges answer GET /api/0/config with a JSON object and GET
 * /description.xml with a UPnP device description. Both forms are
 * recognised here. All functions are pure and never throw; anything
 * unparseable is simply "not a bridge".
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/export.hpp"

#include <optional>
#include <string>

namespace huedisc {
namespace core {

/**
 * @enum ContentKind
 * @brief Format of a probed document.
 */
enum class ContentKind {
    Json,   ///< /api/0/config
    Xml     ///< /description.xml or an SSDP LOCATION
};

/**
 * @struct BridgeIdentity
 * @brief Identifier and display name pulled out of a descriptor.
 */
struct HUEDISC_CORE_API BridgeIdentity {
    std::string id;
    std::string name;
};

/**
 * @brief Whether the document describes a Hue Bridge.
 *
 * XML is matched case-insensitively against vendor and product markers.
 * A JSON document qualifies exactly when extractIdentity() succeeds on it.
 */
HUEDISC_CORE_API bool isHueBridgeDescriptor(const std::string& body, ContentKind kind);

/**
 * @brief Extract the bridge identifier and name.
 *
 * JSON: `bridgeid` must be present and non-empty; a present `modelid` must
 * contain "hue" or "bsb". XML: `serialNumber`, else the last 12 characters
 * of the `UDN` UUID; name from `friendlyName`, then `modelDescription`.
 * The name falls back to kDefaultBridgeName.
 */
HUEDISC_CORE_API std::optional<BridgeIdentity> extractIdentity(const std::string& body,
                                                               ContentKind kind);

/**
 * @brief isHueBridgeDescriptor() and extractIdentity() combined.
 */
HUEDISC_CORE_API std::optional<BridgeIdentity> validateDescriptor(const std::string& body,
                                                                  ContentKind kind);

/**
 * @brief Trimmed text of the first `<tag>...</tag>` element (tag matched
 *        case-insensitively, namespace prefixes and attributes tolerated).
 * @return std::nullopt when absent or empty.
 */
HUEDISC_CORE_API std::optional<std::string> findXmlElementText(const std::string& body,
                                                               const std::string& tag);

}  // namespace core
}  // namespace huedisc
