/**
 * @file bridge_record.hpp
 * @brief Value type describing one discovered Hue Bridge.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/export.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace huedisc {
namespace core {

constexpr uint16_t kDefaultBridgePort = 80;
constexpr const char* kDefaultBridgeName = "Philips Hue Bridge";

/**
 * @brief Canonical form of a bridge identifier.
 *
 * Trims whitespace, strips ':' separators and uppercases, so
 * "aa:bb:cc:11:22:33" and "AABBCC112233" compare equal. Idempotent.
 */
HUEDISC_CORE_API std::string normalizeBridgeId(const std::string& id);

/**
 * @struct BridgeRecord
 * @brief A bridge as reported by one strategy.
 *
 * Records are built once by a strategy and treated as immutable values.
 * The only rewrite is normalized(), applied when a session completes.
 */
struct HUEDISC_CORE_API BridgeRecord {
    std::string id;               ///< Raw identifier (serial, bridgeid or UUID fragment)
    std::string normalized_id;    ///< Deduplication key
    std::string ip_address;       ///< IPv4 dotted quad
    uint16_t port = kDefaultBridgePort;
    std::string name = kDefaultBridgeName;

    /**
     * @brief Build a record, deriving normalized_id and defaulting the name.
     */
    static BridgeRecord make(const std::string& id,
                             const std::string& ipAddress,
                             uint16_t port = kDefaultBridgePort,
                             const std::string& name = "");

    /**
     * @brief Same physical bridge: equal normalized id or equal IP address.
     */
    bool sameBridgeAs(const BridgeRecord& other) const;

    /**
     * @brief Copy with id replaced by its normalized form.
     */
    BridgeRecord normalized() const;

    /**
     * @brief "ip" for port 80, "ip:port" otherwise.
     */
    std::string endpoint() const;

    bool operator==(const BridgeRecord& other) const {
        return id == other.id && normalized_id == other.normalized_id &&
               ip_address == other.ip_address && port == other.port &&
               name == other.name;
    }
    bool operator!=(const BridgeRecord& other) const { return !(*this == other); }
};

/**
 * @brief Normalize every record and drop later duplicates (first seen wins).
 */
HUEDISC_CORE_API std::vector<BridgeRecord> dedupeBridges(const std::vector<BridgeRecord>& records);

HUEDISC_CORE_API std::ostream& operator<<(std::ostream& os, const BridgeRecord& record);

}  // namespace core
}  // namespace huedisc
