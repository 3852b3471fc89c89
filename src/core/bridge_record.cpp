/**
 * @file bridge_record.cpp
 * @brief BridgeRecord helpers.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/core/bridge_record.hpp"
#include "huedisc/utils/string_utils.hpp"

#include <algorithm>

namespace huedisc {
namespace core {

std::string normalizeBridgeId(const std::string& id) {
    std::string result = utils::trim(id);
    result.erase(std::remove(result.begin(), result.end(), ':'), result.end());
    return utils::to_upper(result);
}

BridgeRecord BridgeRecord::make(const std::string& id,
                                const std::string& ipAddress,
                                uint16_t port,
                                const std::string& name) {
    BridgeRecord record;
    record.id = utils::trim(id);
    record.normalized_id = normalizeBridgeId(id);
    record.ip_address = utils::trim(ipAddress);
    record.port = port == 0 ? kDefaultBridgePort : port;
    std::string trimmedName = utils::trim(name);
    record.name = trimmedName.empty() ? kDefaultBridgeName : trimmedName;
    return record;
}

bool BridgeRecord::sameBridgeAs(const BridgeRecord& other) const {
    if (!normalized_id.empty() && normalized_id == other.normalized_id) {
        return true;
    }
    return !ip_address.empty() && ip_address == other.ip_address;
}

BridgeRecord BridgeRecord::normalized() const {
    BridgeRecord copy = *this;
    if (copy.normalized_id.empty()) {
        copy.normalized_id = normalizeBridgeId(copy.id);
    }
    copy.id = copy.normalized_id;
    return copy;
}

std::string BridgeRecord::endpoint() const {
    if (port == kDefaultBridgePort) {
        return ip_address;
    }
    return ip_address + ":" + std::to_string(port);
}

std::vector<BridgeRecord> dedupeBridges(const std::vector<BridgeRecord>& records) {
    std::vector<BridgeRecord> unique;
    unique.reserve(records.size());

    for (const auto& record : records) {
        BridgeRecord candidate = record.normalized();
        bool duplicate = std::any_of(unique.begin(), unique.end(),
            [&candidate](const BridgeRecord& kept) { return kept.sameBridgeAs(candidate); });
        if (!duplicate) {
            unique.push_back(std::move(candidate));
        }
    }
    return unique;
}

std::ostream& operator<<(std::ostream& os, const BridgeRecord& record) {
    return os << record.normalized_id << "@" << record.endpoint()
              << " (" << record.name << ")";
}

}  // namespace core
}  // namespace huedisc
