/**
 * @file bridge_registry.cpp
 * @brief BridgeRegistry implementation.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/core/bridge_registry.hpp"
#include "huedisc/utils/logger.hpp"

#include <mutex>

namespace huedisc {
namespace core {

bool BridgeRegistry::add(const BridgeRecord& record) {
    std::string id = record.normalized_id.empty() ? normalizeBridgeId(record.id)
                                                  : record.normalized_id;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if ((!id.empty() && byId_.count(id) != 0) ||
        (!record.ip_address.empty() && byIp_.count(record.ip_address) != 0)) {
        LOG_DEBUG("BridgeRegistry", "Ignoring duplicate bridge {} at {}", id, record.ip_address);
        return false;
    }

    size_t index = records_.size();
    records_.push_back(record);
    records_.back().normalized_id = id;
    if (!id.empty()) {
        byId_[id] = index;
    }
    if (!record.ip_address.empty()) {
        byIp_[record.ip_address] = index;
    }

    LOG_DEBUG("BridgeRegistry", "Recorded bridge {} at {}", id, record.endpoint());
    return true;
}

size_t BridgeRegistry::merge(const std::vector<BridgeRecord>& records) {
    size_t added = 0;
    for (const auto& record : records) {
        if (add(record)) {
            ++added;
        }
    }
    return added;
}

std::vector<BridgeRecord> BridgeRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_;
}

bool BridgeRegistry::containsIp(const std::string& ipAddress) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return byIp_.count(ipAddress) != 0;
}

bool BridgeRegistry::containsId(const std::string& id) const {
    std::string key = normalizeBridgeId(id);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return byId_.count(key) != 0;
}

size_t BridgeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

bool BridgeRegistry::empty() const {
    return size() == 0;
}

void BridgeRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    byId_.clear();
    byIp_.clear();
}

}  // namespace core
}  // namespace huedisc
