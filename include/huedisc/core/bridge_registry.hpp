/**
 * @file bridge_registry.hpp
 * @brief Thread-safe, insertion-ordered set of discovered bridges.
 *
 * Several probe workers or strategies report into one registry. A record
 * whose normalized id or IP address matches an existing entry is dropped,
 * so the first report of a bridge wins.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/bridge_record.hpp"
#include "huedisc/core/export.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace huedisc {
namespace core {

/**
 * @class BridgeRegistry
 * @brief Accumulates bridges reported by concurrent producers.
 *
 * All access is guarded by a read-write lock.
 */
class HUEDISC_CORE_API BridgeRegistry {
public:
    BridgeRegistry() = default;

    BridgeRegistry(const BridgeRegistry&) = delete;
    BridgeRegistry& operator=(const BridgeRegistry&) = delete;

    /**
     * @brief Add a record unless the same bridge is already known.
     * @return True if the record was inserted.
     */
    bool add(const BridgeRecord& record);

    /**
     * @brief Add each record in order.
     * @return Number of records inserted.
     */
    size_t merge(const std::vector<BridgeRecord>& records);

    /**
     * @brief Copy of all records in insertion order.
     */
    std::vector<BridgeRecord> snapshot() const;

    bool containsIp(const std::string& ipAddress) const;
    bool containsId(const std::string& id) const;

    size_t size() const;
    bool empty() const;
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<BridgeRecord> records_;
    std::unordered_map<std::string, size_t> byId_;
    std::unordered_map<std::string, size_t> byIp_;
};

}  // namespace core
}  // namespace huedisc
