/**
 * @file output_formatter.hpp
 * @brief Output formatting for the huedisc tool (table and JSON)
 */

#pragma once

#include <huedisc/core/bridge_record.hpp>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace huedisc::cli {

/**
 * @brief JSON value types for output
 */
using JsonValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    std::string,
    std::vector<struct JsonObject>,
    std::map<std::string, struct JsonObject>
>;

struct JsonObject {
    JsonValue value;

    JsonObject() : value(nullptr) {}
    JsonObject(bool b) : value(b) {}
    JsonObject(int i) : value(static_cast<int64_t>(i)) {}
    JsonObject(int64_t i) : value(i) {}
    JsonObject(const char* s) : value(std::string(s)) {}
    JsonObject(const std::string& s) : value(s) {}
    JsonObject(std::vector<JsonObject> arr) : value(std::move(arr)) {}
    JsonObject(std::map<std::string, JsonObject> obj) : value(std::move(obj)) {}
};

/**
 * @brief Table row for formatted output
 */
struct TableRow {
    std::vector<std::string> cells;
};

/**
 * @brief Summary of one discovery run
 */
struct DiscoveryReport {
    std::vector<core::BridgeRecord> bridges;
    std::string outcome;
    std::string mode;
    int64_t elapsed_ms = 0;
};

/**
 * @brief Output formatter supporting table and JSON formats
 */
class OutputFormatter {
public:
    explicit OutputFormatter(std::ostream& out, bool json_mode = false);

    bool is_json_mode() const { return json_mode_; }

    /**
     * @brief Print the bridges found by a run.
     *
     * JSON mode prints a single object with "bridges", "outcome", "mode"
     * and "elapsed_ms". Table mode prints one row per bridge followed by a
     * summary line.
     */
    void print_report(const DiscoveryReport& report);

    void print_table(const std::vector<std::string>& headers,
                     const std::vector<TableRow>& rows);
    void print_json(const JsonObject& obj);

    std::string json_stringify(const JsonObject& obj) const;

private:
    std::ostream& out_;
    bool json_mode_;

    std::string escape_json_string(const std::string& s) const;
    std::vector<size_t> calculate_column_widths(
        const std::vector<std::string>& headers,
        const std::vector<TableRow>& rows) const;
};

} // namespace huedisc::cli
