/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <type_traits>

namespace huedisc::cli {

OutputFormatter::OutputFormatter(std::ostream& out, bool json_mode)
    : out_(out), json_mode_(json_mode) {}

void OutputFormatter::print_report(const DiscoveryReport& report) {
    if (json_mode_) {
        std::vector<JsonObject> bridges;
        for (const auto& bridge : report.bridges) {
            bridges.emplace_back(std::map<std::string, JsonObject>{
                {"id", bridge.id},
                {"normalized_id", bridge.normalized_id},
                {"ip_address", bridge.ip_address},
                {"port", static_cast<int64_t>(bridge.port)},
                {"name", bridge.name},
            });
        }
        print_json(std::map<std::string, JsonObject>{
            {"bridges", std::move(bridges)},
            {"outcome", report.outcome},
            {"mode", report.mode},
            {"elapsed_ms", report.elapsed_ms},
        });
        return;
    }

    if (report.bridges.empty()) {
        out_ << "No Hue Bridges found (" << report.outcome << ", "
             << report.elapsed_ms << " ms)\n";
        return;
    }

    std::vector<TableRow> rows;
    for (const auto& bridge : report.bridges) {
        rows.push_back({{bridge.normalized_id, bridge.ip_address,
                         std::to_string(bridge.port), bridge.name}});
    }
    print_table({"ID", "ADDRESS", "PORT", "NAME"}, rows);
    out_ << "\n" << report.bridges.size() << " bridge(s) found ("
         << report.outcome << ", " << report.elapsed_ms << " ms)\n";
}

void OutputFormatter::print_table(const std::vector<std::string>& headers,
                                  const std::vector<TableRow>& rows) {
    if (rows.empty()) {
        out_ << "(empty list)\n";
        return;
    }

    auto widths = calculate_column_widths(headers, rows);

    // Print header
    for (size_t i = 0; i < headers.size(); ++i) {
        out_ << std::left << std::setw(static_cast<int>(widths[i] + 2)) << headers[i];
    }
    out_ << "\n";

    // Print separator
    for (size_t i = 0; i < headers.size(); ++i) {
        out_ << std::string(widths[i], '-') << "  ";
    }
    out_ << "\n";

    // Print rows
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.cells.size() && i < widths.size(); ++i) {
            out_ << std::left << std::setw(static_cast<int>(widths[i] + 2)) << row.cells[i];
        }
        out_ << "\n";
    }
}

void OutputFormatter::print_json(const JsonObject& obj) {
    out_ << json_stringify(obj) << "\n";
}

std::string OutputFormatter::escape_json_string(const std::string& s) const {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::vector<size_t> OutputFormatter::calculate_column_widths(
    const std::vector<std::string>& headers,
    const std::vector<TableRow>& rows) const {

    std::vector<size_t> widths(headers.size());

    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
    }

    for (const auto& row : rows) {
        for (size_t i = 0; i < row.cells.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row.cells[i].size());
        }
    }

    return widths;
}

std::string OutputFormatter::json_stringify(const JsonObject& obj) const {
    return std::visit([this](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return val ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(val);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + escape_json_string(val) + "\"";
        } else if constexpr (std::is_same_v<T, std::vector<JsonObject>>) {
            std::string result = "[";
            for (size_t i = 0; i < val.size(); ++i) {
                if (i > 0) result += ",";
                result += json_stringify(val[i]);
            }
            return result + "]";
        } else {
            std::string result = "{";
            bool first = true;
            for (const auto& [k, v] : val) {
                if (!first) result += ",";
                first = false;
                result += "\"" + escape_json_string(k) + "\":" + json_stringify(v);
            }
            return result + "}";
        }
    }, obj.value);
}

} // namespace huedisc::cli
