/**
 * @file string_utils.hpp
 * @brief String helpers shared by the validator, the strategies and the tools.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace huedisc::utils {

/**
 * @brief Convert string to uppercase
 */
inline std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

/**
 * @brief Convert string to lowercase
 */
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Case-insensitive substring search
 * @param haystack Text to search
 * @param needle Text to find
 * @param from Position to start searching at
 * @return Offset of the first match, or std::string::npos
 */
inline size_t ifind(const std::string& haystack, const std::string& needle, size_t from = 0) {
    if (needle.empty()) return from <= haystack.size() ? from : std::string::npos;
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(std::min(from, haystack.size())),
                          haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    if (it == haystack.end()) return std::string::npos;
    return static_cast<size_t>(it - haystack.begin());
}

inline bool icontains(const std::string& haystack, const std::string& needle) {
    return ifind(haystack, needle) != std::string::npos;
}

/**
 * @brief Components of an http(s) URL
 */
struct UrlParts {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string path;
};

/**
 * @brief Split an absolute http/https URL into its parts.
 *
 * The port defaults to 80 or 443 by scheme; the path defaults to "/".
 * IPv6 literals are not supported.
 *
 * @return std::nullopt when the URL is not absolute http(s) or the port is invalid
 */
inline std::optional<UrlParts> parse_http_url(const std::string& url) {
    UrlParts parts;
    size_t sep = url.find("://");
    if (sep == std::string::npos) return std::nullopt;

    parts.scheme = to_lower(url.substr(0, sep));
    if (parts.scheme == "http") {
        parts.port = 80;
    } else if (parts.scheme == "https") {
        parts.port = 443;
    } else {
        return std::nullopt;
    }

    size_t authority_start = sep + 3;
    size_t path_start = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    parts.path = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (!parts.path.empty() && parts.path[0] != '/') {
        parts.path = "/" + parts.path;
    }

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) return std::nullopt;
        parts.port = static_cast<uint16_t>(port);
    }

    if (authority.empty()) return std::nullopt;
    parts.host = authority;
    return parts;
}

} // namespace huedisc::utils
