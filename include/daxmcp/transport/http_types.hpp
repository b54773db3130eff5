#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace daxmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Header Map
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230); lookups go through
// find_header/get_header rather than map::find.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) { return iequals(pair.first, name); });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // "?a=b" or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// scheme://host[:port] with default ports omitted
    [[nodiscard]] std::string origin() const {
        const bool default_port =
            (is_secure() && (port == 443)) || ((is_secure() == false) && (port == 80));
        if (default_port) {
            return scheme + "://" + host;
        }
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

/// Parse an absolute http(s) URL with ada-url (WHATWG rules).
/// Returns nullopt for anything else, including other schemes.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace daxmcp
