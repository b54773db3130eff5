#include "daxmcp/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace daxmcp {

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada reports the scheme as "https:"
    std::string scheme = std::string(ada_url.get_protocol());
    if ((scheme.empty() == false) && (scheme.back() == ':')) {
        scheme.pop_back();
    }

    const bool is_https = (scheme == "https");
    const bool valid_scheme = (scheme == "http") || is_https;
    if (valid_scheme == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    // ada drops the port when it is the scheme default
    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (port_str.empty() == false) {
        std::uint16_t explicit_port = 0;
        const auto [ptr, ec] = std::from_chars(
            port_str.data(), port_str.data() + port_str.size(), explicit_port);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
        port = explicit_port;
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace daxmcp
