#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Formatter Error
// ═══════════════════════════════════════════════════════════════════════════
// Every way a call to the DAX Formatter service can fail. The message is
// shown to the tool caller verbatim, so it reads as a sentence.

#include "daxmcp/transport/http_client.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace daxmcp {

struct FormatterError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        HttpError,        // non-2xx status
        InvalidResponse,  // body is not the expected JSON shape
        SyntaxError,      // the service rejected the DAX expression
        CircuitOpen,
        InvalidRequest    // the request could not be built or sent
    };

    Code code{Code::InvalidRequest};
    std::string message;
    std::optional<int> http_status{};

    [[nodiscard]] static FormatterError connection_failed(std::string msg) {
        return {Code::ConnectionFailed, std::move(msg)};
    }

    [[nodiscard]] static FormatterError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    [[nodiscard]] static FormatterError http_error(int status, std::string_view body) {
        std::string msg = "DAX Formatter service returned HTTP " + std::to_string(status);
        if (body.empty() == false) {
            constexpr std::size_t kMaxBodyInMessage = 200;
            msg += ": ";
            msg += body.substr(0, kMaxBodyInMessage);
        }
        return {Code::HttpError, std::move(msg), status};
    }

    [[nodiscard]] static FormatterError invalid_response(const std::string& detail) {
        return {Code::InvalidResponse, "Invalid response from DAX Formatter service: " + detail};
    }

    [[nodiscard]] static FormatterError syntax_error(std::string summary) {
        return {Code::SyntaxError, "DAX syntax error " + summary};
    }

    [[nodiscard]] static FormatterError circuit_open() {
        return {Code::CircuitOpen,
                "DAX Formatter service is unavailable (circuit breaker open)"};
    }

    [[nodiscard]] static FormatterError invalid_request(std::string msg) {
        return {Code::InvalidRequest, std::move(msg)};
    }

    /// Transport failure after retries are exhausted.
    [[nodiscard]] static FormatterError from_http(const HttpClientError& error) {
        switch (error.code) {
            case HttpClientError::Code::ConnectionFailed:
                return connection_failed("Could not reach DAX Formatter service: " + error.message);
            case HttpClientError::Code::Timeout:
                return timeout("DAX Formatter service timed out: " + error.message);
            case HttpClientError::Code::SslError:
                return {Code::SslError, "TLS error talking to DAX Formatter service: " + error.message};
            case HttpClientError::Code::Unknown:
                break;
        }
        return invalid_request(error.message);
    }

    /// Counts against the circuit breaker.
    [[nodiscard]] bool is_service_failure() const noexcept {
        switch (code) {
            case Code::ConnectionFailed:
            case Code::Timeout:
            case Code::SslError:
                return true;
            case Code::HttpError:
                return http_status.has_value() && ((*http_status >= 500) || (*http_status == 429));
            case Code::InvalidResponse:
            case Code::SyntaxError:
            case Code::CircuitOpen:
            case Code::InvalidRequest:
                return false;
        }
        return false;
    }
};

[[nodiscard]] constexpr std::string_view to_string(FormatterError::Code code) noexcept {
    switch (code) {
        case FormatterError::Code::ConnectionFailed: return "ConnectionFailed";
        case FormatterError::Code::Timeout:          return "Timeout";
        case FormatterError::Code::SslError:         return "SslError";
        case FormatterError::Code::HttpError:        return "HttpError";
        case FormatterError::Code::InvalidResponse:  return "InvalidResponse";
        case FormatterError::Code::SyntaxError:      return "SyntaxError";
        case FormatterError::Code::CircuitOpen:      return "CircuitOpen";
        case FormatterError::Code::InvalidRequest:   return "InvalidRequest";
    }
    return "Unknown";
}

template <typename T>
using FormatterResult = tl::expected<T, FormatterError>;

}  // namespace daxmcp
