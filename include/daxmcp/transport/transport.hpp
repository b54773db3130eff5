#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Error type for the protocol-side byte stream (stdin/stdout).

#include <string>

#include <tl/expected.hpp>

namespace daxmcp {

struct TransportError {
    enum class Category {
        Network,   // stream closed or unwritable
        Protocol   // a line that can not be a message (too long)
    };

    Category category{};
    std::string message;
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace daxmcp
