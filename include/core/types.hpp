#pragma once

#include "core/error.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace urlrelay {

inline constexpr std::string_view kServiceName = "url-relay";
inline constexpr std::string_view kServiceVersion = "1.0.0";

// ============================================================================
// Basic Enums
// ============================================================================

enum class Operation {
    UNKNOWN,
    PING,
    OPEN
};

inline const char* operation_to_string(Operation op) {
    switch (op) {
        case Operation::PING: return "ping";
        case Operation::OPEN: return "open";
        default: return "unknown";
    }
}

// ============================================================================
// Per-request Types (never outlive one request/response cycle)
// ============================================================================

/**
 * @brief One logical request, built from the parsed wire bytes
 */
struct InboundRequest {
    Operation operation = Operation::UNKNOWN;
    std::optional<std::string> url;          // Only meaningful for OPEN
    std::string token;                       // Presented credential (may be empty)
    std::string source_address;              // Peer address as seen by the listener
    std::optional<std::string> parse_error;  // Set when the body could not be parsed
};

/**
 * @brief Result of one host-launch attempt
 */
struct OpenOutcome {
    bool success = false;
    std::optional<std::string> error;
    std::chrono::milliseconds elapsed{0};

    static OpenOutcome ok(std::chrono::milliseconds elapsed_ms = std::chrono::milliseconds{0}) {
        OpenOutcome o;
        o.success = true;
        o.elapsed = elapsed_ms;
        return o;
    }

    static OpenOutcome failure(std::string detail,
                               std::chrono::milliseconds elapsed_ms = std::chrono::milliseconds{0}) {
        OpenOutcome o;
        o.success = false;
        o.error = std::move(detail);
        o.elapsed = elapsed_ms;
        return o;
    }
};

/**
 * @brief Transport-independent response: HTTP status + JSON body
 */
struct RelayResponse {
    int status = 200;
    std::string body;
    ErrorCategory category = ErrorCategory::NONE;

    [[nodiscard]] bool ok() const { return category == ErrorCategory::NONE; }
};

} // namespace urlrelay
