#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace urlrelay::responses {

// Every relay body is a JSON object with an "ok" flag; errors carry "error".

inline RelayResponse ok(nlohmann::json payload) {
    payload["ok"] = true;
    RelayResponse r;
    r.status = 200;
    r.body = payload.dump();
    return r;
}

inline RelayResponse error(int status, ErrorCategory category, const std::string& message) {
    const nlohmann::json payload = {{"ok", false}, {"error", message}};
    RelayResponse r;
    r.status = status;
    r.body = payload.dump();
    r.category = category;
    return r;
}

inline RelayResponse forbidden_origin() {
    return error(403, ErrorCategory::ORIGIN_DENIED, "Forbidden: client address not allowed");
}

inline RelayResponse unauthorized() {
    return error(401, ErrorCategory::AUTH_DENIED, "Unauthorized: bad or missing token");
}

inline RelayResponse not_found() {
    return error(404, ErrorCategory::MALFORMED_REQUEST, "Not Found");
}

inline RelayResponse shutting_down() {
    return error(503, ErrorCategory::INTERNAL_ERROR, "Server shutting down");
}

inline RelayResponse internal_error() {
    return error(500, ErrorCategory::INTERNAL_ERROR, "Internal server error");
}

} // namespace urlrelay::responses
