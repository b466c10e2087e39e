#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace urlrelay {

/**
 * @brief Wire-level parsing helpers for the relay endpoints
 */
class RequestParser {
public:
    /**
     * @brief Extract the "url" field of an open request body
     *
     * Accepts a JSON object ({"url": "..."}) and, as a fallback for older
     * callers, an application/x-www-form-urlencoded body (url=...).
     * The returned URL is not validated; that is UrlValidator's job.
     *
     * @return MALFORMED_REQUEST on empty, unparsable or url-less bodies
     */
    [[nodiscard]] static Result<std::string> parse_open_body(std::string_view body);

    /// Map an HTTP method + path to an operation (query strings are ignored).
    [[nodiscard]] static Operation operation_for(std::string_view method, std::string_view path);

    /// Decode one application/x-www-form-urlencoded component ('+' and %XX).
    [[nodiscard]] static std::string form_decode(std::string_view component);
};

} // namespace urlrelay
