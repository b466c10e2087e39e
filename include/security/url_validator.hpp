#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace urlrelay {

/**
 * @brief Scheme + syntax check applied before any URL reaches an opener
 *
 * Accepted URLs:
 * - start with an allowed scheme (default: http, https)
 * - contain no whitespace or control bytes
 * - for http/https: carry a non-empty host and an optional numeric port
 * - stay within max_length bytes
 *
 * The launcher receives the URL as one argv element, never through a
 * shell; this check keeps option-like or local-file targets out as well.
 */
class UrlValidator {
public:
    struct Config {
        std::vector<std::string> allowed_schemes{"http", "https"};
        size_t max_length = 8192;
    };

    UrlValidator();
    explicit UrlValidator(Config config);

    /**
     * @brief Validate a raw URL string
     * @return Trimmed URL on success, MALFORMED_REQUEST error otherwise
     */
    [[nodiscard]] Result<std::string> validate(std::string_view raw) const;

    /// Lower-cased scheme, or empty if the string has no syntactically valid scheme.
    [[nodiscard]] static std::string extract_scheme(std::string_view url);

private:
    [[nodiscard]] bool scheme_allowed(const std::string& scheme) const;
    [[nodiscard]] static bool valid_authority(std::string_view authority);

    Config config_;
};

} // namespace urlrelay
