#include "security/url_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace urlrelay {

namespace {

bool is_scheme_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

bool is_host_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
           c == '%' || u >= 0x80;  // UTF-8 IDN labels
}

bool requires_authority(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

Result<std::string> reject(std::string message) {
    return Result<std::string>::error(ErrorCategory::MALFORMED_REQUEST, std::move(message));
}

} // anonymous namespace

UrlValidator::UrlValidator() = default;

UrlValidator::UrlValidator(Config config)
    : config_(std::move(config)) {
    for (auto& scheme : config_.allowed_schemes) scheme = utils::to_lower(scheme);
}

std::string UrlValidator::extract_scheme(std::string_view url) {
    const auto colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) return "";
    const char first = url[0];
    if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z'))) return "";
    const auto scheme = url.substr(0, colon);
    if (!std::all_of(scheme.begin(), scheme.end(), is_scheme_char)) return "";
    return utils::to_lower(scheme);
}

bool UrlValidator::scheme_allowed(const std::string& scheme) const {
    return std::find(config_.allowed_schemes.begin(), config_.allowed_schemes.end(), scheme)
        != config_.allowed_schemes.end();
}

bool UrlValidator::valid_authority(std::string_view authority) {
    // Drop userinfo ("user:pass@")
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) return false;

    std::string_view host;
    std::string_view port;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos || close == 1) return false;
        const auto literal = authority.substr(1, close - 1);
        if (!std::all_of(literal.begin(), literal.end(), [](char c) {
                return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
            })) {
            return false;
        }
        const auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return false;
            port = rest.substr(1);
        }
        host = literal;
    } else {
        const auto colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) port = authority.substr(colon + 1);
        if (host.empty() || !std::all_of(host.begin(), host.end(), is_host_char)) return false;
    }

    if (!port.empty()) {
        const auto value = utils::try_parse_int<uint32_t>(port);
        if (!value || *value > 65535) return false;
    }
    return !host.empty();
}

Result<std::string> UrlValidator::validate(std::string_view raw) const {
    std::string url = utils::trim(raw);
    if (url.empty()) {
        return reject("Missing 'url'");
    }
    if (url.size() > config_.max_length) {
        return reject(std::format("URL too long: max {} bytes", config_.max_length));
    }
    for (const char c : url) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7F) {
            return reject("URL contains whitespace or control characters");
        }
    }

    const std::string scheme = extract_scheme(url);
    if (scheme.empty() || !scheme_allowed(scheme)) {
        return reject(std::format("Only {} URLs are permitted",
                                  utils::join(config_.allowed_schemes, "/")));
    }

    const std::string_view rest = std::string_view(url).substr(scheme.size() + 1);
    if (requires_authority(scheme)) {
        if (rest.size() < 2 || rest.substr(0, 2) != "//") {
            return reject("URL must have the form scheme://host/...");
        }
        const auto after_slashes = rest.substr(2);
        const auto end = after_slashes.find_first_of("/?#");
        if (!valid_authority(after_slashes.substr(0, end))) {
            return reject("URL has an invalid host");
        }
    } else if (rest.empty()) {
        return reject("URL has no content after the scheme");
    }

    return Result<std::string>::ok(std::move(url));
}

} // namespace urlrelay
