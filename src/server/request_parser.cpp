#include "server/request_parser.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

namespace urlrelay {

namespace {

using json = nlohmann::json;

Result<std::string> malformed(std::string message) {
    return Result<std::string>::error(ErrorCategory::MALFORMED_REQUEST, std::move(message));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> form_field(std::string_view body, std::string_view field) {
    size_t pos = 0;
    while (pos <= body.size()) {
        auto amp = body.find('&', pos);
        if (amp == std::string_view::npos) amp = body.size();
        const auto pair = body.substr(pos, amp - pos);
        const auto eq = pair.find('=');
        if (eq != std::string_view::npos &&
            RequestParser::form_decode(pair.substr(0, eq)) == field) {
            return RequestParser::form_decode(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

} // anonymous namespace

std::string RequestParser::form_decode(std::string_view component) {
    std::string out;
    out.reserve(component.size());
    for (size_t i = 0; i < component.size(); ++i) {
        const char c = component[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < component.size()) {
            const int hi = hex_value(component[i + 1]);
            const int lo = hex_value(component[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

Result<std::string> RequestParser::parse_open_body(std::string_view body) {
    const std::string trimmed = utils::trim(body);
    if (trimmed.empty()) {
        return malformed("Missing 'url'");
    }

    const json doc = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (!doc.is_discarded()) {
        if (!doc.is_object()) {
            return malformed("Request body must be a JSON object");
        }
        const auto it = doc.find("url");
        if (it == doc.end() || it->is_null()) {
            return malformed("Missing 'url'");
        }
        if (!it->is_string()) {
            return malformed("Field 'url' must be a string");
        }
        return Result<std::string>::ok(it->get<std::string>());
    }

    // Form-encoded fallback (url=https%3A%2F%2F...)
    if (trimmed.find('=') != std::string::npos && trimmed.front() != '{') {
        if (auto url = form_field(trimmed, "url")) {
            return Result<std::string>::ok(std::move(*url));
        }
        return malformed("Missing 'url'");
    }

    return malformed("Invalid JSON body");
}

Operation RequestParser::operation_for(std::string_view method, std::string_view path) {
    if (const auto q = path.find('?'); q != std::string_view::npos) {
        path = path.substr(0, q);
    }
    if (method == "GET" && path == http::kPingPath) return Operation::PING;
    if (method == "POST" && path == http::kOpenPath) return Operation::OPEN;
    return Operation::UNKNOWN;
}

} // namespace urlrelay
