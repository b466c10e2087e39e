#include "server/request_router.hpp"
#include "server/responses.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace urlrelay {

RequestRouter::RequestRouter(std::shared_ptr<IUrlOpener> opener, UrlValidator validator)
    : opener_(std::move(opener)),
      validator_(std::move(validator)) {
    if (!opener_) {
        throw std::invalid_argument("RequestRouter requires a URL opener");
    }
}

RelayResponse RequestRouter::route(const InboundRequest& request) const {
    switch (request.operation) {
        case Operation::PING: return handle_ping(request);
        case Operation::OPEN: return handle_open(request);
        default:
            return responses::not_found();
    }
}

RelayResponse RequestRouter::handle_ping(const InboundRequest& /*request*/) const {
    return responses::ok({
        {"service", std::string(kServiceName)},
        {"version", std::string(kServiceVersion)},
    });
}

RelayResponse RequestRouter::handle_open(const InboundRequest& request) const {
    if (request.parse_error) {
        return responses::error(400, ErrorCategory::MALFORMED_REQUEST, *request.parse_error);
    }
    if (!request.url) {
        return responses::error(400, ErrorCategory::MALFORMED_REQUEST, "Missing 'url'");
    }

    const auto validated = validator_.validate(*request.url);
    if (validated.is_error()) {
        utils::log::warn(std::format("open rejected client={} reason=\"{}\"",
            request.source_address, validated.error_message()));
        return responses::error(400, validated.error_category(), validated.error_message());
    }
    const std::string& url = validated.value();

    const OpenOutcome outcome = opener_->open(url);
    if (!outcome.success) {
        const std::string detail = outcome.error.value_or("Open failed");
        utils::log::error(std::format("open failed client={} url={} elapsed_ms={} error=\"{}\"",
            request.source_address, url, outcome.elapsed.count(), detail));
        return responses::error(502, ErrorCategory::OPEN_FAILURE, detail);
    }

    utils::log::info(std::format("open ok client={} url={} opener=\"{}\" elapsed_ms={}",
        request.source_address, url, opener_->name(), outcome.elapsed.count()));
    return responses::ok({
        {"message", "Open dispatched"},
        {"url", url},
        {"opener", opener_->name()},
        {"elapsed_ms", outcome.elapsed.count()},
    });
}

} // namespace urlrelay
