#include "server/request_pipeline.hpp"
#include "server/responses.hpp"
#include "core/utils.hpp"

#include <format>

namespace urlrelay {

RequestPipeline::RequestPipeline(OriginFilter origin_filter, AuthGuard auth_guard,
                                 RequestRouter router)
    : origin_filter_(std::move(origin_filter)),
      auth_guard_(std::move(auth_guard)),
      router_(std::move(router)) {}

std::shared_ptr<RequestPipeline> RequestPipeline::build(
    const RelayConfig& config, std::shared_ptr<IUrlOpener> opener) {
    UrlValidator::Config validator_config;
    validator_config.allowed_schemes = config.security.allowed_schemes;
    validator_config.max_length = config.security.max_url_length;

    return std::make_shared<RequestPipeline>(
        OriginFilter(config.security.allowed_subnets),
        AuthGuard(config.security.token),
        RequestRouter(std::move(opener), UrlValidator(std::move(validator_config))));
}

bool RequestPipeline::admit_origin(std::string_view source_address) const {
    if (origin_filter_.is_allowed(source_address)) return true;
    utils::log::debug(std::format("deny origin client={}", source_address));
    return false;
}

RelayResponse RequestPipeline::execute(const InboundRequest& request) const {
    if (!admit_origin(request.source_address)) {
        return responses::forbidden_origin();
    }

    if (!auth_guard_.verify(request.token)) {
        utils::log::warn(std::format("deny token client={} op={} token={}",
            request.source_address, operation_to_string(request.operation),
            request.token.empty() ? "missing" : "mismatch"));
        return responses::unauthorized();
    }

    return router_.route(request);
}

} // namespace urlrelay
