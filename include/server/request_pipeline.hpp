#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "opener/iurl_opener.hpp"
#include "security/auth_guard.hpp"
#include "security/origin_filter.hpp"
#include "server/request_router.hpp"

#include <memory>
#include <string_view>

namespace urlrelay {

/**
 * @brief Per-request gate sequence: origin filter → auth guard → router
 *
 * Immutable after construction; one instance is shared by all handler
 * threads without locking.
 */
class RequestPipeline {
public:
    RequestPipeline(OriginFilter origin_filter, AuthGuard auth_guard, RequestRouter router);

    /**
     * @brief Build the pipeline described by config around an opener
     * @throws std::invalid_argument on invalid ranges or empty token
     */
    [[nodiscard]] static std::shared_ptr<RequestPipeline> build(
        const RelayConfig& config, std::shared_ptr<IUrlOpener> opener);

    /// Origin gate alone, used before the request body is read.
    [[nodiscard]] bool admit_origin(std::string_view source_address) const;

    /**
     * @brief Run every gate and the router for one request
     *
     * A denied origin stops processing before the token is looked at.
     */
    [[nodiscard]] RelayResponse execute(const InboundRequest& request) const;

private:
    OriginFilter origin_filter_;
    AuthGuard auth_guard_;
    RequestRouter router_;
};

} // namespace urlrelay
