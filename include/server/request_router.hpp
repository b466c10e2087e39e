#pragma once

#include "core/types.hpp"
#include "opener/iurl_opener.hpp"
#include "security/url_validator.hpp"

#include <memory>

namespace urlrelay {

/**
 * @brief Dispatches an authenticated request to ping or open
 *
 * Stateless: concurrent route() calls share only the validator (read-only)
 * and the opener (thread-safe by contract).
 */
class RequestRouter {
public:
    RequestRouter(std::shared_ptr<IUrlOpener> opener, UrlValidator validator);

    /**
     * @brief Produce the response for an already origin- and auth-checked request
     *
     * - PING: static acknowledgement, no side effects
     * - OPEN: validate URL (400 on failure), then dispatch (502 on failure)
     * - UNKNOWN: 404, no side effects
     */
    [[nodiscard]] RelayResponse route(const InboundRequest& request) const;

private:
    [[nodiscard]] RelayResponse handle_ping(const InboundRequest& request) const;
    [[nodiscard]] RelayResponse handle_open(const InboundRequest& request) const;

    std::shared_ptr<IUrlOpener> opener_;
    UrlValidator validator_;
};

} // namespace urlrelay
