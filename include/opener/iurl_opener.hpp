#pragma once

#include "core/types.hpp"

#include <string>

namespace urlrelay {

/**
 * @brief Capability to hand a URL to the host's browser
 *
 * Implementations receive only URLs that already passed UrlValidator.
 * open() must return within a bounded time even if the launched
 * application is still starting; a dispatched launch is never cancelled.
 * Implementations must be safe to call from several handler threads.
 */
class IUrlOpener {
public:
    virtual ~IUrlOpener() = default;

    [[nodiscard]] virtual OpenOutcome open(const std::string& url) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace urlrelay
