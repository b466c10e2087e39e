#pragma once

#include "opener/iurl_opener.hpp"

namespace urlrelay {

/**
 * @brief No-op opener used when dry_run is set: logs and reports success
 */
class DryRunUrlOpener : public IUrlOpener {
public:
    [[nodiscard]] OpenOutcome open(const std::string& url) override;

    [[nodiscard]] std::string name() const override { return "dry-run"; }
};

} // namespace urlrelay
