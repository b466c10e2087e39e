#pragma once

#include "config/config_types.hpp"
#include "opener/iurl_opener.hpp"

#include <memory>

namespace urlrelay {

/// DryRunUrlOpener when config.dry_run is set, SystemUrlOpener otherwise.
[[nodiscard]] std::shared_ptr<IUrlOpener> make_url_opener(const OpenerConfig& config);

} // namespace urlrelay
