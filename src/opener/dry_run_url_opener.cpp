#include "opener/dry_run_url_opener.hpp"
#include "core/utils.hpp"

#include <format>

namespace urlrelay {

OpenOutcome DryRunUrlOpener::open(const std::string& url) {
    utils::log::info(std::format("[dry-run] would open url={}", url));
    return OpenOutcome::ok();
}

} // namespace urlrelay
