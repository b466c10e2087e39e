#include "opener/url_opener_factory.hpp"
#include "opener/dry_run_url_opener.hpp"
#include "opener/system_url_opener.hpp"

namespace urlrelay {

std::shared_ptr<IUrlOpener> make_url_opener(const OpenerConfig& config) {
    if (config.dry_run) {
        return std::make_shared<DryRunUrlOpener>();
    }
    SystemUrlOpener::Config system_config;
    system_config.command = config.command;
    system_config.browser = config.browser;
    system_config.timeout = config.timeout;
    return std::make_shared<SystemUrlOpener>(std::move(system_config));
}

} // namespace urlrelay
