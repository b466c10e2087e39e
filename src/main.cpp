#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "opener/url_opener_factory.hpp"
#include "server/http_server.hpp"
#include "server/request_pipeline.hpp"
#include "server/shutdown_coordinator.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <pthread.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace urlrelay;

namespace {

std::optional<std::string> resolve_config_path(int argc, char* argv[]) {
    if (argc > 1) {
        return std::string(argv[1]);
    }
    if (const char* from_env = std::getenv(env::kConfigPath); from_env && *from_env) {
        return std::string(from_env);
    }
    return std::nullopt;
}

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

void log_banner(const RelayConfig& config, const IUrlOpener& opener, int port) {
    utils::log::info(std::format("{} {} ready", kServiceName, kServiceVersion));
    utils::log::info(std::format("  bind:    {}:{}", config.server.host, port));
    utils::log::info(std::format("  subnets: {}", utils::join(config.security.allowed_subnets, ", ")));
    utils::log::info(std::format("  token:   {}", utils::redact_secret(config.security.token)));
    utils::log::info(std::format("  opener:  {}", opener.name()));
    utils::log::info(std::format("  endpoints: GET http://{0}:{1}/ping, POST http://{0}:{1}/open",
        config.server.host, port));
}

/**
 * @brief Dedicated signal thread: waits for SIGINT/SIGTERM, then drains
 *
 * HttpServer::shutdown() stops admission, closes the listener, cuts
 * connections still sending a request and waits for in-flight handlers
 * and the worker pool, all within the grace period. Anything still
 * running after that is abandoned by exiting the process.
 */
void watch_signals(sigset_t signals, ShutdownCoordinator& coordinator, HttpServer& server) {
    int signal = 0;
    if (sigwait(&signals, &signal) != 0) {
        utils::log::error("sigwait failed; shutting down");
    } else {
        utils::log::info(std::format("Received signal {}, shutting down...", signal));
    }

    if (server.shutdown()) {
        utils::log::info("All in-flight requests drained");
        return;
    }
    utils::log::warn(std::format("Shutdown timeout: {} requests still in flight after {} ms",
        coordinator.in_flight_count(), coordinator.grace_period().count()));
    std::quick_exit(EXIT_SUCCESS);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto config_path = resolve_config_path(argc, argv);
        utils::log::info(std::format("Loading configuration from {}",
            config_path.value_or("defaults + environment")));

        auto loaded = ConfigLoader::load(config_path);
        if (!loaded.success) {
            utils::log::error(std::format("[{}] {}",
                error_category_to_string(ErrorCategory::CONFIG_ERROR), loaded.error_message));
            return 1;
        }
        const RelayConfig config = std::move(loaded.config);
        utils::log::set_verbose(config.logging.verbose);

        // Block before any thread starts so every thread inherits the mask
        const sigset_t signals = shutdown_signals();
        if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
            throw std::runtime_error("Failed to block shutdown signals");
        }

        auto opener = make_url_opener(config.opener);
        auto pipeline = RequestPipeline::build(config, opener);

        ShutdownCoordinator::Config shutdown_config;
        shutdown_config.grace_period = config.server.shutdown_grace;
        auto coordinator = std::make_shared<ShutdownCoordinator>(shutdown_config);

        HttpServer server(pipeline, config.server, coordinator);
        const int port = server.bind();
        log_banner(config, *opener, port);

        std::thread signal_thread(watch_signals, signals, std::ref(*coordinator), std::ref(server));

        const bool clean = server.run();

        // Wake the signal thread if the listener stopped on its own
        if (!coordinator->is_shutting_down()) {
            ::kill(::getpid(), SIGTERM);
        }
        signal_thread.join();

        if (!clean) {
            utils::log::error("Listener stopped unexpectedly");
            return 1;
        }
        utils::log::info("Shutdown complete");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
