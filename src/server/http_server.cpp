#include "server/http_server.hpp"
#include "server/connection_watchdog.hpp"
#include "server/http_constants.hpp"
#include "server/request_parser.hpp"
#include "server/request_pipeline.hpp"
#include "server/responses.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only: suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>
#include <thread>

namespace urlrelay {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

/// Presented credential: the primary header wins, the legacy name is a fallback.
std::string extract_token(const httplib::Request& req) {
    if (req.has_header(http::kTokenHeader)) {
        return req.get_header_value(http::kTokenHeader);
    }
    return req.get_header_value(http::kLegacyTokenHeader);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<RequestPipeline> pipeline,
                       ServerConfig config,
                       std::shared_ptr<ShutdownCoordinator> shutdown_coordinator)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)),
      shutdown_coordinator_(std::move(shutdown_coordinator)),
      svr_(std::make_unique<httplib::Server>()) {
    if (!pipeline_) {
        throw std::invalid_argument("HttpServer requires a request pipeline");
    }
    if (!shutdown_coordinator_) {
        throw std::invalid_argument("HttpServer requires a shutdown coordinator");
    }
    configure();
}

HttpServer::~HttpServer() = default;

void HttpServer::configure() {
    auto& svr = *svr_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    svr.set_payload_max_length(config_.max_body_bytes);
    svr.set_read_timeout(config_.read_timeout);
    svr.set_write_timeout(config_.read_timeout);
    svr.set_keep_alive_max_count(1);

    if (config_.cors_enabled) {
        svr.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", http::kCorsAllowMethods},
            {"Access-Control-Allow-Headers", http::kCorsAllowHeaders},
        });
    }

    // Origin gate runs before the body is read: denied peers never get to upload
    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (pipeline_->admit_origin(req.remote_addr)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        write_response(responses::forbidden_origin(), res);
        return httplib::Server::HandlerResponse::Handled;
    });

    // Responses produced inside httplib (413, 400 on malformed framing) get a JSON body
    svr.set_error_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
        if (!res.body.empty()) return;
        const std::string message = httplib::status_message(res.status);
        const auto fallback = responses::error(res.status, ErrorCategory::MALFORMED_REQUEST, message);
        res.set_content(fallback.body, http::kJsonContentType);
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::log::debug(std::format("{} {} client={} status={}",
            req.method, req.path, req.remote_addr, res.status));
    });

    const auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(req, res);
    };
    // Every other method still goes through origin and auth before its 404
    svr.Get(".*", dispatch);
    svr.Post(".*", dispatch);
    svr.Put(".*", dispatch);
    svr.Patch(".*", dispatch);
    svr.Delete(".*", dispatch);

    // CORS preflight: no token required, headers come from the defaults above
    svr.Options(".*", [](const httplib::Request& /*req*/, httplib::Response& res) {
        res.status = httplib::StatusCode::NoContent_204;
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

int HttpServer::bind() {
    if (config_.port == 0) {
        bound_port_ = svr_->bind_to_any_port(config_.host);
    } else if (svr_->bind_to_port(config_.host, config_.port)) {
        bound_port_ = config_.port;
    } else {
        bound_port_ = -1;
    }
    if (bound_port_ <= 0) {
        throw std::runtime_error(std::format("Failed to bind {}:{}", config_.host, config_.port));
    }

    ConnectionWatchdog::Config watchdog_config;
    watchdog_config.port = bound_port_;
    watchdog_config.request_deadline = config_.read_timeout;
    watchdog_ = std::make_unique<ConnectionWatchdog>(watchdog_config);
    return bound_port_;
}

bool HttpServer::run() {
    if (bound_port_ <= 0) {
        throw std::logic_error("HttpServer::run() called before bind()");
    }
    {
        std::lock_guard lock(state_mutex_);
        if (stop_requested_) {
            state_ = RunState::STOPPED;
            state_cv_.notify_all();
            return true;
        }
        state_ = RunState::LISTENING;
    }

    watchdog_->start();
    utils::log::info(std::format("Listening on {}:{} ({} threads)",
        config_.host, bound_port_, config_.thread_pool_size));
    const bool clean = svr_->listen_after_bind();
    watchdog_->stop();

    {
        std::lock_guard lock(state_mutex_);
        state_ = RunState::STOPPED;
    }
    state_cv_.notify_all();
    return clean;
}

void HttpServer::stop() {
    {
        std::lock_guard lock(state_mutex_);
        if (stop_requested_) return;
        stop_requested_ = true;
        if (state_ != RunState::LISTENING) return;
    }
    close_listener();
}

void HttpServer::close_listener() {
    // httplib ignores stop() until listen_after_bind() has flagged itself running
    while (!svr_->is_running()) {
        {
            std::lock_guard lock(state_mutex_);
            if (state_ != RunState::LISTENING) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    svr_->stop();
    const size_t cut = watchdog_->cut_pending();
    utils::log::info(std::format("Listener closed ({} partial requests cut)", cut));
}

bool HttpServer::shutdown() {
    const auto deadline = std::chrono::steady_clock::now() + shutdown_coordinator_->grace_period();
    shutdown_coordinator_->request_shutdown();
    stop();
    const bool drained = shutdown_coordinator_->wait_for_drain(deadline);
    return drained && wait_for_stopped(deadline);
}

bool HttpServer::wait_for_stopped(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(state_mutex_);
    return state_cv_.wait_until(lock, deadline, [this] { return state_ != RunState::LISTENING; });
}

void HttpServer::wait_until_ready() const {
    svr_->wait_until_ready();
}

// ============================================================================
// Request handling
// ============================================================================

void HttpServer::handle_request(const httplib::Request& req, httplib::Response& res) {
    watchdog_->mark_dispatched(req.remote_addr, req.remote_port);

    const ShutdownCoordinator::RequestScope scope(*shutdown_coordinator_);
    if (!scope.admitted()) {
        write_response(responses::shutting_down(), res);
        return;
    }

    try {
        InboundRequest inbound;
        inbound.operation = RequestParser::operation_for(req.method, req.path);
        inbound.source_address = req.remote_addr;
        inbound.token = extract_token(req);

        if (inbound.operation == Operation::OPEN) {
            auto parsed = RequestParser::parse_open_body(req.body);
            if (parsed.is_ok()) {
                inbound.url = std::move(parsed.value());
            } else {
                inbound.parse_error = parsed.error_message();
            }
        }

        const RelayResponse response = pipeline_->execute(inbound);
        if (!response.ok()) {
            utils::log::debug(std::format("reject op={} client={} status={} category={}",
                operation_to_string(inbound.operation), inbound.source_address,
                response.status, error_category_to_string(response.category)));
        }
        write_response(response, res);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Unhandled error on {} {} client={}: {}",
            req.method, req.path, req.remote_addr, e.what()));
        write_response(responses::internal_error(), res);
    }
}

void HttpServer::write_response(const RelayResponse& response, httplib::Response& res) {
    res.status = response.status;
    res.set_content(response.body, http::kJsonContentType);
}

} // namespace urlrelay
