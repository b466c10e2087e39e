#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace urlrelay {

class ConnectionWatchdog;
class RequestPipeline;
class ShutdownCoordinator;

/**
 * @brief HTTP listener for the relay (cpp-httplib, fixed worker pool)
 *
 * Per connection: origin filter in the pre-routing hook (before the body
 * is read), payload cap (413), read/write timeouts, one request per
 * connection. read_timeout also bounds the whole request read: a
 * ConnectionWatchdog cuts connections that have not delivered a complete
 * request within it. Every route funnels into handle_request(), which
 * builds an InboundRequest and runs it through the RequestPipeline.
 *
 * Lifecycle: bind() → run() (blocks) ... stop() or shutdown() from another
 * thread. stop() may arrive before run() starts listening; run() then
 * returns at once.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<RequestPipeline> pipeline,
               ServerConfig config,
               std::shared_ptr<ShutdownCoordinator> shutdown_coordinator);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listening socket (port 0 picks an ephemeral port)
     * @return The bound port
     * @throws std::runtime_error if the address cannot be bound
     */
    int bind();

    /**
     * @brief Accept connections until stop(); requires a successful bind()
     * @return false if the accept loop failed rather than being stopped
     */
    bool run();

    /**
     * @brief Close the listening socket and cut connections still sending a request
     *
     * Safe to call from any thread, any number of times. Admitted requests
     * keep running; run() returns once the worker pool has finished them.
     */
    void stop();

    /**
     * @brief Graceful stop bounded by the coordinator's grace period
     *
     * Stops admission, calls stop(), then waits for in-flight handlers to
     * drain and for run() to return, all against one deadline.
     * @return false if the grace period ran out first
     */
    [[nodiscard]] bool shutdown();

    /// Block until run() is accepting connections.
    void wait_until_ready() const;

    [[nodiscard]] int port() const { return bound_port_; }

private:
    enum class RunState { IDLE, LISTENING, STOPPED };

    void configure();
    void close_listener();
    [[nodiscard]] bool wait_for_stopped(std::chrono::steady_clock::time_point deadline);
    void handle_request(const httplib::Request& req, httplib::Response& res);

    static void write_response(const RelayResponse& response, httplib::Response& res);

    std::shared_ptr<RequestPipeline> pipeline_;
    const ServerConfig config_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
    std::unique_ptr<httplib::Server> svr_;
    std::unique_ptr<ConnectionWatchdog> watchdog_;
    int bound_port_ = -1;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    RunState state_ = RunState::IDLE;
    bool stop_requested_ = false;
};

} // namespace urlrelay
