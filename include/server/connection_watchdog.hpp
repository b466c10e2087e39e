#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace urlrelay {

/**
 * @brief Wall-clock deadline on reading a request, per accepted connection
 *
 * The socket read timeout only bounds a single recv(), so a client that
 * sends one byte at a time can hold a worker for as long as the header
 * size limits allow. The watchdog polls the process's descriptors for
 * sockets accepted on the listening port and shuts down any connection
 * whose request has not been dispatched within the deadline.
 *
 * Connections are keyed by peer address and port (the same values the
 * handler sees as remote_addr/remote_port). Once the handler calls
 * mark_dispatched() the connection is exempt; from there the opener
 * timeout bounds it.
 *
 * Cutting uses shutdown(), never close(): the worker still owns the
 * descriptor, sees end-of-stream and closes it itself.
 *
 * Thread-safety: mark_dispatched() and cut_pending() may be called from
 * any thread; polling runs on a single std::jthread.
 */
class ConnectionWatchdog {
public:
    struct Config {
        int port = 0;                                   // Listening port to watch
        std::chrono::milliseconds request_deadline{5000};
        std::chrono::milliseconds poll_interval{100};
    };

    explicit ConnectionWatchdog(const Config& config);
    ~ConnectionWatchdog();

    ConnectionWatchdog(const ConnectionWatchdog&) = delete;
    ConnectionWatchdog& operator=(const ConnectionWatchdog&) = delete;

    /// Start polling (spawns background thread)
    void start();

    /// Stop polling (joins background thread). Idempotent.
    void stop();

    /// The request on this connection has been read in full.
    void mark_dispatched(std::string_view peer_address, int peer_port);

    /**
     * @brief Shut down every connection that is still sending its request
     * @return Number of connections cut
     */
    size_t cut_pending();

    [[nodiscard]] size_t tracked_count() const;

private:
    struct Tracked {
        std::chrono::steady_clock::time_point first_seen;
        bool dispatched = false;
        bool cut = false;
    };

    void watch_loop(std::stop_token stop);

    /// One pass over the descriptor table; cuts overdue (or, with cut_all, all) pending connections
    size_t sweep(bool cut_all);

    Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Tracked> connections_;
    std::jthread watch_thread_;
};

} // namespace urlrelay
