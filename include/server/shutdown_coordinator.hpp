#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace urlrelay {

/**
 * @brief Tracks in-flight requests and drives the graceful-shutdown window
 *
 * The only primitive shared by handler threads. Once shutdown is requested
 * no new request may enter; wait_for_drain() then waits up to the grace
 * period for the in-flight count to reach zero.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds grace_period{3000};
    };

    /**
     * @brief RAII registration of one in-flight request
     *
     * admitted() is false when shutdown had already started; the scope then
     * holds no slot and its destructor does nothing.
     */
    class RequestScope {
    public:
        explicit RequestScope(ShutdownCoordinator& coordinator)
            : coordinator_(coordinator.try_enter_request() ? &coordinator : nullptr) {}
        ~RequestScope() { if (coordinator_) coordinator_->leave_request(); }

        RequestScope(const RequestScope&) = delete;
        RequestScope& operator=(const RequestScope&) = delete;

        [[nodiscard]] bool admitted() const { return coordinator_ != nullptr; }

    private:
        ShutdownCoordinator* coordinator_;
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Stop admitting requests. Idempotent.
    void request_shutdown();

    /// Returns false if shutting down; on true the caller must leave_request().
    [[nodiscard]] bool try_enter_request();

    void leave_request();

    /// Blocks until no request is in flight or the grace period expires.
    /// Returns true if drained cleanly, false if requests were abandoned.
    [[nodiscard]] bool wait_for_drain();

    /// As wait_for_drain(), against a deadline shared with other shutdown steps.
    [[nodiscard]] bool wait_for_drain(std::chrono::steady_clock::time_point deadline);

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::chrono::milliseconds grace_period() const { return config_.grace_period; }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace urlrelay
