#include "server/connection_watchdog.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <charconv>
#include <filesystem>
#include <format>
#include <optional>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace urlrelay {

namespace {

// Lists the calling process's open descriptors on Linux and macOS
constexpr const char* kFdDirectory = "/dev/fd";

struct AcceptedSocket {
    int fd;
    std::string peer;
};

std::string peer_key(std::string_view address, int port) {
    return std::format("{}|{}", address, port);
}

int port_of(const sockaddr_storage& addr) {
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in&>(addr).sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6&>(addr).sin6_port);
    }
    return -1;
}

/// Peer key of @p fd if it is a connection accepted on @p port
std::optional<std::string> accepted_peer(int fd, int port) {
    sockaddr_storage local{};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) return std::nullopt;
    if (port_of(local) != port) return std::nullopt;

    // The listening socket itself has no peer
    sockaddr_storage peer{};
    len = sizeof(peer);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &len) != 0) return std::nullopt;

    std::array<char, NI_MAXHOST> host{};
    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&peer), len,
                      host.data(), host.size(), nullptr, 0, NI_NUMERICHOST) != 0) {
        return std::nullopt;
    }
    return peer_key(host.data(), port_of(peer));
}

std::vector<AcceptedSocket> scan_accepted(int port) {
    std::vector<AcceptedSocket> found;
    std::error_code ec;
    std::filesystem::directory_iterator it(kFdDirectory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename().string();
        int fd = -1;
        const auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), fd);
        if (err != std::errc{} || ptr != name.data() + name.size()) continue;
        if (auto peer = accepted_peer(fd, port)) {
            found.push_back({fd, std::move(*peer)});
        }
    }
    if (ec) {
        utils::log::warn(std::format("Connection watchdog: cannot list {}: {}",
                                     kFdDirectory, ec.message()));
    }
    return found;
}

} // anonymous namespace

ConnectionWatchdog::ConnectionWatchdog(const Config& config)
    : config_(config) {}

ConnectionWatchdog::~ConnectionWatchdog() {
    stop();
}

void ConnectionWatchdog::start() {
    if (watch_thread_.joinable()) return;
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
}

void ConnectionWatchdog::stop() {
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
}

void ConnectionWatchdog::mark_dispatched(std::string_view peer_address, int peer_port) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = connections_.try_emplace(peer_key(peer_address, peer_port),
                                                   Tracked{std::chrono::steady_clock::now()});
    it->second.dispatched = true;
}

size_t ConnectionWatchdog::cut_pending() {
    return sweep(/*cut_all=*/true);
}

size_t ConnectionWatchdog::tracked_count() const {
    std::lock_guard lock(mutex_);
    return connections_.size();
}

void ConnectionWatchdog::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::this_thread::sleep_for(config_.poll_interval);
        if (stop.stop_requested()) break;

        try {
            sweep(/*cut_all=*/false);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Connection watchdog sweep failed: {}", e.what()));
        }
    }
}

size_t ConnectionWatchdog::sweep(bool cut_all) {
    const auto scan_start = std::chrono::steady_clock::now();
    const auto sockets = scan_accepted(config_.port);

    std::vector<AcceptedSocket> overdue;
    {
        std::lock_guard lock(mutex_);
        std::unordered_set<std::string> seen;
        for (const auto& sock : sockets) {
            seen.insert(sock.peer);
            auto& tracked = connections_.try_emplace(sock.peer, Tracked{scan_start}).first->second;
            if (tracked.dispatched || tracked.cut) continue;
            if (cut_all || scan_start - tracked.first_seen >= config_.request_deadline) {
                tracked.cut = true;
                overdue.push_back(sock);
            }
        }
        // Entries added by mark_dispatched() after the scan began may not be listed yet
        std::erase_if(connections_, [&](const auto& entry) {
            return !seen.contains(entry.first) && entry.second.first_seen < scan_start;
        });
    }

    size_t cut = 0;
    for (const auto& sock : overdue) {
        // Re-check: the worker may have closed the descriptor and it may now be reused
        if (accepted_peer(sock.fd, config_.port) != sock.peer) continue;
        ::shutdown(sock.fd, SHUT_RDWR);
        ++cut;
        utils::log::warn(std::format("cut connection peer={} reason={}", sock.peer,
            cut_all ? "shutdown" : "request deadline exceeded"));
    }
    return cut;
}

} // namespace urlrelay
