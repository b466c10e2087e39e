#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace urlrelay {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    std::chrono::milliseconds read_timeout;    // Per-connection read/write bound
    std::chrono::milliseconds shutdown_grace;  // Drain window after SIGINT/SIGTERM
    size_t max_body_bytes;                     // Larger bodies get 413 before being read
    bool cors_enabled = true;

    ServerConfig()
        : host("0.0.0.0"),
          port(51888),
          thread_pool_size(4),
          read_timeout(5000),
          shutdown_grace(3000),
          max_body_bytes(16384) {}
};

struct SecurityConfig {
    std::string token;                                // Shared secret (required)
    std::vector<std::string> allowed_subnets{         // CIDR list; "*" / "all" = everyone
        "10.211.55.0/24", "10.37.129.0/24"};
    std::vector<std::string> allowed_schemes{"http", "https"};
    size_t max_url_length = 8192;
};

struct OpenerConfig {
    bool dry_run = false;
    std::string browser;                 // Application name for `open -a` (empty = default)
    std::vector<std::string> command;    // Launcher argv prefix; empty = platform default
    std::chrono::milliseconds timeout{5000};
};

struct LoggingConfig {
    bool verbose = true;
};

/**
 * @brief Complete relay configuration, immutable after startup
 */
struct RelayConfig {
    ServerConfig server;
    SecurityConfig security;
    OpenerConfig opener;
    LoggingConfig logging;
};

} // namespace urlrelay
