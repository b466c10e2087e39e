#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace urlrelay {

// ============================================================================
// Environment variable names (consumed by apply_env_overrides)
// ============================================================================

namespace env {
inline constexpr const char* kConfigPath      = "URL_RELAY_CONFIG";
inline constexpr const char* kPort            = "URL_RELAY_PORT";
inline constexpr const char* kBind            = "URL_RELAY_BIND";
inline constexpr const char* kToken           = "URL_RELAY_TOKEN";
inline constexpr const char* kAllowedSubnets  = "URL_RELAY_ALLOWED_SUBNETS";
inline constexpr const char* kVerbose         = "URL_RELAY_VERBOSE";
inline constexpr const char* kDryRun          = "URL_RELAY_DRY_RUN";
inline constexpr const char* kBrowser         = "URL_RELAY_BROWSER";
inline constexpr const char* kOpenTimeoutMs   = "URL_RELAY_OPEN_TIMEOUT_MS";
inline constexpr const char* kReadTimeoutMs   = "URL_RELAY_READ_TIMEOUT_MS";
inline constexpr const char* kShutdownGraceMs = "URL_RELAY_SHUTDOWN_GRACE_MS";
inline constexpr const char* kMaxBodyBytes    = "URL_RELAY_MAX_BODY_BYTES";
inline constexpr const char* kThreads         = "URL_RELAY_THREADS";

// Names used by earlier launcher setups (LaunchAgent plists); read only
// when the URL_RELAY_* counterpart is unset
inline constexpr const char* kLegacyPort           = "OIS_PORT";
inline constexpr const char* kLegacyBind           = "OIS_BIND";
inline constexpr const char* kLegacyToken          = "OIS_TOKEN";
inline constexpr const char* kLegacyAllowedSubnets = "OIS_ALLOWED_SUBNETS";
inline constexpr const char* kLegacyDryRun         = "OIS_DRY_RUN";
inline constexpr const char* kLegacyVerbose        = "OIS_VERBOSE";
} // namespace env

// ============================================================================
// ConfigLoader - Build a RelayConfig from defaults, TOML and environment
// ============================================================================

/**
 * @brief Loads the relay configuration
 *
 * Precedence (later wins): built-in defaults, TOML file, environment.
 * String values in the TOML file may reference ${VAR} environment variables.
 * Every error is a ConfigError: the caller is expected to abort startup.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RelayConfig config;

        static LoadResult ok(RelayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Full startup load: optional TOML file, then environment overrides
     * @param config_path Path to a TOML file, or std::nullopt for defaults only
     */
    [[nodiscard]] static LoadResult load(const std::optional<std::string>& config_path);

    /**
     * @brief Load config from a TOML file (no environment overrides)
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content (no environment overrides)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply URL_RELAY_* environment variables (or their OIS_* aliases) on top of config
     * @return Errors for variables that are set but unparsable
     */
    [[nodiscard]] static std::vector<std::string> apply_env_overrides(RelayConfig& config);

    /**
     * @brief Check cross-field invariants (port range, token, CIDRs, timeouts)
     * @return List of human-readable errors, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RelayConfig& config);

private:
    static LoadResult validate_and_return(RelayConfig config, std::vector<std::string> errors);
};

} // namespace urlrelay
