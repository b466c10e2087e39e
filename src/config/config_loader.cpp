#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/origin_filter.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

namespace urlrelay {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed extraction)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

using Errors = std::vector<std::string>;

void read_string(const toml::table& tbl, std::string_view section, std::string_view key,
                 std::string& out, Errors& errors) {
    const auto node = tbl[key];
    if (!node) return;
    if (const auto v = node.value<std::string>(); v && node.is_string()) {
        out = *v;
    } else {
        errors.push_back(std::format("{}.{} must be a string", section, key));
    }
}

void read_bool(const toml::table& tbl, std::string_view section, std::string_view key,
               bool& out, Errors& errors) {
    const auto node = tbl[key];
    if (!node) return;
    if (const auto v = node.value<bool>(); v && node.is_boolean()) {
        out = *v;
    } else {
        errors.push_back(std::format("{}.{} must be a boolean", section, key));
    }
}

std::optional<int64_t> read_int(const toml::table& tbl, std::string_view section,
                                std::string_view key, Errors& errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (!node.is_integer()) {
        errors.push_back(std::format("{}.{} must be an integer", section, key));
        return std::nullopt;
    }
    return node.value<int64_t>();
}

void read_positive_ms(const toml::table& tbl, std::string_view section, std::string_view key,
                      std::chrono::milliseconds& out, Errors& errors) {
    if (const auto v = read_int(tbl, section, key, errors)) {
        if (*v <= 0) {
            errors.push_back(std::format("{}.{} must be > 0, got {}", section, key, *v));
        } else {
            out = std::chrono::milliseconds(*v);
        }
    }
}

void read_string_array(const toml::table& tbl, std::string_view section, std::string_view key,
                       std::vector<std::string>& out, Errors& errors) {
    const auto node = tbl[key];
    if (!node) return;
    const auto* arr = node.as_array();
    if (!arr) {
        errors.push_back(std::format("{}.{} must be an array of strings", section, key));
        return;
    }
    std::vector<std::string> values;
    values.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            auto v = utils::trim(s->get());
            if (!v.empty()) values.emplace_back(std::move(v));
        } else {
            errors.push_back(std::format("{}.{} must contain only strings", section, key));
            return;
        }
    }
    out = std::move(values);
}

// ---- Section extractors ----------------------------------------------------

void extract_server(const toml::table& root, ServerConfig& cfg, Errors& errors) {
    const auto* server = root["server"].as_table();
    if (!server) return;
    const auto& s = *server;

    read_string(s, "server", "host", cfg.host, errors);
    if (const auto port = read_int(s, "server", "port", errors)) {
        if (!utils::in_range<1, 65535>(*port)) {
            errors.push_back(std::format("server.port must be 1-65535, got {}", *port));
        } else {
            cfg.port = static_cast<uint16_t>(*port);
        }
    }
    if (const auto threads = read_int(s, "server", "threads", errors)) {
        if (!utils::in_range<1, 256>(*threads)) {
            errors.push_back(std::format("server.threads must be 1-256, got {}", *threads));
        } else {
            cfg.thread_pool_size = static_cast<size_t>(*threads);
        }
    }
    if (const auto body = read_int(s, "server", "max_body_bytes", errors)) {
        if (*body <= 0) {
            errors.push_back(std::format("server.max_body_bytes must be > 0, got {}", *body));
        } else {
            cfg.max_body_bytes = static_cast<size_t>(*body);
        }
    }
    read_positive_ms(s, "server", "read_timeout_ms", cfg.read_timeout, errors);
    read_positive_ms(s, "server", "shutdown_grace_ms", cfg.shutdown_grace, errors);
    read_bool(s, "server", "cors", cfg.cors_enabled, errors);
}

void extract_security(const toml::table& root, SecurityConfig& cfg, Errors& errors) {
    const auto* security = root["security"].as_table();
    if (!security) return;
    const auto& s = *security;

    read_string(s, "security", "token", cfg.token, errors);
    read_string_array(s, "security", "allowed_subnets", cfg.allowed_subnets, errors);
    read_string_array(s, "security", "allowed_schemes", cfg.allowed_schemes, errors);
    for (auto& scheme : cfg.allowed_schemes) scheme = utils::to_lower(scheme);
    if (const auto len = read_int(s, "security", "max_url_length", errors)) {
        if (*len <= 0) {
            errors.push_back(std::format("security.max_url_length must be > 0, got {}", *len));
        } else {
            cfg.max_url_length = static_cast<size_t>(*len);
        }
    }
}

void extract_opener(const toml::table& root, OpenerConfig& cfg, Errors& errors) {
    const auto* opener = root["opener"].as_table();
    if (!opener) return;
    const auto& o = *opener;

    read_bool(o, "opener", "dry_run", cfg.dry_run, errors);
    read_string(o, "opener", "browser", cfg.browser, errors);
    read_string_array(o, "opener", "command", cfg.command, errors);
    read_positive_ms(o, "opener", "timeout_ms", cfg.timeout, errors);
}

void extract_logging(const toml::table& root, LoggingConfig& cfg, Errors& errors) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return;
    read_bool(*logging, "logging", "verbose", cfg.verbose, errors);
}

RelayConfig extract_all_sections(const toml::table& root, Errors& errors) {
    RelayConfig cfg;
    extract_server(root, cfg.server, errors);
    extract_security(root, cfg.security, errors);
    extract_opener(root, cfg.opener, errors);
    extract_logging(root, cfg.logging, errors);
    return cfg;
}

// ---- Environment helpers ---------------------------------------------------

/// A variable that is set, with the name it was found under
struct EnvSetting {
    const char* name;
    std::string value;
};

const char* legacy_name(std::string_view name) {
    if (name == env::kPort)           return env::kLegacyPort;
    if (name == env::kBind)           return env::kLegacyBind;
    if (name == env::kToken)          return env::kLegacyToken;
    if (name == env::kAllowedSubnets) return env::kLegacyAllowedSubnets;
    if (name == env::kDryRun)         return env::kLegacyDryRun;
    if (name == env::kVerbose)        return env::kLegacyVerbose;
    return nullptr;
}

std::optional<EnvSetting> env_value(const char* name) {
    if (const char* raw = std::getenv(name)) {
        return EnvSetting{name, raw};
    }
    const char* legacy = legacy_name(name);
    if (!legacy) return std::nullopt;
    const char* raw = std::getenv(legacy);
    if (!raw) return std::nullopt;
    utils::log::warn(std::format("{} is deprecated, use {}", legacy, name));
    return EnvSetting{legacy, raw};
}

void env_positive_ms(const char* name, std::chrono::milliseconds& out, Errors& errors) {
    const auto setting = env_value(name);
    if (!setting) return;
    const auto v = utils::try_parse_int<int64_t>(utils::trim(setting->value));
    if (!v || *v <= 0) {
        errors.push_back(std::format("{} must be a positive integer, got '{}'",
                                     setting->name, setting->value));
        return;
    }
    out = std::chrono::milliseconds(*v);
}

void env_bool(const char* name, bool& out, Errors& errors) {
    const auto setting = env_value(name);
    if (!setting) return;
    const auto v = utils::parse_bool(utils::trim(setting->value));
    if (!v) {
        errors.push_back(std::format("{} must be true or false, got '{}'",
                                     setting->name, setting->value));
        return;
    }
    out = *v;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::vector<std::string> ConfigLoader::apply_env_overrides(RelayConfig& config) {
    Errors errors;

    if (const auto port = env_value(env::kPort)) {
        const auto v = utils::try_parse_int<int64_t>(utils::trim(port->value));
        if (!v || !utils::in_range<1, 65535>(*v)) {
            errors.push_back(std::format("{} must be 1-65535, got '{}'", port->name, port->value));
        } else {
            config.server.port = static_cast<uint16_t>(*v);
        }
    }
    if (const auto bind = env_value(env::kBind); bind && !bind->value.empty()) {
        config.server.host = utils::trim(bind->value);
    }
    if (const auto token = env_value(env::kToken)) {
        config.security.token = token->value;
    }
    if (const auto subnets = env_value(env::kAllowedSubnets)) {
        config.security.allowed_subnets = utils::split_list(subnets->value);
    }
    if (const auto browser = env_value(env::kBrowser)) {
        config.opener.browser = utils::trim(browser->value);
    }
    if (const auto threads = env_value(env::kThreads)) {
        const auto v = utils::try_parse_int<int64_t>(utils::trim(threads->value));
        if (!v || !utils::in_range<1, 256>(*v)) {
            errors.push_back(std::format("{} must be 1-256, got '{}'", threads->name, threads->value));
        } else {
            config.server.thread_pool_size = static_cast<size_t>(*v);
        }
    }
    if (const auto body = env_value(env::kMaxBodyBytes)) {
        const auto v = utils::try_parse_int<int64_t>(utils::trim(body->value));
        if (!v || *v <= 0) {
            errors.push_back(std::format("{} must be a positive integer, got '{}'",
                                         body->name, body->value));
        } else {
            config.server.max_body_bytes = static_cast<size_t>(*v);
        }
    }

    env_bool(env::kVerbose, config.logging.verbose, errors);
    env_bool(env::kDryRun, config.opener.dry_run, errors);
    env_positive_ms(env::kOpenTimeoutMs, config.opener.timeout, errors);
    env_positive_ms(env::kReadTimeoutMs, config.server.read_timeout, errors);
    env_positive_ms(env::kShutdownGraceMs, config.server.shutdown_grace, errors);

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RelayConfig config,
                                                           std::vector<std::string> errors) {
    const auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load(const std::optional<std::string>& config_path) {
    try {
        Errors errors;
        RelayConfig config;
        if (config_path) {
            auto tbl = toml::parse_file(*config_path);
            expand_env_vars_recursive(tbl);
            config = extract_all_sections(tbl, errors);
        }
        const auto env_errors = apply_env_overrides(config);
        errors.insert(errors.end(), env_errors.begin(), env_errors.end());
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        Errors errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        Errors errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RelayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535, got 0");
    }
    if (config.server.host.empty()) {
        errors.push_back("server.host must not be empty");
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.read_timeout.count() <= 0) {
        errors.push_back("server.read_timeout_ms must be > 0");
    }
    if (config.server.shutdown_grace.count() <= 0) {
        errors.push_back("server.shutdown_grace_ms must be > 0");
    }
    if (config.opener.timeout.count() <= 0) {
        errors.push_back("opener.timeout_ms must be > 0");
    }

    if (config.security.token.empty()) {
        errors.push_back("security.token must not be empty (set URL_RELAY_TOKEN)");
    }

    // An empty list is legal (fail-closed), but every listed entry must parse
    for (const auto& entry : config.security.allowed_subnets) {
        OriginFilter::Range range;
        if (!OriginFilter::parse_range(entry, range)) {
            errors.push_back(std::format("security.allowed_subnets: invalid CIDR '{}'", entry));
        }
    }

    if (config.security.allowed_schemes.empty()) {
        errors.push_back("security.allowed_schemes must not be empty");
    }
    for (const auto& scheme : config.security.allowed_schemes) {
        if (scheme == "file" || scheme == "javascript" || scheme == "data") {
            errors.push_back(std::format(
                "security.allowed_schemes: '{}' is not a browser-navigable remote scheme", scheme));
        }
    }

    return errors;
}

} // namespace urlrelay
