#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace steadfast {

// ============================================================================
// TOML Parsing Helpers (env expansion)
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

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Counts and sizes must not be negative; a negative value would wrap
int64_t read_count(const toml::table& tbl, std::string_view section, std::string_view key,
                   int64_t default_value) {
    const int64_t value = tbl[key].value_or(default_value);
    if (value < 0) {
        throw std::runtime_error(std::format("{}.{} must not be negative, got {}", section, key, value));
    }
    return value;
}

std::chrono::milliseconds read_ms(const toml::table& tbl, std::string_view section,
                                  std::string_view key, std::chrono::milliseconds default_value) {
    return std::chrono::milliseconds(read_count(tbl, section, key, default_value.count()));
}

EndpointConfig extract_endpoint(const toml::table& tbl, std::string_view section,
                                const EndpointConfig& defaults) {
    EndpointConfig cfg;
    cfg.host = tbl["host"].value_or(defaults.host);
    const int64_t port = tbl["port"].value_or(static_cast<int64_t>(defaults.port));
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("{}.port must be 1-65535, got {}", section, port));
    }
    cfg.port = static_cast<uint16_t>(port);
    cfg.user = tbl["user"].value_or(defaults.user);
    cfg.password = tbl["password"].value_or(defaults.password);
    cfg.database = tbl["database"].value_or(defaults.database);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;

    cfg.level = (*sec)["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* sec = root["database"].as_table();
    if (!sec) return cfg;
    const auto& db = *sec;

    cfg.endpoint = extract_endpoint(db, "database", cfg.endpoint);
    cfg.min_connections = static_cast<size_t>(read_count(db, "database", "min_connections", 2));
    cfg.max_connections = static_cast<size_t>(read_count(db, "database", "max_connections", 15));
    cfg.idle_timeout = read_ms(db, "database", "idle_timeout_ms", cfg.idle_timeout);
    cfg.connection_timeout = read_ms(db, "database", "connection_timeout_ms", cfg.connection_timeout);
    cfg.query_timeout = read_ms(db, "database", "query_timeout_ms", cfg.query_timeout);
    cfg.acquire_timeout = read_ms(db, "database", "acquire_timeout_ms", cfg.acquire_timeout);
    cfg.max_connection_failures = static_cast<uint32_t>(
        read_count(db, "database", "max_connection_failures", 3));

    // A replica section without a host means primary only
    if (const auto* r = db["replica"].as_table()) {
        const auto host = (*r)["host"].value_or(""s);
        if (!host.empty()) {
            // Credentials default to the primary's
            ReplicaConfig replica;
            replica.endpoint = extract_endpoint(*r, "database.replica", cfg.endpoint);
            replica.min_connections = static_cast<size_t>(
                read_count(*r, "database.replica", "min_connections", 2));
            replica.max_connections = static_cast<size_t>(
                read_count(*r, "database.replica", "max_connections", 20));
            cfg.replica = std::move(replica);
        }
    }
    return cfg;
}

RetryConfig ConfigLoader::extract_retry(const toml::table& root) {
    RetryConfig cfg;
    const auto* sec = root["retry"].as_table();
    if (!sec) return cfg;

    cfg.max_retries = static_cast<uint32_t>(read_count(*sec, "retry", "max_retries", 3));
    cfg.base_delay = read_ms(*sec, "retry", "base_delay_ms", cfg.base_delay);
    cfg.max_delay = read_ms(*sec, "retry", "max_delay_ms", cfg.max_delay);
    return cfg;
}

PoolMonitorConfig ConfigLoader::extract_pool_monitor(const toml::table& root) {
    PoolMonitorConfig cfg;
    const auto* sec = root["pool_monitor"].as_table();
    if (!sec) return cfg;

    cfg.enabled = (*sec)["enabled"].value_or(true);
    cfg.interval = read_ms(*sec, "pool_monitor", "interval_ms", cfg.interval);
    cfg.utilization_warn_ratio = (*sec)["utilization_warn_ratio"].value_or(0.8);
    return cfg;
}

DegradationConfig ConfigLoader::extract_degradation(const toml::table& root) {
    DegradationConfig cfg;
    const auto* sec = root["degradation"].as_table();
    if (!sec) return cfg;

    cfg.max_queue_size = static_cast<size_t>(read_count(*sec, "degradation", "max_queue_size", 1000));
    return cfg;
}

std::unordered_map<std::string, CircuitBreakerSettings>
ConfigLoader::extract_circuit_breakers(const toml::table& root) {
    std::unordered_map<std::string, CircuitBreakerSettings> result;
    const auto* sec = root["circuit_breakers"].as_table();
    if (!sec) return result;

    for (const auto& [key, node] : *sec) {
        const auto* b = node.as_table();
        if (!b) continue;

        const std::string name(key.str());
        const auto section = "circuit_breakers." + name;

        CircuitBreakerSettings settings;
        settings.enabled = (*b)["enabled"].value<bool>();
        if ((*b).contains("failure_threshold")) {
            settings.failure_threshold = static_cast<uint32_t>(
                read_count(*b, section, "failure_threshold", 0));
        }
        if ((*b).contains("success_threshold")) {
            settings.success_threshold = static_cast<uint32_t>(
                read_count(*b, section, "success_threshold", 0));
        }
        if ((*b).contains("timeout_ms")) {
            settings.timeout = read_ms(*b, section, "timeout_ms", std::chrono::milliseconds{0});
        }
        if ((*b).contains("reset_timeout_ms")) {
            settings.reset_timeout = read_ms(*b, section, "reset_timeout_ms", std::chrono::milliseconds{0});
        }
        result.emplace(name, settings);
    }
    return result;
}

ResilienceConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    ResilienceConfig config;
    config.logging = extract_logging(root);
    config.database = extract_database(root);
    config.retry = extract_retry(root);
    config.pool_monitor = extract_pool_monitor(root);
    config.degradation = extract_degradation(root);
    config.circuit_breakers = extract_circuit_breakers(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ResilienceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ResilienceConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    const auto& db = config.database;
    if (db.endpoint.port == 0) {
        errors.push_back("database.port must be 1-65535, got 0");
    }
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.max_connection_failures == 0) {
        errors.push_back("database.max_connection_failures must be > 0");
    }
    if (db.acquire_timeout.count() == 0) {
        errors.push_back("database.acquire_timeout_ms must be > 0");
    }

    if (db.replica) {
        const auto& r = *db.replica;
        if (r.endpoint.port == 0) {
            errors.push_back("database.replica.port must be 1-65535, got 0");
        }
        if (r.max_connections == 0) {
            errors.push_back("database.replica.max_connections must be > 0");
        }
        if (r.min_connections > r.max_connections) {
            errors.push_back(std::format(
                "database.replica.min_connections ({}) > max_connections ({})",
                r.min_connections, r.max_connections));
        }
    }

    if (config.retry.base_delay.count() == 0) {
        errors.push_back("retry.base_delay_ms must be > 0");
    }
    if (config.retry.base_delay > config.retry.max_delay) {
        errors.push_back(std::format("retry.base_delay_ms ({}) > max_delay_ms ({})",
            config.retry.base_delay.count(), config.retry.max_delay.count()));
    }

    if (config.pool_monitor.enabled) {
        if (config.pool_monitor.interval.count() == 0) {
            errors.push_back("pool_monitor.interval_ms must be > 0 when enabled");
        }
        if (config.pool_monitor.utilization_warn_ratio <= 0.0 ||
            config.pool_monitor.utilization_warn_ratio > 1.0) {
            errors.push_back(std::format("pool_monitor.utilization_warn_ratio must be in (0, 1], got {}",
                config.pool_monitor.utilization_warn_ratio));
        }
    }

    if (config.degradation.max_queue_size == 0) {
        errors.push_back("degradation.max_queue_size must be > 0");
    }

    for (const auto& [name, b] : config.circuit_breakers) {
        if (b.failure_threshold && *b.failure_threshold == 0) {
            errors.push_back(std::format("circuit_breakers.{}.failure_threshold must be > 0", name));
        }
        if (b.success_threshold && *b.success_threshold == 0) {
            errors.push_back(std::format("circuit_breakers.{}.success_threshold must be > 0", name));
        }
        if (b.timeout && b.timeout->count() == 0) {
            errors.push_back(std::format("circuit_breakers.{}.timeout_ms must be > 0", name));
        }
        if (b.reset_timeout && b.reset_timeout->count() == 0) {
            errors.push_back(std::format("circuit_breakers.{}.reset_timeout_ms must be > 0", name));
        }
    }

    return errors;
}

} // namespace steadfast
