#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace steadfast {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Connection parameters for one PostgreSQL endpoint
 */
struct EndpointConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;

    /**
     * @brief Render as a libpq keyword/value connection string
     * @param connect_timeout Applied as connect_timeout (whole seconds, min 1)
     */
    [[nodiscard]] std::string to_connection_string(
        std::chrono::milliseconds connect_timeout) const;
};

struct ReplicaConfig {
    EndpointConfig endpoint;
    size_t min_connections = 2;
    size_t max_connections = 20;
};

struct DatabaseConfig {
    EndpointConfig endpoint;
    size_t min_connections = 2;
    size_t max_connections = 15;
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds query_timeout{30000};
    std::chrono::milliseconds acquire_timeout{10000};

    // Consecutive connection errors before the database is marked UNAVAILABLE
    uint32_t max_connection_failures = 3;

    // Absent = primary only
    std::optional<ReplicaConfig> replica;
};

struct RetryConfig {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};
};

struct PoolMonitorConfig {
    bool enabled = true;
    std::chrono::milliseconds interval{10000};
    double utilization_warn_ratio = 0.8;
};

struct DegradationConfig {
    size_t max_queue_size = 1000;
};

/**
 * @brief Per-breaker overrides; unset fields keep the preset value
 */
struct CircuitBreakerSettings {
    std::optional<bool> enabled;
    std::optional<uint32_t> failure_threshold;
    std::optional<uint32_t> success_threshold;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> reset_timeout;
};

// ============================================================================
// ResilienceConfig - Complete parsed configuration
// ============================================================================

struct ResilienceConfig {
    LoggingConfig logging;
    DatabaseConfig database;
    RetryConfig retry;
    PoolMonitorConfig pool_monitor;
    DegradationConfig degradation;
    std::unordered_map<std::string, CircuitBreakerSettings> circuit_breakers;
};

} // namespace steadfast
