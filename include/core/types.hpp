#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace steadfast {

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Testing recovery
};

[[nodiscard]] inline constexpr std::string_view circuit_state_to_string(CircuitState s) noexcept {
    switch (s) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

/**
 * @brief Health classification derived from circuit state
 *
 * CLOSED → HEALTHY, HALF_OPEN → DEGRADED, OPEN → UNHEALTHY
 */
enum class HealthStatus {
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

[[nodiscard]] inline constexpr std::string_view health_status_to_string(HealthStatus s) noexcept {
    switch (s) {
        case HealthStatus::HEALTHY:   return "healthy";
        case HealthStatus::DEGRADED:  return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
    }
    return "unknown";
}

/**
 * @brief One recorded circuit transition
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Snapshot of a breaker's counters and state
 */
struct CircuitBreakerMetrics {
    std::string name;
    CircuitState state = CircuitState::CLOSED;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<std::chrono::system_clock::time_point> next_attempt;

    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    uint64_t rejected_requests = 0;
    uint64_t timeouts = 0;
    uint64_t fallback_executions = 0;
    std::vector<StateChangeEvent> state_changes;

    std::string success_rate;   // "NN.NN%" or "N/A"
};

struct CircuitHealth {
    std::string name;
    HealthStatus status = HealthStatus::HEALTHY;
    CircuitState state = CircuitState::CLOSED;
    uint32_t failure_count = 0;
    std::optional<std::string> last_failure;    // ISO-8601
    std::optional<std::string> next_attempt;    // ISO-8601
};

// ============================================================================
// Degradation Types
// ============================================================================

enum class ServiceState {
    HEALTHY,
    DEGRADED,
    UNAVAILABLE
};

[[nodiscard]] inline constexpr std::string_view service_state_to_string(ServiceState s) noexcept {
    switch (s) {
        case ServiceState::HEALTHY:     return "HEALTHY";
        case ServiceState::DEGRADED:    return "DEGRADED";
        case ServiceState::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

enum class DegradationLevel {
    NORMAL,     // All services healthy
    DEGRADED,   // Some services impaired, fallbacks active
    CRITICAL,   // A critical service is down
    OFFLINE     // No healthy service left
};

[[nodiscard]] inline constexpr std::string_view degradation_level_to_string(DegradationLevel l) noexcept {
    switch (l) {
        case DegradationLevel::NORMAL:   return "NORMAL";
        case DegradationLevel::DEGRADED: return "DEGRADED";
        case DegradationLevel::CRITICAL: return "CRITICAL";
        case DegradationLevel::OFFLINE:  return "OFFLINE";
    }
    return "UNKNOWN";
}

} // namespace steadfast
