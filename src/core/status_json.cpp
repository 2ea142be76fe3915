#include "core/status_json.hpp"
#include "core/utils.hpp"

namespace steadfast {

namespace {

template<typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const StateChangeEvent& e) {
    j = nlohmann::json{
        {"from", std::string(circuit_state_to_string(e.from))},
        {"to", std::string(circuit_state_to_string(e.to))},
        {"timestamp", utils::format_timestamp(e.timestamp)},
    };
}

void to_json(nlohmann::json& j, const CircuitBreakerMetrics& m) {
    j = nlohmann::json{
        {"name", m.name},
        {"state", std::string(circuit_state_to_string(m.state))},
        {"failureCount", m.failure_count},
        {"successCount", m.success_count},
        {"lastFailureTime", optional_json(utils::format_optional_timestamp(m.last_failure))},
        {"nextAttempt", optional_json(utils::format_optional_timestamp(m.next_attempt))},
        {"totalRequests", m.total_requests},
        {"successfulRequests", m.successful_requests},
        {"failedRequests", m.failed_requests},
        {"rejectedRequests", m.rejected_requests},
        {"timeouts", m.timeouts},
        {"fallbackExecutions", m.fallback_executions},
        {"stateChanges", m.state_changes},
        {"successRate", m.success_rate},
    };
}

void to_json(nlohmann::json& j, const CircuitHealth& h) {
    j = nlohmann::json{
        {"name", h.name},
        {"status", std::string(health_status_to_string(h.status))},
        {"state", std::string(circuit_state_to_string(h.state))},
        {"failureCount", h.failure_count},
        {"lastFailure", optional_json(h.last_failure)},
        {"nextAttempt", optional_json(h.next_attempt)},
    };
}

void to_json(nlohmann::json& j, const RegistryHealth& h) {
    j = nlohmann::json{
        {"status", std::string(health_status_to_string(h.status))},
        {"breakers", h.breakers},
    };
}

void to_json(nlohmann::json& j, const RegistrySummary& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"closed", s.closed},
        {"open", s.open},
        {"halfOpen", s.half_open},
    };
}

void to_json(nlohmann::json& j, const ServiceStatusInfo& s) {
    j = nlohmann::json{
        {"state", std::string(service_state_to_string(s.state))},
        {"critical", s.critical},
        {"lastHealthy", optional_json(s.last_healthy)},
        {"degradedSince", optional_json(s.degraded_since)},
        {"failureCount", s.failure_count},
    };
}

void to_json(nlohmann::json& j, const SystemStatus& s) {
    j = nlohmann::json{
        {"level", std::string(degradation_level_to_string(s.level))},
        {"timestamp", s.timestamp},
        {"services", s.services},
        {"queuedWrites", s.queued_writes},
        {"cacheEntries", s.cache_entries},
    };
}

void to_json(nlohmann::json& j, const SystemHealth& h) {
    j = nlohmann::json{
        {"healthy", h.healthy},
        {"details", h.details},
    };
}

void to_json(nlohmann::json& j, const RetryConfig& r) {
    j = nlohmann::json{
        {"maxRetries", r.max_retries},
        {"baseDelayMs", r.base_delay.count()},
        {"maxDelayMs", r.max_delay.count()},
    };
}

void to_json(nlohmann::json& j, const DatabaseStatus& s) {
    j = nlohmann::json{
        {"connected", s.connected},
        {"state", s.state},
        {"failureCount", s.failure_count},
        {"maxFailures", s.max_failures},
        {"pendingWrites", s.pending_writes},
        {"readReplica", {
            {"enabled", s.replica_enabled},
            {"host", optional_json(s.replica_host)},
        }},
        {"retryConfig", s.retry},
    };
}

void to_json(nlohmann::json& j, const PoolSample& s) {
    j = nlohmann::json{
        {"pool", s.pool},
        {"total", s.total},
        {"idle", s.idle},
        {"active", s.active},
        {"waiting", s.waiting},
        {"utilization", s.utilization},
        {"highUtilization", s.high_utilization},
        {"exhausted", s.exhausted},
    };
}

} // namespace steadfast
