#pragma once

#include "core/types.hpp"
#include "db/pool_monitor.hpp"
#include "db/resilient_data_store.hpp"
#include "degradation/degradation_coordinator.hpp"
#include "executor/circuit_breaker_registry.hpp"

#include <nlohmann/json.hpp>

namespace steadfast {

// nlohmann::json serializers for status and metrics documents.
// Timestamps are ISO-8601 strings; absent optionals serialize as null.

void to_json(nlohmann::json& j, const StateChangeEvent& e);
void to_json(nlohmann::json& j, const CircuitBreakerMetrics& m);
void to_json(nlohmann::json& j, const CircuitHealth& h);
void to_json(nlohmann::json& j, const RegistryHealth& h);
void to_json(nlohmann::json& j, const RegistrySummary& s);

void to_json(nlohmann::json& j, const ServiceStatusInfo& s);
void to_json(nlohmann::json& j, const SystemStatus& s);
void to_json(nlohmann::json& j, const SystemHealth& h);

void to_json(nlohmann::json& j, const RetryConfig& r);
void to_json(nlohmann::json& j, const DatabaseStatus& s);
void to_json(nlohmann::json& j, const PoolSample& s);

} // namespace steadfast
