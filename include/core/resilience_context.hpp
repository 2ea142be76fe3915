#pragma once

#include "config/config_types.hpp"
#include "degradation/degradation_coordinator.hpp"
#include "executor/circuit_breaker_registry.hpp"

#include <mutex>

namespace steadfast {

/**
 * @brief Owner of one breaker registry and one degradation coordinator
 *
 * Replaces process-wide singletons: construct one per process (or per test),
 * pass it to collaborators by reference. Holds no database state; a
 * ResilientDataStore is built against coordinator().
 */
class ResilienceContext {
public:
    explicit ResilienceContext(const ResilienceConfig& config = {});

    ResilienceContext(const ResilienceContext&) = delete;
    ResilienceContext& operator=(const ResilienceContext&) = delete;

    /**
     * @brief Register preset breakers and core services (idempotent)
     */
    void initialize();

    [[nodiscard]] bool is_initialized() const;

    [[nodiscard]] CircuitBreakerRegistry& breakers() { return registry_; }
    [[nodiscard]] const CircuitBreakerRegistry& breakers() const { return registry_; }

    [[nodiscard]] DegradationCoordinator& coordinator() { return coordinator_; }
    [[nodiscard]] const DegradationCoordinator& coordinator() const { return coordinator_; }

    [[nodiscard]] const ResilienceConfig& config() const { return config_; }

    /**
     * @brief Drop breakers, services, cache and queue
     */
    void shutdown();

    /**
     * @brief shutdown() followed by initialize()
     */
    void reset();

private:
    ResilienceConfig config_;
    CircuitBreakerRegistry registry_;
    DegradationCoordinator coordinator_;

    mutable std::mutex mutex_;
    bool initialized_ = false;
};

} // namespace steadfast
