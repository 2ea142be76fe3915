#pragma once

#include "config/config_types.hpp"
#include "executor/circuit_breaker.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace steadfast {

/**
 * @brief Structured result yielded by preset breaker fallbacks
 */
struct FallbackResult {
    bool success = false;
    std::string error;
    std::string code;
};

struct RegistryHealth {
    HealthStatus status = HealthStatus::HEALTHY;
    std::map<std::string, CircuitHealth> breakers;
};

struct RegistrySummary {
    size_t total = 0;
    size_t closed = 0;
    size_t open = 0;
    size_t half_open = 0;
};

/**
 * @brief Pre-tuned breaker configs for the bot's well-known dependencies
 *
 * Ordered as registered by CircuitBreakerRegistry::initialize().
 */
[[nodiscard]] std::vector<std::pair<std::string, CircuitBreaker::Config>> default_breaker_policies();

/**
 * @brief Named collection of circuit breakers
 *
 * Registration is idempotent. Execution through an unknown name runs the
 * call unprotected: protection is opportunistic, never a hard dependency.
 *
 * Uses a shared_mutex for the name → breaker map (read-heavy workload).
 */
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry() = default;

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /**
     * @brief Register every preset policy (no-op after the first call)
     * @param overrides Per-name threshold/timeout overrides from config
     */
    void initialize(const std::unordered_map<std::string, CircuitBreakerSettings>& overrides = {});

    [[nodiscard]] bool is_initialized() const;

    /**
     * @brief Register a breaker, or return the existing one with that name
     */
    std::shared_ptr<CircuitBreaker> register_breaker(const std::string& name,
                                                     CircuitBreaker::Config config = {});

    /**
     * @brief Look up a breaker by name
     * @return nullptr when not registered
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(const std::string& name) const;

    /**
     * @brief Run fn through the named breaker, or directly if unknown
     */
    template<typename F, typename R = std::invoke_result_t<std::decay_t<F>&>>
    R execute(const std::string& name, F&& fn);

    [[nodiscard]] RegistryHealth get_health() const;
    [[nodiscard]] RegistrySummary get_summary() const;
    [[nodiscard]] std::map<std::string, CircuitBreakerMetrics> get_metrics() const;

    void reset_all();
    void reset_all_metrics();

    /**
     * @brief Drop every breaker and observer; initialize() may run again
     */
    void shutdown();

    [[nodiscard]] size_t size() const;

    /**
     * @brief Observer for every registered breaker's transitions
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Observer for every registered breaker's rejections
     */
    void set_on_reject(std::function<void(const std::string&, CircuitState)> cb);

private:
    void attach_observers(CircuitBreaker& breaker);
    void notify_state_change(const StateChangeEvent& event) const;
    void notify_reject(const std::string& name, CircuitState state) const;

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;
    bool initialized_ = false;

    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::function<void(const std::string&, CircuitState)> on_reject_;
    mutable std::shared_mutex observers_mutex_;
};

template<typename F, typename R>
R CircuitBreakerRegistry::execute(const std::string& name, F&& fn) {
    auto breaker = get(name);
    if (!breaker) {
        utils::log::warn(std::format(
            "[CircuitBreakerRegistry] Breaker '{}' not found, executing without protection", name));
        return std::invoke(std::forward<F>(fn));
    }
    return breaker->execute(std::forward<F>(fn));
}

} // namespace steadfast
