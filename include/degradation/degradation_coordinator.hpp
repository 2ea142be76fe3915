#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace steadfast {

struct ServiceOptions {
    bool critical = false;
};

struct ServiceInfo {
    std::string name;
    ServiceState state = ServiceState::HEALTHY;
    bool critical = false;
    std::chrono::system_clock::time_point last_healthy;
    std::optional<std::chrono::system_clock::time_point> degraded_since;
    uint32_t failure_count = 0;
};

/**
 * @brief Deferred mutation awaiting a service's recovery
 */
struct QueuedWrite {
    uint64_t id = 0;
    std::string service;
    std::string operation;
    nlohmann::json payload;
    std::chrono::system_clock::time_point timestamp;
    uint32_t retries = 0;
};

struct ServiceStateChange {
    std::string service;
    ServiceState previous;
    ServiceState current;
    std::string reason;
};

/**
 * @brief Per-call options for DegradationCoordinator::execute
 *
 * Fallback chain order: fallback → registered service handler → cached
 * value under cache_key (stale) → static fallback value → failure result.
 */
template<typename T>
struct ExecuteOptions {
    // Receives the primary error, or nullptr when the primary was skipped
    std::function<T(const std::exception*)> fallback;
    std::optional<std::string> cache_key;

    // Static last resort; engaged with an empty value yields a null result
    bool has_fallback_value = false;
    std::optional<T> fallback_value;

    ExecuteOptions& with_fallback_value(std::optional<T> value) {
        has_fallback_value = true;
        fallback_value = std::move(value);
        return *this;
    }
};

template<typename T>
struct ExecuteResult {
    bool success = false;
    std::optional<T> data;      // nullopt = null
    bool degraded = false;
    bool stale = false;
    std::optional<std::chrono::milliseconds> cache_age;
    std::optional<std::string> error;
};

struct ServiceStatusInfo {
    ServiceState state = ServiceState::HEALTHY;
    bool critical = false;
    std::optional<std::string> last_healthy;
    std::optional<std::string> degraded_since;
    uint32_t failure_count = 0;
};

struct SystemStatus {
    DegradationLevel level = DegradationLevel::NORMAL;
    std::string timestamp;
    std::map<std::string, ServiceStatusInfo> services;
    size_t queued_writes = 0;
    size_t cache_entries = 0;
};

struct SystemHealth {
    bool healthy = true;
    SystemStatus details;
};

/**
 * @brief Observer of coordinator events
 *
 * on_queued_write is the replay hook: the real write executor performs the
 * mutation there and throws to report failure.
 */
class IDegradationListener {
public:
    virtual ~IDegradationListener() = default;

    virtual void on_service_state_change(const ServiceStateChange& /*change*/) {}
    virtual void on_level_change(DegradationLevel /*previous*/, DegradationLevel /*current*/) {}
    virtual void on_write_queued(const QueuedWrite& /*write*/, size_t /*queue_size*/) {}
    virtual void on_queued_write(const QueuedWrite& /*write*/) {}
};

/**
 * @brief Cross-service graceful degradation
 *
 * Tracks per-service health, derives the system DegradationLevel, runs
 * fallback chains and buffers deferred writes. execute() never throws;
 * callers branch on ExecuteResult::success.
 *
 * Memory-only: fallback cache and write queue are lost on restart.
 * Listener callbacks and caller-supplied operations run outside the lock.
 */
class DegradationCoordinator {
public:
    /// Returns an empty std::any for a null result
    using FallbackHandler = std::function<std::any(const std::exception* error)>;

    static constexpr size_t kDefaultMaxQueueSize = 1000;
    static constexpr uint32_t kMaxReplayAttempts = 3;

    explicit DegradationCoordinator(size_t max_queue_size = kDefaultMaxQueueSize);

    DegradationCoordinator(const DegradationCoordinator&) = delete;
    DegradationCoordinator& operator=(const DegradationCoordinator&) = delete;

    /**
     * @brief Register the bot's core services (no-op after the first call)
     *
     * redis (non-critical), database (critical), lavalink (non-critical),
     * discord (critical)
     */
    void initialize();

    void register_service(const std::string& name, ServiceOptions options = {});
    void register_fallback(const std::string& service, FallbackHandler handler);

    /**
     * @brief Update a service's state and recompute the system level
     *
     * Unknown services are ignored. Only actual changes notify listeners.
     */
    void mark_service(const std::string& name, ServiceState state, const std::string& reason = "");

    /**
     * @brief Mark HEALTHY and replay the service's queued writes
     */
    void mark_healthy(const std::string& name);
    void mark_degraded(const std::string& name, const std::string& reason = "");
    void mark_unavailable(const std::string& name, const std::string& reason = "");

    /**
     * @brief Run op with graceful fallback; never throws
     */
    template<typename T, typename F>
    ExecuteResult<T> execute(const std::string& service, F&& op, ExecuteOptions<T> options = {});

    /**
     * @brief Buffer a write for replay when the service recovers
     *
     * Bounded FIFO: when full, the oldest entry is dropped.
     */
    void queue_write(const std::string& service, const std::string& operation, nlohmann::json payload);

    [[nodiscard]] bool is_available(const std::string& name) const;
    [[nodiscard]] bool is_degraded(const std::string& name) const;
    [[nodiscard]] std::optional<ServiceState> get_service_state(const std::string& name) const;
    [[nodiscard]] std::optional<ServiceInfo> get_service(const std::string& name) const;
    [[nodiscard]] bool is_system_degraded() const;
    [[nodiscard]] DegradationLevel level() const;

    [[nodiscard]] SystemStatus get_status() const;
    [[nodiscard]] SystemHealth get_health() const;

    [[nodiscard]] std::vector<QueuedWrite> queued_writes() const;
    [[nodiscard]] size_t queue_size() const;
    [[nodiscard]] size_t max_queue_size() const { return max_queue_size_; }

    /**
     * @brief Clear cached fallback values, for one service or all
     */
    void clear_cache(const std::optional<std::string>& service = std::nullopt);

    void add_listener(std::shared_ptr<IDegradationListener> listener);
    void remove_listener(const std::shared_ptr<IDegradationListener>& listener);

    /**
     * @brief Drop services, handlers, cache, queue and listeners
     */
    void shutdown();

private:
    struct CachedValue {
        std::any value;
        std::chrono::system_clock::time_point timestamp;
    };

    template<typename T>
    ExecuteResult<T> run_fallback(const std::string& service, const ExecuteOptions<T>& options,
                                  const std::exception* error,
                                  const std::optional<std::string>& error_message);

    void on_primary_success(const std::string& service, const std::optional<std::string>& cache_key,
                            std::any value);
    void on_primary_failure(const std::string& service, const std::string& message);

    [[nodiscard]] FallbackHandler find_handler(const std::string& service) const;
    [[nodiscard]] std::optional<CachedValue> find_cached(const std::string& key) const;

    // Caller holds mutex_; returns {previous, current} if the level changed
    std::optional<std::pair<DegradationLevel, DegradationLevel>> update_level_locked();

    void process_queue(const std::string& service);

    [[nodiscard]] std::vector<std::shared_ptr<IDegradationListener>> listeners_snapshot() const;

    static std::string cache_key_for(const std::string& service, const std::string& key) {
        return service + ":" + key;
    }

    const size_t max_queue_size_;

    mutable std::mutex mutex_;
    bool initialized_ = false;
    DegradationLevel level_ = DegradationLevel::NORMAL;
    std::unordered_map<std::string, ServiceInfo> services_;
    std::unordered_map<std::string, FallbackHandler> fallback_handlers_;
    std::unordered_map<std::string, CachedValue> fallback_cache_;
    std::deque<QueuedWrite> write_queue_;
    uint64_t next_write_id_ = 1;

    std::vector<std::shared_ptr<IDegradationListener>> listeners_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T, typename F>
ExecuteResult<T> DegradationCoordinator::execute(const std::string& service, F&& op,
                                                 ExecuteOptions<T> options) {
    // Never spend latency on a dependency already known to be dead
    if (get_service_state(service) == ServiceState::UNAVAILABLE) {
        return run_fallback<T>(service, options, nullptr, std::nullopt);
    }

    std::optional<T> value;
    try {
        value.emplace(std::invoke(std::forward<F>(op)));
    } catch (const std::exception& e) {
        on_primary_failure(service, e.what());
        return run_fallback<T>(service, options, &e, std::string(e.what()));
    } catch (...) {
        on_primary_failure(service, "unknown error");
        return run_fallback<T>(service, options, nullptr, std::string("unknown error"));
    }

    on_primary_success(service, options.cache_key,
                       options.cache_key ? std::any(*value) : std::any());

    ExecuteResult<T> result;
    result.success = true;
    result.data = std::move(value);
    return result;
}

template<typename T>
ExecuteResult<T> DegradationCoordinator::run_fallback(const std::string& service,
                                                      const ExecuteOptions<T>& options,
                                                      const std::exception* error,
                                                      const std::optional<std::string>& error_message) {
    ExecuteResult<T> result;
    result.degraded = true;

    if (options.fallback) {
        try {
            result.data.emplace(options.fallback(error));
            result.success = true;
            return result;
        } catch (const std::exception& e) {
            utils::log::debug(std::format(
                "[GracefulDegradation] {} call fallback failed: {}", service, e.what()));
        } catch (...) {
            utils::log::debug(std::format(
                "[GracefulDegradation] {} call fallback failed with a non-standard exception", service));
        }
    }

    if (auto handler = find_handler(service)) {
        try {
            std::any value = handler(error);
            if (!value.has_value()) {
                result.success = true;
                return result;
            }
            if (auto* typed = std::any_cast<T>(&value)) {
                result.data = std::move(*typed);
                result.success = true;
                return result;
            }
            utils::log::warn(std::format(
                "[GracefulDegradation] {} fallback handler returned an unexpected type", service));
        } catch (const std::exception& e) {
            utils::log::debug(std::format(
                "[GracefulDegradation] {} fallback handler failed: {}", service, e.what()));
        } catch (...) {
            utils::log::debug(std::format(
                "[GracefulDegradation] {} fallback handler failed with a non-standard exception", service));
        }
    }

    if (options.cache_key) {
        if (auto cached = find_cached(cache_key_for(service, *options.cache_key))) {
            if (auto* typed = std::any_cast<T>(&cached->value)) {
                result.success = true;
                result.data = *typed;
                result.stale = true;
                result.cache_age = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now() - cached->timestamp);
                return result;
            }
        }
    }

    if (options.has_fallback_value) {
        result.success = true;
        result.data = options.fallback_value;
        return result;
    }

    result.error = error_message.value_or("Service unavailable");
    return result;
}

} // namespace steadfast
