#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <any>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace steadfast {

/**
 * @brief Circuit Breaker for external dependency failure isolation
 *
 * Three states:
 * - CLOSED:     Normal operation, all calls pass through
 * - OPEN:       Failing, reject calls immediately (wrapped call never invoked)
 * - HALF_OPEN:  Testing recovery
 *
 * State transitions:
 * - CLOSED → OPEN:      consecutive failures >= failure_threshold
 * - OPEN → HALF_OPEN:   first call arriving after next_attempt (lazy, no timer)
 * - HALF_OPEN → CLOSED: consecutive successes >= success_threshold
 * - HALF_OPEN → OPEN:   any failure
 *
 * An idle OPEN breaker stays OPEN until traffic arrives, even if the
 * dependency has already recovered.
 *
 * Failure handling on a counted failure or a rejection:
 *   per-call fallback → configured fallback → rethrow
 *
 * Thread-safety: counters and state are guarded by a single mutex; callbacks
 * run outside the lock. Threshold enforcement under concurrent failures is
 * approximate.
 */
class CircuitBreaker {
public:
    /// Configured fallback. An empty std::any means "null".
    using Fallback = std::function<std::any(const std::exception&)>;

    /// Returns false for errors that must not count as circuit failures.
    using FailurePredicate = std::function<bool(const std::exception&)>;

    template<typename R>
    using CallFallback = std::function<R(const std::exception&)>;

    /**
     * @brief Configuration
     */
    struct Config {
        uint32_t failure_threshold;             // Failures to trip OPEN
        uint32_t success_threshold;             // Successes to close from HALF_OPEN
        std::chrono::milliseconds timeout;      // Per-call timeout (0 = no race)
        std::chrono::milliseconds reset_timeout;// Time in OPEN before HALF_OPEN probe
        Fallback fallback;
        FailurePredicate is_failure;
        bool enabled;

        Config()
            : failure_threshold(5),
              success_threshold(2),
              timeout(30000),
              reset_timeout(60000),
              enabled(true) {}
    };

    static constexpr size_t kMaxStateChanges = 20;

    explicit CircuitBreaker(std::string name, Config config = Config());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run fn under breaker protection
     *
     * fn runs on a worker thread and is raced against config.timeout. On
     * timeout the wait is abandoned; the worker finishes in the background
     * and its result is discarded, so fn must not capture state that dies
     * with the caller's frame when a timeout is possible.
     *
     * @param fn Callable taking no arguments
     * @param fallback Optional per-call fallback
     * @throws CircuitOpenError when rejected and no fallback applies
     * @throws CircuitTimeoutError when fn overran and no fallback applies
     */
    template<typename F, typename R = std::invoke_result_t<std::decay_t<F>&>>
    R execute(F&& fn, std::type_identity_t<CallFallback<R>> fallback = {});

    /**
     * @brief Force OPEN (no-op when already OPEN)
     */
    void trip();

    /**
     * @brief Force CLOSED and clear failure/success counts
     */
    void reset();

    /**
     * @brief Clear request counters and state-change history
     */
    void reset_metrics();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] bool is_open() const { return get_state() == CircuitState::OPEN; }
    [[nodiscard]] bool is_closed() const { return get_state() == CircuitState::CLOSED; }

    [[nodiscard]] CircuitBreakerMetrics get_metrics() const;
    [[nodiscard]] CircuitHealth get_health() const;

    /**
     * @brief Get recent state change events (most recent last, max 20)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Register callback for calls rejected while OPEN
     */
    void set_on_reject(std::function<void(const std::string& name, CircuitState state)> cb);

private:
    /**
     * @brief Count the request and decide whether it may run.
     * Performs the lazy OPEN → HALF_OPEN transition.
     */
    bool admit();

    void on_success();

    /**
     * @brief Record a failed call
     * @return true if the error counts as a circuit failure
     */
    bool on_failure(const std::exception* error);

    void on_timeout();
    void on_fallback();

    template<typename R, typename F>
    R run_with_timeout(F&& fn);

    template<typename R>
    R run_fallback(std::exception_ptr original, const std::exception& error,
                   const CallFallback<R>& per_call);

    // Caller holds mutex_; pending is dispatched after unlock
    void set_state_locked(CircuitState to, std::vector<StateChangeEvent>& pending);
    void dispatch(const std::vector<StateChangeEvent>& pending) const;

    std::string name_;
    Config config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t failure_count_ = 0;
    uint32_t success_count_ = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_;
    std::optional<std::chrono::system_clock::time_point> next_attempt_;

    uint64_t total_requests_ = 0;
    uint64_t successful_requests_ = 0;
    uint64_t failed_requests_ = 0;
    uint64_t rejected_requests_ = 0;
    uint64_t timeouts_ = 0;
    uint64_t fallback_executions_ = 0;
    std::deque<StateChangeEvent> state_changes_;

    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::function<void(const std::string&, CircuitState)> on_reject_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename F, typename R>
R CircuitBreaker::execute(F&& fn, std::type_identity_t<CallFallback<R>> fallback) {
    if (!config_.enabled) {
        return std::invoke(std::forward<F>(fn));
    }

    if (!admit()) {
        const CircuitOpenError rejection(name_);
        return run_fallback<R>(std::make_exception_ptr(rejection), rejection, fallback);
    }

    try {
        if constexpr (std::is_void_v<R>) {
            run_with_timeout<R>(std::forward<F>(fn));
            on_success();
            return;
        } else {
            R result = run_with_timeout<R>(std::forward<F>(fn));
            on_success();
            return result;
        }
    } catch (const std::exception& e) {
        if (!on_failure(&e)) {
            throw;
        }
        return run_fallback<R>(std::current_exception(), e, fallback);
    } catch (...) {
        // Non-standard exceptions cannot be classified or handed to a fallback
        on_failure(nullptr);
        throw;
    }
}

template<typename R, typename F>
R CircuitBreaker::run_with_timeout(F&& fn) {
    if (config_.timeout.count() <= 0) {
        return std::invoke(std::forward<F>(fn));
    }

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto future = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (future.wait_for(config_.timeout) == std::future_status::timeout) {
        on_timeout();
        throw CircuitTimeoutError(name_);
    }
    return future.get();
}

template<typename R>
R CircuitBreaker::run_fallback(std::exception_ptr original, const std::exception& error,
                               const CallFallback<R>& per_call) {
    if (per_call) {
        on_fallback();
        return per_call(error);
    }

    if (config_.fallback) {
        // Counted only when the configured result is actually returned
        std::any value = config_.fallback(error);
        if constexpr (std::is_void_v<R>) {
            on_fallback();
            return;
        } else {
            if (!value.has_value()) {
                if constexpr (std::is_default_constructible_v<R>) {
                    on_fallback();
                    return R{};
                }
            } else if (auto* typed = std::any_cast<R>(&value)) {
                on_fallback();
                return std::move(*typed);
            }
            utils::log::warn(std::format(
                "[CircuitBreaker:{}] Fallback result does not match call type, rethrowing", name_));
        }
    }

    std::rethrow_exception(original);
}

} // namespace steadfast
