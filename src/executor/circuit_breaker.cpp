#include "executor/circuit_breaker.hpp"

namespace steadfast {

CircuitBreaker::CircuitBreaker(std::string name, Config config)
    : name_(std::move(name)),
      config_(std::move(config)) {}

bool CircuitBreaker::admit() {
    std::vector<StateChangeEvent> pending;
    bool allowed = true;
    std::function<void(const std::string&, CircuitState)> reject_cb;
    {
        std::lock_guard lock(mutex_);
        ++total_requests_;

        if (state_ == CircuitState::OPEN) {
            const auto now = std::chrono::system_clock::now();
            if (next_attempt_ && now >= *next_attempt_) {
                // Deadline passed - this call becomes the recovery probe
                set_state_locked(CircuitState::HALF_OPEN, pending);
            } else {
                ++rejected_requests_;
                allowed = false;
                reject_cb = on_reject_;
            }
        }
    }

    dispatch(pending);
    if (!allowed && reject_cb) {
        reject_cb(name_, CircuitState::OPEN);
    }
    return allowed;
}

void CircuitBreaker::on_success() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        ++successful_requests_;

        if (state_ == CircuitState::HALF_OPEN) {
            ++success_count_;
            if (success_count_ >= config_.success_threshold) {
                set_state_locked(CircuitState::CLOSED, pending);
                failure_count_ = 0;
                success_count_ = 0;
            }
        } else {
            // Reset failure count on success in CLOSED state
            failure_count_ = 0;
        }
    }
    dispatch(pending);
}

bool CircuitBreaker::on_failure(const std::exception* error) {
    // Classification runs outside the lock: the predicate is caller code
    const bool counts = !(error && config_.is_failure) || config_.is_failure(*error);

    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        ++failed_requests_;

        if (!counts) {
            return false;
        }

        last_failure_ = std::chrono::system_clock::now();
        ++failure_count_;

        if (state_ == CircuitState::HALF_OPEN) {
            // Single failure in HALF_OPEN trips the circuit again
            set_state_locked(CircuitState::OPEN, pending);
            success_count_ = 0;
        } else if (state_ == CircuitState::CLOSED &&
                   failure_count_ >= config_.failure_threshold) {
            set_state_locked(CircuitState::OPEN, pending);
        }
    }
    dispatch(pending);
    return true;
}

void CircuitBreaker::on_timeout() {
    std::lock_guard lock(mutex_);
    ++timeouts_;
}

void CircuitBreaker::on_fallback() {
    std::lock_guard lock(mutex_);
    ++fallback_executions_;
}

void CircuitBreaker::trip() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::OPEN) {
            set_state_locked(CircuitState::OPEN, pending);
        }
    }
    dispatch(pending);
}

void CircuitBreaker::reset() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CircuitState::CLOSED) {
            set_state_locked(CircuitState::CLOSED, pending);
        }
        failure_count_ = 0;
        success_count_ = 0;
    }
    dispatch(pending);
}

void CircuitBreaker::reset_metrics() {
    std::lock_guard lock(mutex_);
    total_requests_ = 0;
    successful_requests_ = 0;
    failed_requests_ = 0;
    rejected_requests_ = 0;
    timeouts_ = 0;
    fallback_executions_ = 0;
    state_changes_.clear();
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CircuitBreakerMetrics CircuitBreaker::get_metrics() const {
    std::lock_guard lock(mutex_);

    CircuitBreakerMetrics m;
    m.name = name_;
    m.state = state_;
    m.failure_count = failure_count_;
    m.success_count = success_count_;
    m.last_failure = last_failure_;
    m.next_attempt = next_attempt_;
    m.total_requests = total_requests_;
    m.successful_requests = successful_requests_;
    m.failed_requests = failed_requests_;
    m.rejected_requests = rejected_requests_;
    m.timeouts = timeouts_;
    m.fallback_executions = fallback_executions_;
    m.state_changes.assign(state_changes_.begin(), state_changes_.end());

    if (total_requests_ > 0) {
        const double rate = static_cast<double>(successful_requests_) * 100.0 /
                            static_cast<double>(total_requests_);
        m.success_rate = std::format("{:.2f}%", rate);
    } else {
        m.success_rate = "N/A";
    }
    return m;
}

CircuitHealth CircuitBreaker::get_health() const {
    std::lock_guard lock(mutex_);

    CircuitHealth h;
    h.name = name_;
    h.state = state_;
    switch (state_) {
        case CircuitState::CLOSED:    h.status = HealthStatus::HEALTHY; break;
        case CircuitState::HALF_OPEN: h.status = HealthStatus::DEGRADED; break;
        case CircuitState::OPEN:      h.status = HealthStatus::UNHEALTHY; break;
    }
    h.failure_count = failure_count_;
    h.last_failure = utils::format_optional_timestamp(last_failure_);
    h.next_attempt = utils::format_optional_timestamp(next_attempt_);
    return h;
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(mutex_);
    return {state_changes_.begin(), state_changes_.end()};
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(mutex_);
    on_state_change_ = std::move(cb);
}

void CircuitBreaker::set_on_reject(std::function<void(const std::string&, CircuitState)> cb) {
    std::lock_guard lock(mutex_);
    on_reject_ = std::move(cb);
}

void CircuitBreaker::set_state_locked(CircuitState to, std::vector<StateChangeEvent>& pending) {
    const CircuitState from = state_;
    state_ = to;

    // next_attempt exists only while OPEN
    if (to == CircuitState::OPEN) {
        next_attempt_ = std::chrono::system_clock::now() + config_.reset_timeout;
    } else {
        next_attempt_.reset();
    }

    if (to == CircuitState::HALF_OPEN) {
        success_count_ = 0;
    }

    StateChangeEvent event{from, to, std::chrono::system_clock::now(), name_};
    state_changes_.push_back(event);
    while (state_changes_.size() > kMaxStateChanges) {
        state_changes_.pop_front();
    }
    pending.push_back(std::move(event));
}

void CircuitBreaker::dispatch(const std::vector<StateChangeEvent>& pending) const {
    if (pending.empty()) return;

    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_state_change_;
    }

    for (const auto& e : pending) {
        utils::log::info(std::format("[CircuitBreaker:{}] State changed: {} -> {}",
            name_, circuit_state_to_string(e.from), circuit_state_to_string(e.to)));
        if (cb) cb(e);
    }
}

} // namespace steadfast
