#include "core/resilience_context.hpp"
#include "core/utils.hpp"

namespace steadfast {

ResilienceContext::ResilienceContext(const ResilienceConfig& config)
    : config_(config),
      coordinator_(config.degradation.max_queue_size) {}

void ResilienceContext::initialize() {
    std::lock_guard lock(mutex_);
    if (initialized_) return;

    registry_.initialize(config_.circuit_breakers);
    coordinator_.initialize();
    initialized_ = true;

    utils::log::info(std::format("[ResilienceContext] Initialized ({} breakers)", registry_.size()));
}

bool ResilienceContext::is_initialized() const {
    std::lock_guard lock(mutex_);
    return initialized_;
}

void ResilienceContext::shutdown() {
    std::lock_guard lock(mutex_);
    registry_.shutdown();
    coordinator_.shutdown();
    initialized_ = false;
}

void ResilienceContext::reset() {
    shutdown();
    initialize();
}

} // namespace steadfast
