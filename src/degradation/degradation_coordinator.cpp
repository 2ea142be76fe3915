#include "degradation/degradation_coordinator.hpp"

#include <algorithm>

namespace steadfast {

DegradationCoordinator::DegradationCoordinator(size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? kDefaultMaxQueueSize : max_queue_size) {}

void DegradationCoordinator::initialize() {
    {
        std::lock_guard lock(mutex_);
        if (initialized_) return;
        initialized_ = true;
    }

    register_service("redis", {.critical = false});
    register_service("database", {.critical = true});
    register_service("lavalink", {.critical = false});
    register_service("discord", {.critical = true});

    utils::log::info("[GracefulDegradation] Initialized");
}

void DegradationCoordinator::register_service(const std::string& name, ServiceOptions options) {
    std::lock_guard lock(mutex_);
    ServiceInfo info;
    info.name = name;
    info.critical = options.critical;
    info.last_healthy = std::chrono::system_clock::now();
    services_[name] = std::move(info);
}

void DegradationCoordinator::register_fallback(const std::string& service, FallbackHandler handler) {
    std::lock_guard lock(mutex_);
    fallback_handlers_[service] = std::move(handler);
}

void DegradationCoordinator::mark_service(const std::string& name, ServiceState state,
                                          const std::string& reason) {
    std::optional<ServiceStateChange> change;
    std::optional<std::pair<DegradationLevel, DegradationLevel>> level_change;
    {
        std::lock_guard lock(mutex_);
        const auto it = services_.find(name);
        if (it == services_.end()) return;

        auto& service = it->second;
        const ServiceState previous = service.state;
        service.state = state;

        if (state == ServiceState::HEALTHY) {
            service.last_healthy = std::chrono::system_clock::now();
            service.degraded_since.reset();
            service.failure_count = 0;
        } else {
            ++service.failure_count;
            if (!service.degraded_since) {
                service.degraded_since = std::chrono::system_clock::now();
            }
        }

        if (previous != state) {
            change = ServiceStateChange{name, previous, state, reason};
        }
        level_change = update_level_locked();
    }

    if (change) {
        const auto msg = std::format("[GracefulDegradation] {}: {} -> {}{}",
            name, service_state_to_string(change->previous), service_state_to_string(state),
            reason.empty() ? "" : " (" + reason + ")");
        if (state == ServiceState::HEALTHY) {
            utils::log::info(msg);
        } else {
            utils::log::warn(msg);
        }
    }
    if (level_change) {
        utils::log::warn(std::format("[GracefulDegradation] System level: {} -> {}",
            degradation_level_to_string(level_change->first),
            degradation_level_to_string(level_change->second)));
    }

    if (!change && !level_change) return;

    for (const auto& listener : listeners_snapshot()) {
        if (change) listener->on_service_state_change(*change);
        if (level_change) listener->on_level_change(level_change->first, level_change->second);
    }
}

void DegradationCoordinator::mark_healthy(const std::string& name) {
    mark_service(name, ServiceState::HEALTHY);
    process_queue(name);
}

void DegradationCoordinator::mark_degraded(const std::string& name, const std::string& reason) {
    mark_service(name, ServiceState::DEGRADED, reason);
}

void DegradationCoordinator::mark_unavailable(const std::string& name, const std::string& reason) {
    mark_service(name, ServiceState::UNAVAILABLE, reason);
}

std::optional<std::pair<DegradationLevel, DegradationLevel>>
DegradationCoordinator::update_level_locked() {
    size_t unhealthy = 0;
    bool critical_down = false;

    for (const auto& [name, service] : services_) {
        if (service.state != ServiceState::HEALTHY) ++unhealthy;
        if (service.critical && service.state == ServiceState::UNAVAILABLE) critical_down = true;
    }

    DegradationLevel next = DegradationLevel::NORMAL;
    if (!services_.empty() && unhealthy == services_.size()) {
        next = DegradationLevel::OFFLINE;
    } else if (critical_down) {
        next = DegradationLevel::CRITICAL;
    } else if (unhealthy > 0) {
        next = DegradationLevel::DEGRADED;
    }

    if (next == level_) return std::nullopt;
    const auto previous = level_;
    level_ = next;
    return std::make_pair(previous, next);
}

void DegradationCoordinator::on_primary_success(const std::string& service,
                                                const std::optional<std::string>& cache_key,
                                                std::any value) {
    bool needs_heal = false;
    {
        std::lock_guard lock(mutex_);
        if (cache_key && value.has_value()) {
            fallback_cache_[cache_key_for(service, *cache_key)] =
                CachedValue{std::move(value), std::chrono::system_clock::now()};
        }
        const auto it = services_.find(service);
        needs_heal = it != services_.end() && it->second.state != ServiceState::HEALTHY;
    }
    if (needs_heal) {
        mark_healthy(service);
    }
}

void DegradationCoordinator::on_primary_failure(const std::string& service, const std::string& message) {
    utils::log::debug(std::format("[GracefulDegradation] {} operation failed: {}", service, message));
    mark_degraded(service, message);
}

DegradationCoordinator::FallbackHandler
DegradationCoordinator::find_handler(const std::string& service) const {
    std::lock_guard lock(mutex_);
    const auto it = fallback_handlers_.find(service);
    return it != fallback_handlers_.end() ? it->second : FallbackHandler{};
}

std::optional<DegradationCoordinator::CachedValue>
DegradationCoordinator::find_cached(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto it = fallback_cache_.find(key);
    if (it == fallback_cache_.end()) return std::nullopt;
    return it->second;
}

void DegradationCoordinator::queue_write(const std::string& service, const std::string& operation,
                                         nlohmann::json payload) {
    QueuedWrite write;
    size_t size = 0;
    {
        std::lock_guard lock(mutex_);
        if (write_queue_.size() >= max_queue_size_) {
            const auto& dropped = write_queue_.front();
            utils::log::warn(std::format(
                "[GracefulDegradation] Write queue full, dropping oldest {} write for {}",
                dropped.operation, dropped.service));
            write_queue_.pop_front();
        }

        write.id = next_write_id_++;
        write.service = service;
        write.operation = operation;
        write.payload = std::move(payload);
        write.timestamp = std::chrono::system_clock::now();
        write_queue_.push_back(write);
        size = write_queue_.size();
    }

    utils::log::debug(std::format("[GracefulDegradation] Queued {} write for {} (queue size: {})",
        operation, service, size));

    for (const auto& listener : listeners_snapshot()) {
        listener->on_write_queued(write, size);
    }
}

void DegradationCoordinator::process_queue(const std::string& service) {
    std::vector<QueuedWrite> pending;
    {
        std::lock_guard lock(mutex_);
        for (const auto& w : write_queue_) {
            if (w.service == service) pending.push_back(w);
        }
    }
    if (pending.empty()) return;

    utils::log::info(std::format("[GracefulDegradation] Replaying {} queued writes for {}",
        pending.size(), service));

    const auto listeners = listeners_snapshot();

    for (const auto& write : pending) {
        bool delivered = true;
        std::string failure;
        for (const auto& listener : listeners) {
            try {
                listener->on_queued_write(write);
            } catch (const std::exception& e) {
                delivered = false;
                failure = e.what();
            } catch (...) {
                delivered = false;
                failure = "non-standard exception";
            }
        }

        std::lock_guard lock(mutex_);
        const auto it = std::find_if(write_queue_.begin(), write_queue_.end(),
            [&](const QueuedWrite& w) { return w.id == write.id; });
        if (it == write_queue_.end()) continue;  // evicted meanwhile

        if (delivered) {
            write_queue_.erase(it);
            continue;
        }

        ++it->retries;
        if (it->retries >= kMaxReplayAttempts) {
            utils::log::error(std::format(
                "[GracefulDegradation] Dropping {} write for {} after {} attempts: {}",
                it->operation, it->service, it->retries, failure));
            write_queue_.erase(it);
        } else {
            utils::log::warn(std::format(
                "[GracefulDegradation] Replay of {} write for {} failed (attempt {}): {}",
                it->operation, it->service, it->retries, failure));
        }
    }
}

bool DegradationCoordinator::is_available(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = services_.find(name);
    return it != services_.end() && it->second.state == ServiceState::HEALTHY;
}

bool DegradationCoordinator::is_degraded(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = services_.find(name);
    return it != services_.end() && it->second.state == ServiceState::DEGRADED;
}

std::optional<ServiceState> DegradationCoordinator::get_service_state(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = services_.find(name);
    if (it == services_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<ServiceInfo> DegradationCoordinator::get_service(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = services_.find(name);
    if (it == services_.end()) return std::nullopt;
    return it->second;
}

bool DegradationCoordinator::is_system_degraded() const {
    std::lock_guard lock(mutex_);
    return level_ != DegradationLevel::NORMAL;
}

DegradationLevel DegradationCoordinator::level() const {
    std::lock_guard lock(mutex_);
    return level_;
}

SystemStatus DegradationCoordinator::get_status() const {
    std::lock_guard lock(mutex_);

    SystemStatus status;
    status.level = level_;
    status.timestamp = utils::format_timestamp(std::chrono::system_clock::now());
    for (const auto& [name, service] : services_) {
        ServiceStatusInfo info;
        info.state = service.state;
        info.critical = service.critical;
        info.last_healthy = utils::format_timestamp(service.last_healthy);
        info.degraded_since = utils::format_optional_timestamp(service.degraded_since);
        info.failure_count = service.failure_count;
        status.services.emplace(name, std::move(info));
    }
    status.queued_writes = write_queue_.size();
    status.cache_entries = fallback_cache_.size();
    return status;
}

SystemHealth DegradationCoordinator::get_health() const {
    SystemHealth health;
    health.details = get_status();
    health.healthy = health.details.level != DegradationLevel::OFFLINE &&
                     health.details.level != DegradationLevel::CRITICAL;
    return health;
}

std::vector<QueuedWrite> DegradationCoordinator::queued_writes() const {
    std::lock_guard lock(mutex_);
    return {write_queue_.begin(), write_queue_.end()};
}

size_t DegradationCoordinator::queue_size() const {
    std::lock_guard lock(mutex_);
    return write_queue_.size();
}

void DegradationCoordinator::clear_cache(const std::optional<std::string>& service) {
    std::lock_guard lock(mutex_);
    if (!service) {
        fallback_cache_.clear();
        return;
    }
    const auto prefix = *service + ":";
    std::erase_if(fallback_cache_, [&](const auto& entry) {
        return entry.first.starts_with(prefix);
    });
}

void DegradationCoordinator::add_listener(std::shared_ptr<IDegradationListener> listener) {
    if (!listener) return;
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void DegradationCoordinator::remove_listener(const std::shared_ptr<IDegradationListener>& listener) {
    std::lock_guard lock(mutex_);
    std::erase(listeners_, listener);
}

std::vector<std::shared_ptr<IDegradationListener>> DegradationCoordinator::listeners_snapshot() const {
    std::lock_guard lock(mutex_);
    return listeners_;
}

void DegradationCoordinator::shutdown() {
    std::lock_guard lock(mutex_);
    services_.clear();
    fallback_handlers_.clear();
    fallback_cache_.clear();
    write_queue_.clear();
    listeners_.clear();
    level_ = DegradationLevel::NORMAL;
    initialized_ = false;
    utils::log::info("[GracefulDegradation] Shutdown complete");
}

} // namespace steadfast
