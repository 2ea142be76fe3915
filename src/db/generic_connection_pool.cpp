#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace steadfast {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      slots_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format(
                "[ConnectionPool:{}] Failed to create connection {} during warm-up", name_, i + 1));
            break;
        }
        std::lock_guard lock(mutex_);
        idle_connections_.push_back({std::move(conn), std::chrono::steady_clock::now()});
    }

    utils::log::info(std::format("[ConnectionPool:{}] Initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    waiting_.fetch_add(1, std::memory_order_relaxed);
    const bool slot = slots_.try_acquire_for(timeout);
    waiting_.fetch_sub(1, std::memory_order_relaxed);

    if (!slot) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "[ConnectionPool:{}] Acquire timed out after {}ms", name_, timeout.count()));
        return nullptr;
    }

    // Shutdown may have begun while we waited for the slot
    if (shutdown_.load(std::memory_order_acquire)) {
        slots_.release();
        return nullptr;
    }

    IdleEntry entry;
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            entry = std::move(idle_connections_.front());
            idle_connections_.pop_front();
        }
    }

    if (entry.conn) {
        const auto idle_for = std::chrono::steady_clock::now() - entry.last_used;
        if (idle_for > config_.idle_timeout &&
            !entry.conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            destroy_connection(std::move(entry.conn));
        }
    }

    auto conn = entry.conn ? std::move(entry.conn) : create_connection();
    if (!conn) {
        slots_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    return std::make_unique<PooledConnection>(std::move(conn),
        [this](std::unique_ptr<IDbConnection> c, bool reusable) {
            return_connection(std::move(c), reusable);
        });
}

PoolStats GenericConnectionPool::get_stats() const {
    const auto read = [](const std::atomic<size_t>& counter) {
        return counter.load(std::memory_order_relaxed);
    };

    std::lock_guard lock(mutex_);
    const size_t open = read(total_connections_);
    const size_t idle = idle_connections_.size();

    return PoolStats{
        .total_connections = open,
        .idle_connections = idle,
        .active_connections = open > idle ? open - idle : 0,
        .waiting_requests = read(waiting_),
        .max_connections = config_.max_connections,
        .total_acquires = read(total_acquires_),
        .total_releases = read(total_releases_),
        .failed_acquires = read(failed_acquires_),
        .health_check_failures = read(health_check_failures_),
    };
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<IdleEntry> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    for (auto& entry : idle) {
        destroy_connection(std::move(entry.conn));
    }

    utils::log::info(std::format("[ConnectionPool:{}] Drained", name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        return nullptr;
    }
    if (config_.query_timeout.count() > 0 &&
        !conn->set_query_timeout(static_cast<uint32_t>(config_.query_timeout.count()))) {
        utils::log::warn(std::format("[ConnectionPool:{}] Failed to set statement timeout", name_));
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        destroy_connection(std::move(conn));
    } else {
        std::lock_guard lock(mutex_);
        idle_connections_.push_back({std::move(conn), std::chrono::steady_clock::now()});
    }

    slots_.release();
}

} // namespace steadfast
