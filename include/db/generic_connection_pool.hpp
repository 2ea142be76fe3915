#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace steadfast {

/**
 * @brief Pool of sessions to one endpoint, opened through a factory
 *
 * min_connections sessions are opened by the constructor; more are opened
 * on demand while fewer than max_connections leases are out. Each lease
 * holds one semaphore slot. A session that sat idle past idle_timeout runs
 * the health check query before it is leased again.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{10000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return name_; }

private:
    struct IdleEntry {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();
    void destroy_connection(std::unique_ptr<IDbConnection> conn);
    // Lease end callback; gives back the semaphore slot
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<IdleEntry> idle_connections_;   // Guarded by mutex_; oldest first

    std::counting_semaphore<> slots_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> waiting_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace steadfast
