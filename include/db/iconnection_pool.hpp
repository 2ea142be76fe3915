#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace steadfast {

class PooledConnection;

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 2;                     // Opened up front
    size_t max_connections = 15;                    // Hard cap on open sessions
    std::chrono::milliseconds idle_timeout{30000};  // Idle longer → health check on reuse
    std::chrono::milliseconds query_timeout{30000}; // statement_timeout for new sessions
    std::string health_check_query{"SELECT 1"};
};

/**
 * @brief Point-in-time occupancy and lifetime counters
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;      // Leased right now
    size_t waiting_requests = 0;        // Callers blocked in acquire()
    size_t max_connections = 0;

    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;         // Timed out or could not open a session
    size_t health_check_failures = 0;
};

/**
 * @brief Bounded set of sessions to one endpoint ("primary" or "replica")
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Lease a session, waiting up to timeout for a free slot
     * @return nullptr on timeout, on connect failure, or after drain()
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{10000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle sessions and refuse further leases
     *
     * Sessions still leased are closed when they come back.
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace steadfast
