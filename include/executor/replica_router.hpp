#pragma once

#include "db/iconnection_pool.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string_view>

namespace steadfast {

/**
 * @brief True if sql may run on a read replica
 *
 * Trimmed, upper-cased text must start with SELECT and carry no row locks
 * (FOR UPDATE / FOR SHARE). A WITH query containing INSERT, UPDATE or
 * DELETE anywhere is treated as a write. CTE reads therefore always run
 * on the primary.
 */
[[nodiscard]] bool is_read_only_query(std::string_view sql);

/**
 * @brief Picks the pool a statement runs on
 *
 * Read-only statements go to the replica when one is enabled, everything
 * else (and any call forcing the primary) to the primary pool. The replica
 * can be disabled once and stays disabled.
 *
 * Thread-safe: shared_mutex for the replica slot, atomic counters.
 */
class ReplicaRouter {
public:
    explicit ReplicaRouter(std::shared_ptr<IConnectionPool> primary,
                           std::shared_ptr<IConnectionPool> replica = nullptr);

    [[nodiscard]] std::shared_ptr<IConnectionPool> route(std::string_view sql, bool use_primary = false);

    [[nodiscard]] std::shared_ptr<IConnectionPool> primary() const { return primary_; }
    [[nodiscard]] std::shared_ptr<IConnectionPool> replica() const;

    [[nodiscard]] bool has_replica() const;

    /**
     * @brief Drop the replica permanently and drain its pool
     */
    void disable_replica();

    struct Stats {
        uint64_t primary_queries;
        uint64_t replica_queries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<IConnectionPool> primary_;
    std::shared_ptr<IConnectionPool> replica_;
    mutable std::shared_mutex replica_mutex_;
    std::atomic<uint64_t> primary_queries_{0};
    std::atomic<uint64_t> replica_queries_{0};
};

} // namespace steadfast
