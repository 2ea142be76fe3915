#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pool_monitor.hpp"
#include "db/pooled_connection.hpp"
#include "db/retry_policy.hpp"
#include "degradation/degradation_coordinator.hpp"
#include "executor/replica_router.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace steadfast {

/// One result row: column name → value (see PgTypeMap::decode_value)
using Row = nlohmann::json;

/// Positional parameters bound to $1..$n
using Params = std::vector<nlohmann::json>;

struct QueryOptions {
    std::optional<uint32_t> retries;    // Overrides RetryConfig::max_retries
    bool no_retry = false;
    bool use_primary = false;           // Bypass the read replica
};

struct QueryResult {
    std::vector<Row> rows;
    uint64_t row_count = 0;
    std::vector<std::string> fields;
};

/**
 * @brief Outcome of a safe_* write
 *
 * queued = true means the database was unavailable and the write now sits
 * in the coordinator's queue; row / affected_rows are then empty.
 */
struct WriteResult {
    bool queued = false;
    std::string operation;
    std::string table;
    std::optional<Row> row;         // insert / update
    uint64_t affected_rows = 0;     // delete
};

struct DatabaseStatus {
    bool connected = false;
    std::string state;              // coordinator state of "database", or "unknown"
    uint32_t failure_count = 0;
    uint32_t max_failures = 0;
    size_t pending_writes = 0;
    bool replica_enabled = false;
    std::optional<std::string> replica_host;
    RetryConfig retry;
};

struct StoreOptions {
    DatabaseConfig database;
    RetryConfig retry;
    PoolMonitorConfig pool_monitor;
};

/**
 * @brief Statement runner bound to one connection inside BEGIN/COMMIT
 *
 * No retries: a failed statement throws DatabaseError and the enclosing
 * transaction() rolls back.
 */
class Transaction {
public:
    explicit Transaction(PooledConnection& conn) : conn_(conn) {}

    QueryResult query(const std::string& sql, const Params& params = {});

    void begin();
    void commit();

    /**
     * @brief Issue ROLLBACK; a failed rollback poisons the connection
     * @return true if the server accepted the rollback
     */
    bool rollback();

private:
    PooledConnection& conn_;
};

/**
 * @brief Pooled, retrying, replica-aware PostgreSQL access
 *
 * - Reads (see is_read_only_query) go to the replica when one passed its
 *   startup probe; writes and use_primary calls go to the primary.
 * - Transient failures (see RetryPolicy) are retried with jittered backoff.
 * - Consecutive connection errors mark "database" UNAVAILABLE in the
 *   coordinator; the next successful query marks it healthy again, which
 *   replays writes queued by safe_insert/safe_update/safe_delete.
 * - Table and column names are checked by IdentifierGuard; values are
 *   always bound parameters.
 *
 * Thread-safe.
 */
class ResilientDataStore {
public:
    ResilientDataStore(DegradationCoordinator& coordinator,
                       StoreOptions options,
                       std::shared_ptr<IConnectionFactory> factory,
                       RetryPolicy::JitterSource jitter = {});

    ~ResilientDataStore();

    ResilientDataStore(const ResilientDataStore&) = delete;
    ResilientDataStore& operator=(const ResilientDataStore&) = delete;

    /**
     * @brief Create pools, probe the replica, verify the primary
     *
     * No-op when already initialized.
     * @throws DatabaseError when the primary cannot be reached
     */
    void initialize();

    [[nodiscard]] bool is_initialized() const { return initialized_.load(); }
    [[nodiscard]] bool is_connected() const { return connected_.load(); }

    /**
     * @throws NotInitializedError before initialize()
     * @throws DatabaseError once retries are exhausted or the error is permanent
     */
    QueryResult query(const std::string& sql, const Params& params = {}, QueryOptions options = {});

    [[nodiscard]] std::optional<Row> get_one(const std::string& sql, const Params& params = {});
    [[nodiscard]] std::vector<Row> get_many(const std::string& sql, const Params& params = {});

    /**
     * @brief INSERT ... RETURNING *
     * @param data Column → value object
     * @throws InvalidIdentifierError for a non allow-listed table or bad column
     */
    Row insert(const std::string& table, const nlohmann::json& data);

    /**
     * @brief UPDATE ... SET data WHERE where (AND-ed equality) RETURNING *
     * @return First updated row, or nullopt when nothing matched
     */
    std::optional<Row> update(const std::string& table, const nlohmann::json& data,
                              const nlohmann::json& where);

    /**
     * @brief INSERT ... ON CONFLICT (conflict_key)
     *
     * With only the conflict key in data: DO NOTHING, then re-read the
     * existing row. Otherwise DO UPDATE SET every other column.
     */
    std::optional<Row> upsert(const std::string& table, const nlohmann::json& data,
                              const std::string& conflict_key);

    /**
     * @brief DELETE ... WHERE where
     * @return Number of deleted rows
     */
    uint64_t delete_rows(const std::string& table, const nlohmann::json& where);

    WriteResult safe_insert(const std::string& table, const nlohmann::json& data);
    WriteResult safe_update(const std::string& table, const nlohmann::json& data,
                            const nlohmann::json& where);
    WriteResult safe_delete(const std::string& table, const nlohmann::json& where);

    /**
     * @brief Run callback inside BEGIN/COMMIT on a dedicated primary connection
     *
     * Any exception rolls back and propagates. The connection is returned to
     * the pool on every path.
     */
    template<typename F>
    auto transaction(F&& callback) -> std::invoke_result_t<F&, Transaction&>;

    /**
     * @brief SELECT 1 on the primary; never throws
     */
    [[nodiscard]] bool health_check();

    /**
     * @brief SELECT 1 on the replica; false when no replica is enabled
     */
    [[nodiscard]] bool read_replica_health_check();

    [[nodiscard]] DatabaseStatus get_status() const;

    /**
     * @brief Pool samples for every live pool
     */
    [[nodiscard]] std::vector<PoolSample> sample_pools() const;

    [[nodiscard]] ReplicaRouter::Stats routing_stats() const;

    /**
     * @brief Stop monitoring, drain pools, detach from the coordinator
     */
    void close();

private:
    class WriteReplayer;

    // Caller holds lifecycle_mutex_
    void open_pools();

    // The pool is held alongside the lease so close() cannot free it first
    struct PrimaryLease {
        std::shared_ptr<IConnectionPool> pool;
        std::unique_ptr<PooledConnection> conn;
    };

    QueryResult run_once(IConnectionPool& pool, const std::string& sql, const Params& params);
    PrimaryLease acquire_primary();

    void on_query_success();
    void handle_query_error(const std::exception& e);
    void handle_connection_error(const std::exception& e);

    bool should_queue() const;
    void queue_write(const std::string& operation, const std::string& table,
                     const nlohmann::json& data, const nlohmann::json& where);

    void replay(const QueuedWrite& write);

    [[nodiscard]] std::shared_ptr<ReplicaRouter> router() const;

    static PoolConfig make_pool_config(const EndpointConfig& endpoint, const DatabaseConfig& db,
                                       size_t min_connections, size_t max_connections);

    DegradationCoordinator& coordinator_;
    StoreOptions options_;
    std::shared_ptr<IConnectionFactory> factory_;
    RetryPolicy retry_policy_;

    mutable std::mutex lifecycle_mutex_;
    std::shared_ptr<ReplicaRouter> router_;
    std::unique_ptr<PoolMonitor> monitor_;
    std::shared_ptr<WriteReplayer> replayer_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> connected_{false};
    std::atomic<uint32_t> failure_count_{0};
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename F>
auto ResilientDataStore::transaction(F&& callback) -> std::invoke_result_t<F&, Transaction&> {
    using R = std::invoke_result_t<F&, Transaction&>;

    auto lease = acquire_primary();
    Transaction tx(*lease.conn);
    tx.begin();

    try {
        if constexpr (std::is_void_v<R>) {
            callback(tx);
            tx.commit();
        } else {
            R result = callback(tx);
            tx.commit();
            return result;
        }
    } catch (...) {
        tx.rollback();
        throw;
    }
}

} // namespace steadfast
