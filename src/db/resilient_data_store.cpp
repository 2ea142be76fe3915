#include "db/resilient_data_store.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/identifier_guard.hpp"
#include "db/postgresql/pg_type_map.hpp"

#include <format>
#include <thread>

namespace steadfast {

namespace {

constexpr const char* kDatabaseService = "database";
constexpr auto kSlowQueryThreshold = std::chrono::milliseconds{1000};

DbParams to_db_params(const Params& params) {
    DbParams out;
    out.reserve(params.size());
    for (const auto& p : params) {
        out.push_back(PgTypeMap::encode_param(p));
    }
    return out;
}

QueryResult to_query_result(const DbResultSet& rs) {
    QueryResult result;
    result.rows = PgTypeMap::to_rows(rs);
    result.row_count = rs.affected_rows;
    result.fields = rs.column_names;
    return result;
}

void require_object(const nlohmann::json& value, const char* what) {
    if (!value.is_object() || value.empty()) {
        throw InvalidIdentifierError(std::format("{} must be a non-empty column/value object", what));
    }
}

/**
 * @brief "a = $n AND b = $n+1 ..." with values appended to params
 */
std::string where_clause(const nlohmann::json& where, Params& params) {
    std::string clause;
    for (const auto& [column, value] : where.items()) {
        IdentifierGuard::validate_identifier(column);
        params.push_back(value);
        if (!clause.empty()) clause += " AND ";
        clause += std::format("{} = ${}", column, params.size());
    }
    return clause;
}

} // anonymous namespace

// ============================================================================
// Transaction
// ============================================================================

QueryResult Transaction::query(const std::string& sql, const Params& params) {
    auto rs = conn_->execute(sql, to_db_params(params));
    if (!rs.success) {
        throw DatabaseError(rs.error_message, rs.sqlstate);
    }
    return to_query_result(rs);
}

void Transaction::begin() {
    query("BEGIN");
}

void Transaction::commit() {
    query("COMMIT");
}

bool Transaction::rollback() {
    const auto rs = conn_->execute("ROLLBACK");
    if (!rs.success) {
        utils::log::error(std::format("[PostgreSQL] Rollback failed: {}", rs.error_message));
        conn_.discard();
        return false;
    }
    return true;
}

// ============================================================================
// Queued write replay
// ============================================================================

class ResilientDataStore::WriteReplayer : public IDegradationListener {
public:
    explicit WriteReplayer(ResilientDataStore& store) : store_(store) {}

    void on_queued_write(const QueuedWrite& write) override {
        if (write.service != kDatabaseService) return;
        store_.replay(write);
    }

private:
    ResilientDataStore& store_;
};

// ============================================================================
// ResilientDataStore
// ============================================================================

ResilientDataStore::ResilientDataStore(DegradationCoordinator& coordinator,
                                       StoreOptions options,
                                       std::shared_ptr<IConnectionFactory> factory,
                                       RetryPolicy::JitterSource jitter)
    : coordinator_(coordinator),
      options_(std::move(options)),
      factory_(std::move(factory)),
      retry_policy_(options_.retry, std::move(jitter)) {}

ResilientDataStore::~ResilientDataStore() {
    close();
}

PoolConfig ResilientDataStore::make_pool_config(const EndpointConfig& endpoint, const DatabaseConfig& db,
                                                size_t min_connections, size_t max_connections) {
    PoolConfig cfg;
    cfg.connection_string = endpoint.to_connection_string(db.connection_timeout);
    cfg.min_connections = min_connections;
    cfg.max_connections = max_connections;
    cfg.idle_timeout = db.idle_timeout;
    cfg.query_timeout = db.query_timeout;
    return cfg;
}

void ResilientDataStore::initialize() {
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (initialized_.load()) return;
        open_pools();
    }

    utils::log::info("[PostgreSQL] Connected to database");

    // Outside the lock: mark_healthy replays queued writes through this store
    coordinator_.register_fallback(kDatabaseService, [](const std::exception*) { return std::any{}; });
    coordinator_.mark_healthy(kDatabaseService);
}

void ResilientDataStore::open_pools() {
    const auto& db = options_.database;

    if (!coordinator_.get_service_state(kDatabaseService)) {
        coordinator_.register_service(kDatabaseService, {.critical = true});
    }

    auto primary = std::make_shared<GenericConnectionPool>("primary",
        make_pool_config(db.endpoint, db, db.min_connections, db.max_connections), factory_);

    std::shared_ptr<IConnectionPool> replica;
    if (db.replica) {
        replica = std::make_shared<GenericConnectionPool>("replica",
            make_pool_config(db.replica->endpoint, db,
                             db.replica->min_connections, db.replica->max_connections),
            factory_);
    }
    auto router = std::make_shared<ReplicaRouter>(primary, replica);

    if (replica) {
        // Probed once; a replica that fails here stays off for the process lifetime
        bool reachable = false;
        if (auto probe = replica->acquire(db.connection_timeout)) {
            reachable = probe->get()->execute("SELECT NOW()").success;
        }
        if (reachable) {
            utils::log::info(std::format("[PostgreSQL] Read replica connected: {}",
                db.replica->endpoint.host));
        } else {
            utils::log::warn(std::format("[PostgreSQL] Read replica connection failed: {}",
                db.replica->endpoint.host));
            router->disable_replica();
            replica.reset();
        }
    }

    {
        auto probe = primary->acquire(db.connection_timeout);
        if (!probe) {
            utils::log::error("[PostgreSQL] Connection failed: could not open a connection");
            throw DatabaseError("Connection failed: could not open a connection to the primary", "08001");
        }
        const auto rs = probe->get()->execute("SELECT NOW()");
        if (!rs.success) {
            utils::log::error(std::format("[PostgreSQL] Connection failed: {}", rs.error_message));
            throw DatabaseError("Connection failed: " + rs.error_message, rs.sqlstate);
        }
    }

    router_ = std::move(router);

    std::vector<std::shared_ptr<IConnectionPool>> pools{primary};
    if (replica) pools.push_back(replica);
    monitor_ = std::make_unique<PoolMonitor>(std::move(pools), options_.pool_monitor);
    monitor_->start();

    replayer_ = std::make_shared<WriteReplayer>(*this);
    coordinator_.add_listener(replayer_);

    failure_count_.store(0);
    connected_.store(true);
    initialized_.store(true);
}

std::shared_ptr<ReplicaRouter> ResilientDataStore::router() const {
    std::lock_guard lock(lifecycle_mutex_);
    return router_;
}

QueryResult ResilientDataStore::query(const std::string& sql, const Params& params, QueryOptions options) {
    auto r = router();
    if (!r) {
        throw NotInitializedError("Database not initialized");
    }

    auto pool = r->route(sql, options.use_primary);
    const uint32_t max_retries = options.no_retry
        ? 0 : options.retries.value_or(retry_policy_.config().max_retries);

    for (uint32_t attempt = 0;; ++attempt) {
        utils::Timer timer;
        try {
            auto result = run_once(*pool, sql, params);
            on_query_success();

            const auto elapsed = timer.elapsed_ms();
            if (elapsed > kSlowQueryThreshold) {
                utils::log::warn(std::format("[PostgreSQL] Slow query ({}ms): {}",
                    elapsed.count(), utils::truncate(sql, 100)));
            }
            if (attempt > 0) {
                utils::log::info(std::format("[PostgreSQL] Query succeeded on retry {}", attempt));
            }
            return result;
        } catch (const DatabaseError& e) {
            if (attempt < max_retries && retry_policy_.is_transient(e)) {
                const auto delay = retry_policy_.delay_for(attempt);
                utils::log::warn(std::format("[PostgreSQL] Transient error ({}), retry {}/{} in {}ms",
                    e.sqlstate().empty() ? e.what() : e.sqlstate(), attempt + 1, max_retries,
                    delay.count()));
                std::this_thread::sleep_for(delay);
                continue;
            }
            handle_query_error(e);
            throw;
        }
    }
}

QueryResult ResilientDataStore::run_once(IConnectionPool& pool, const std::string& sql, const Params& params) {
    auto lease = pool.acquire(options_.database.acquire_timeout);
    if (!lease) {
        throw DatabaseError(std::format(
            "Connection pool '{}': timeout expired while acquiring a connection", pool.name()), "08001");
    }

    const auto rs = lease->get()->execute(sql, to_db_params(params));
    if (!rs.success) {
        throw DatabaseError(rs.error_message, rs.sqlstate);
    }
    return to_query_result(rs);
}

ResilientDataStore::PrimaryLease ResilientDataStore::acquire_primary() {
    auto r = router();
    if (!r) {
        throw NotInitializedError("Database not initialized");
    }
    PrimaryLease lease{.pool = r->primary(), .conn = nullptr};
    lease.conn = lease.pool->acquire(options_.database.acquire_timeout);
    if (!lease.conn) {
        DatabaseError error("Connection pool 'primary': timeout expired while acquiring a connection", "08001");
        handle_query_error(error);
        throw error;
    }
    return lease;
}

void ResilientDataStore::on_query_success() {
    failure_count_.store(0);

    const auto state = coordinator_.get_service_state(kDatabaseService);
    const bool was_down = !connected_.exchange(true);
    if (was_down || (state && *state != ServiceState::HEALTHY)) {
        utils::log::info("[PostgreSQL] Database reachable again");
        coordinator_.mark_healthy(kDatabaseService);
    }
}

void ResilientDataStore::handle_query_error(const std::exception& e) {
    utils::log::error(std::format("[PostgreSQL] Query error: {}", e.what()));
    if (is_connection_error(e)) {
        handle_connection_error(e);
    }
}

void ResilientDataStore::handle_connection_error(const std::exception& e) {
    const uint32_t failures = failure_count_.fetch_add(1) + 1;
    const uint32_t max_failures = options_.database.max_connection_failures;
    utils::log::error(std::format("[PostgreSQL] Connection error ({}/{}): {}",
        failures, max_failures, e.what()));

    if (failures >= max_failures) {
        coordinator_.mark_unavailable(kDatabaseService, "Too many connection failures");
        connected_.store(false);
    }
}

std::optional<Row> ResilientDataStore::get_one(const std::string& sql, const Params& params) {
    auto result = query(sql, params);
    if (result.rows.empty()) return std::nullopt;
    return std::move(result.rows.front());
}

std::vector<Row> ResilientDataStore::get_many(const std::string& sql, const Params& params) {
    return query(sql, params).rows;
}

Row ResilientDataStore::insert(const std::string& table, const nlohmann::json& data) {
    IdentifierGuard::validate_table(table);
    require_object(data, "Insert data");

    std::string columns;
    std::string placeholders;
    Params params;
    for (const auto& [column, value] : data.items()) {
        IdentifierGuard::validate_identifier(column);
        params.push_back(value);
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += column;
        placeholders += std::format("${}", params.size());
    }

    const auto sql = std::format("INSERT INTO {} ({}) VALUES ({}) RETURNING *",
        table, columns, placeholders);
    auto result = query(sql, params);
    return result.rows.empty() ? Row::object() : std::move(result.rows.front());
}

std::optional<Row> ResilientDataStore::update(const std::string& table, const nlohmann::json& data,
                                              const nlohmann::json& where) {
    IdentifierGuard::validate_table(table);
    require_object(data, "Update data");
    require_object(where, "Update condition");

    std::string set_clause;
    Params params;
    for (const auto& [column, value] : data.items()) {
        IdentifierGuard::validate_identifier(column);
        params.push_back(value);
        if (!set_clause.empty()) set_clause += ", ";
        set_clause += std::format("{} = ${}", column, params.size());
    }
    const auto condition = where_clause(where, params);

    const auto sql = std::format("UPDATE {} SET {} WHERE {} RETURNING *", table, set_clause, condition);
    auto result = query(sql, params);
    if (result.rows.empty()) return std::nullopt;
    return std::move(result.rows.front());
}

std::optional<Row> ResilientDataStore::upsert(const std::string& table, const nlohmann::json& data,
                                              const std::string& conflict_key) {
    IdentifierGuard::validate_table(table);
    require_object(data, "Upsert data");
    IdentifierGuard::validate_identifier(conflict_key);

    std::string columns;
    std::string placeholders;
    std::string update_clause;
    Params params;
    for (const auto& [column, value] : data.items()) {
        IdentifierGuard::validate_identifier(column);
        params.push_back(value);
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += column;
        placeholders += std::format("${}", params.size());

        if (column != conflict_key) {
            if (!update_clause.empty()) update_clause += ", ";
            update_clause += std::format("{} = EXCLUDED.{}", column, column);
        }
    }

    if (update_clause.empty()) {
        const auto sql = std::format("INSERT INTO {} ({}) VALUES ({}) ON CONFLICT ({}) DO NOTHING",
            table, columns, placeholders, conflict_key);
        query(sql, params);

        // The row may predate this call; read it back either way
        const auto key = data.find(conflict_key);
        return get_one(std::format("SELECT * FROM {} WHERE {} = $1", table, conflict_key),
                       {key != data.end() ? *key : nlohmann::json()});
    }

    const auto sql = std::format(
        "INSERT INTO {} ({}) VALUES ({}) ON CONFLICT ({}) DO UPDATE SET {} RETURNING *",
        table, columns, placeholders, conflict_key, update_clause);
    auto result = query(sql, params);
    if (result.rows.empty()) return std::nullopt;
    return std::move(result.rows.front());
}

uint64_t ResilientDataStore::delete_rows(const std::string& table, const nlohmann::json& where) {
    IdentifierGuard::validate_table(table);
    require_object(where, "Delete condition");

    Params params;
    const auto condition = where_clause(where, params);
    return query(std::format("DELETE FROM {} WHERE {}", table, condition), params).row_count;
}

bool ResilientDataStore::should_queue() const {
    return coordinator_.get_service_state(kDatabaseService) == ServiceState::UNAVAILABLE ||
           !connected_.load();
}

void ResilientDataStore::queue_write(const std::string& operation, const std::string& table,
                                     const nlohmann::json& data, const nlohmann::json& where) {
    nlohmann::json payload = {{"table", table}};
    if (!data.is_null()) payload["data"] = data;
    if (!where.is_null()) payload["where"] = where;

    coordinator_.queue_write(kDatabaseService, operation, std::move(payload));
    utils::log::warn(std::format("[PostgreSQL] Queued {} on {} for later execution", operation, table));
}

WriteResult ResilientDataStore::safe_insert(const std::string& table, const nlohmann::json& data) {
    WriteResult result{.operation = "insert", .table = table};
    if (should_queue()) {
        IdentifierGuard::validate_table(table);
        queue_write(result.operation, table, data, nullptr);
        result.queued = true;
        return result;
    }
    result.row = insert(table, data);
    return result;
}

WriteResult ResilientDataStore::safe_update(const std::string& table, const nlohmann::json& data,
                                            const nlohmann::json& where) {
    WriteResult result{.operation = "update", .table = table};
    if (should_queue()) {
        IdentifierGuard::validate_table(table);
        queue_write(result.operation, table, data, where);
        result.queued = true;
        return result;
    }
    result.row = update(table, data, where);
    return result;
}

WriteResult ResilientDataStore::safe_delete(const std::string& table, const nlohmann::json& where) {
    WriteResult result{.operation = "delete", .table = table};
    if (should_queue()) {
        IdentifierGuard::validate_table(table);
        queue_write(result.operation, table, nullptr, where);
        result.queued = true;
        return result;
    }
    result.affected_rows = delete_rows(table, where);
    return result;
}

void ResilientDataStore::replay(const QueuedWrite& write) {
    const auto& payload = write.payload;
    const auto table = payload.value("table", std::string{});
    const auto data = payload.value("data", nlohmann::json::object());
    const auto where = payload.value("where", nlohmann::json::object());

    if (write.operation == "insert") {
        insert(table, data);
    } else if (write.operation == "update") {
        update(table, data, where);
    } else if (write.operation == "delete") {
        delete_rows(table, where);
    } else {
        throw DatabaseError(std::format("Unknown queued operation '{}'", write.operation));
    }
    utils::log::info(std::format("[PostgreSQL] Replayed queued {} on {}", write.operation, table));
}

bool ResilientDataStore::health_check() {
    try {
        query("SELECT 1", {}, {.use_primary = true});
        return true;
    } catch (const ResilienceError& e) {
        utils::log::debug(std::format("[PostgreSQL] Health check failed: {}", e.what()));
        return false;
    }
}

bool ResilientDataStore::read_replica_health_check() {
    auto r = router();
    if (!r) return false;
    auto replica = r->replica();
    if (!replica) return false;

    auto lease = replica->acquire(options_.database.acquire_timeout);
    return lease && lease->get()->is_healthy("SELECT 1");
}

DatabaseStatus ResilientDataStore::get_status() const {
    DatabaseStatus status;
    status.connected = connected_.load();

    const auto state = coordinator_.get_service_state(kDatabaseService);
    status.state = state ? utils::to_lower(service_state_to_string(*state)) : "unknown";
    status.failure_count = failure_count_.load();
    status.max_failures = options_.database.max_connection_failures;

    for (const auto& w : coordinator_.queued_writes()) {
        if (w.service == kDatabaseService) ++status.pending_writes;
    }

    auto r = router();
    status.replica_enabled = r && r->has_replica();
    if (options_.database.replica) {
        status.replica_host = options_.database.replica->endpoint.host;
    }
    status.retry = retry_policy_.config();
    return status;
}

std::vector<PoolSample> ResilientDataStore::sample_pools() const {
    std::lock_guard lock(lifecycle_mutex_);
    if (!monitor_) return {};
    return monitor_->sample_once();
}

ReplicaRouter::Stats ResilientDataStore::routing_stats() const {
    auto r = router();
    return r ? r->get_stats() : ReplicaRouter::Stats{0, 0};
}

void ResilientDataStore::close() {
    std::shared_ptr<ReplicaRouter> router;
    std::unique_ptr<PoolMonitor> monitor;
    std::shared_ptr<WriteReplayer> replayer;
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (!initialized_.exchange(false)) return;
        router.swap(router_);
        monitor.swap(monitor_);
        replayer.swap(replayer_);
    }

    if (monitor) monitor->stop();
    if (replayer) coordinator_.remove_listener(replayer);
    if (router) {
        if (auto replica = router->replica()) replica->drain();
        router->primary()->drain();
    }

    connected_.store(false);
    utils::log::info("[PostgreSQL] Connection pool closed");
}

} // namespace steadfast
