#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <libpq-fe.h>

#include <memory>
#include <string>

namespace steadfast {

/**
 * @brief One libpq session (owns its PGconn)
 *
 * Every statement is sent with PQexecParams in text format; values only
 * ever travel as parameters. Errors are reported in the DbResultSet with
 * the server's SQLSTATE, or 08006 when the session itself is gone.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    using IDbConnection::execute;
    DbResultSet execute(const std::string& sql, const DbParams& params) override;

    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;

    /// SET statement_timeout for the rest of the session
    bool set_query_timeout(uint32_t timeout_ms) override;

    void close() override;

private:
    // Runs a parameterless utility statement; true on any OK status
    bool run_utility(const std::string& sql);

    DbResultSet error_result(const PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief Opens PgConnections with PQconnectdb; nullptr when the server refuses
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& conninfo) override;
};

} // namespace steadfast
