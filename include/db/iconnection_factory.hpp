#pragma once

#include "db/idb_connection.hpp"

#include <memory>
#include <string>

namespace steadfast {

/**
 * @brief Opens sessions for a connection pool
 *
 * PgConnectionFactory talks to a real server; tests plug in a scripted one.
 * A refused or unreachable endpoint yields nullptr, never an exception.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /// @param conninfo libpq keyword/value string (EndpointConfig::to_connection_string)
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(const std::string& conninfo) = 0;
};

} // namespace steadfast
