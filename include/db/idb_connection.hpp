#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace steadfast {

/// Text-format value bound to $n; nullopt binds SQL NULL
using DbParam = std::optional<std::string>;
using DbParams = std::vector<DbParam>;

/**
 * @brief Everything one statement produced, copied out of the driver
 *
 * On failure only error_message and sqlstate are meaningful. Row values
 * stay in text form; PgTypeMap decodes them using column_type_oids.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;                       // e.g. "40001"; empty when unknown

    bool has_rows = false;                      // SELECT or ... RETURNING
    std::vector<std::string> column_names;
    std::vector<uint32_t> column_type_oids;     // Same order as column_names
    std::vector<std::vector<std::optional<std::string>>> rows;

    uint64_t affected_rows = 0;                 // Rows touched, or rows returned
};

/**
 * @brief A single database session
 *
 * Not thread-safe. A session is only ever used by the thread holding its
 * PooledConnection lease.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Run sql with params bound to $1..$n
     *
     * Never throws for server-side errors; they come back with
     * success == false.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, const DbParams& params) = 0;

    [[nodiscard]] DbResultSet execute(const std::string& sql) { return execute(sql, {}); }

    /// Runs query and reports whether the session answered
    [[nodiscard]] virtual bool is_healthy(const std::string& query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /// Server-side statement timeout in milliseconds (0 disables it)
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace steadfast
