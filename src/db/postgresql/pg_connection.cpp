#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <format>
#include <string_view>

namespace steadfast {

namespace {

// No PGresult to read a SQLSTATE from: the session is broken
constexpr const char* kSessionLost = "08006";

struct ResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

DbResultSet failed(std::string_view message, std::string sqlstate) {
    DbResultSet rs;
    rs.error_message = utils::trim(message);
    rs.sqlstate = std::move(sqlstate);
    return rs;
}

// PQcmdTuples is "" for statements without a row count
uint64_t command_row_count(PGresult* res, uint64_t fallback) {
    const std::string_view text = PQcmdTuples(res);
    uint64_t n = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
    return (!text.empty() && ec == std::errc()) ? n : fallback;
}

DbResultSet read_tuples(PGresult* res) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;

    const int columns = PQnfields(res);
    for (int c = 0; c < columns; ++c) {
        rs.column_names.emplace_back(PQfname(res, c));
        rs.column_type_oids.push_back(static_cast<uint32_t>(PQftype(res, c)));
    }

    const int tuples = PQntuples(res);
    rs.rows.resize(static_cast<size_t>(tuples));
    for (int r = 0; r < tuples; ++r) {
        auto& row = rs.rows[static_cast<size_t>(r)];
        row.reserve(static_cast<size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            if (PQgetisnull(res, r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::in_place, PQgetvalue(res, r, c),
                                 static_cast<size_t>(PQgetlength(res, r, c)));
            }
        }
    }

    // RETURNING reports the affected count; plain SELECT the tuple count
    rs.affected_rows = command_row_count(res, static_cast<uint64_t>(tuples));
    return rs;
}

} // anonymous namespace

PgConnection::PgConnection(PGconn* conn) : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const DbParams& params) {
    if (!conn_) {
        return failed("Connection is closed", kSessionLost);
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    ResultPtr res(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0));
    if (!res) {
        return failed(PQerrorMessage(conn_), kSessionLost);
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return read_tuples(res.get());
        case PGRES_COMMAND_OK: {
            DbResultSet rs;
            rs.success = true;
            rs.affected_rows = command_row_count(res.get(), 0);
            return rs;
        }
        default:
            return error_result(res.get());
    }
}

DbResultSet PgConnection::error_result(const PGresult* res) const {
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    const char* message = PQresultErrorMessage(res);

    std::string sqlstate = state ? state : "";
    if (sqlstate.empty() && PQstatus(conn_) != CONNECTION_OK) {
        sqlstate = kSessionLost;
    }
    return failed((message && *message) ? message : PQerrorMessage(conn_), std::move(sqlstate));
}

bool PgConnection::run_utility(const std::string& sql) {
    if (!conn_) return false;
    ResultPtr res(PQexec(conn_, sql.c_str()));
    if (!res) return false;
    const auto status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    return is_connected() && run_utility(health_check_query);
}

bool PgConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    return run_utility(std::format("SET statement_timeout = {}", timeout_ms));
}

void PgConnection::close() {
    if (!conn_) return;
    PQfinish(conn_);
    conn_ = nullptr;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& conninfo) {
    PGconn* conn = PQconnectdb(conninfo.c_str());
    if (!conn) {
        utils::log::error("[PostgreSQL] Out of memory allocating a connection");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("[PostgreSQL] Connection to {}:{} failed: {}",
            PQhost(conn) ? PQhost(conn) : "?", PQport(conn) ? PQport(conn) : "?",
            utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace steadfast
