#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace steadfast::testing {

struct ExecutedStatement {
    std::string conninfo;
    std::string sql;
    DbParams params;
};

/**
 * @brief Scripted backend shared by every MockConnection a factory creates
 *
 * Records each statement with the connection string it ran on. A responder
 * decides the outcome; without one every statement succeeds with no rows.
 */
class MockDatabase {
public:
    using Responder = std::function<DbResultSet(const std::string& conninfo,
                                                const std::string& sql,
                                                const DbParams& params)>;

    void set_responder(Responder responder) {
        std::lock_guard lock(mutex_);
        responder_ = std::move(responder);
    }

    DbResultSet run(const std::string& conninfo, const std::string& sql, const DbParams& params) {
        Responder responder;
        {
            std::lock_guard lock(mutex_);
            log_.push_back({conninfo, sql, params});
            responder = responder_;
        }
        if (responder) return responder(conninfo, sql, params);
        return ok();
    }

    [[nodiscard]] std::vector<ExecutedStatement> statements() const {
        std::lock_guard lock(mutex_);
        return log_;
    }

    [[nodiscard]] std::vector<std::string> sql_log() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& s : log_) out.push_back(s.sql);
        return out;
    }

    [[nodiscard]] size_t count(const std::string& sql) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& s : log_) {
            if (s.sql == sql) ++n;
        }
        return n;
    }

    void clear_log() {
        std::lock_guard lock(mutex_);
        log_.clear();
    }

    // Connections to a host in this set fail to open
    void refuse_host(const std::string& host) {
        std::lock_guard lock(mutex_);
        refused_hosts_.insert(host);
    }

    void accept_all() {
        std::lock_guard lock(mutex_);
        refused_hosts_.clear();
    }

    [[nodiscard]] bool accepts(const std::string& conninfo) const {
        std::lock_guard lock(mutex_);
        for (const auto& host : refused_hosts_) {
            if (conninfo.find("host='" + host + "'") != std::string::npos) return false;
        }
        return true;
    }

    static DbResultSet ok() {
        return {.success = true};
    }

    static DbResultSet affected(uint64_t n) {
        return {.success = true, .affected_rows = n};
    }

    static DbResultSet rows(std::vector<std::string> columns, std::vector<uint32_t> oids,
                            std::vector<std::vector<std::optional<std::string>>> data) {
        DbResultSet rs;
        rs.success = true;
        rs.has_rows = true;
        rs.column_names = std::move(columns);
        rs.column_type_oids = std::move(oids);
        rs.rows = std::move(data);
        rs.affected_rows = rs.rows.size();
        return rs;
    }

    static DbResultSet error(std::string message, std::string sqlstate) {
        return {.success = false, .error_message = std::move(message), .sqlstate = std::move(sqlstate)};
    }

    std::atomic<int> connections_opened{0};
    std::atomic<int> connections_closed{0};

private:
    mutable std::mutex mutex_;
    Responder responder_;
    std::vector<ExecutedStatement> log_;
    std::set<std::string> refused_hosts_;
};

class MockConnection : public IDbConnection {
public:
    MockConnection(std::shared_ptr<MockDatabase> db, std::string conninfo)
        : db_(std::move(db)), conninfo_(std::move(conninfo)) {}

    using IDbConnection::execute;

    DbResultSet execute(const std::string& sql, const DbParams& params) override {
        return db_->run(conninfo_, sql, params);
    }

    bool is_healthy(const std::string& query) override {
        return connected_ && execute(query).success;
    }

    bool is_connected() const override { return connected_; }
    bool set_query_timeout(uint32_t) override { return true; }

    void close() override {
        if (connected_) {
            connected_ = false;
            db_->connections_closed.fetch_add(1);
        }
    }

private:
    std::shared_ptr<MockDatabase> db_;
    std::string conninfo_;
    bool connected_ = true;
};

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<MockDatabase> db) : db_(std::move(db)) {}

    std::unique_ptr<IDbConnection> create(const std::string& conninfo) override {
        if (!db_->accepts(conninfo)) return nullptr;
        db_->connections_opened.fetch_add(1);
        return std::make_unique<MockConnection>(db_, conninfo);
    }

private:
    std::shared_ptr<MockDatabase> db_;
};

} // namespace steadfast::testing
