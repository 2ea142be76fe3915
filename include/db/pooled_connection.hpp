#pragma once

#include "db/idb_connection.hpp"

#include <functional>
#include <memory>

namespace steadfast {

/**
 * @brief Exclusive lease on one session of a GenericConnectionPool
 *
 * Ends on release() or destruction. Sessions that were discard()ed or
 * lost their server connection are closed by the pool, not recycled.
 */
class PooledConnection {
public:
    /// Called once when the lease ends; reusable is false for broken sessions
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    [[nodiscard]] bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Used after a connection-class error on this session
    void discard() { reusable_ = false; }

    /// Ends the lease early; later calls are no-ops
    void release();

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool reusable_ = true;
};

} // namespace steadfast
