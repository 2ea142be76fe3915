#include "db/pooled_connection.hpp"

#include <utility>

namespace steadfast {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)),
      return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::exchange(other.conn_, nullptr)),
      return_fn_(std::exchange(other.return_fn_, nullptr)),
      reusable_(other.reusable_) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (&other == this) return *this;

    release();
    conn_ = std::exchange(other.conn_, nullptr);
    return_fn_ = std::exchange(other.return_fn_, nullptr);
    reusable_ = other.reusable_;
    return *this;
}

void PooledConnection::release() {
    if (!conn_) return;

    auto conn = std::move(conn_);
    const bool reusable = reusable_ && conn->is_connected();

    if (!return_fn_) {
        conn->close();
        return;
    }
    return_fn_(std::move(conn), reusable);
}

} // namespace steadfast
