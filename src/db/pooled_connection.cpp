#include "db/pooled_connection.hpp"

namespace sqlguard {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    give_back();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)), return_fn_(std::move(other.return_fn_)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        give_back();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
    }
    return *this;
}

void PooledConnection::give_back() {
    if (conn_ && return_fn_) {
        return_fn_(std::move(conn_));
    }
    conn_.reset();
}

} // namespace sqlguard
