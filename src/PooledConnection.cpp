#include "PooledConnection.hpp"
#include "ConnectionPool.hpp"
#include <utility>

namespace kvmrpc {

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<HypervisorConnection> conn)
    : m_pool(pool), m_conn(std::move(conn)) {
}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : m_pool(other.m_pool), m_conn(std::move(other.m_conn)) {
    other.m_pool = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Release current connection before taking ownership of new one
        release();
        m_pool = other.m_pool;
        m_conn = std::move(other.m_conn);
        other.m_pool = nullptr;
    }
    return *this;
}

bool PooledConnection::isValid() const {
    return m_conn != nullptr;
}

void PooledConnection::release() noexcept {
    if (m_pool && m_conn) {
        m_pool->releaseConnection(std::move(m_conn));
    }
    m_conn.reset();
}

}  // namespace kvmrpc
