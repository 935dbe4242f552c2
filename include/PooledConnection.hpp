#pragma once

/**
 * @file PooledConnection.hpp
 * @brief RAII lease on a hypervisor connection checked out from the pool.
 *
 * The lease returns its connection to the pool when it goes out of scope,
 * whether the wrapped operation returned normally or threw.
 */

#include "HypervisorConnection.hpp"
#include <memory>

namespace kvmrpc {

class ConnectionPool;

/**
 * @class PooledConnection
 * @brief Exclusive, scoped ownership of one pooled HypervisorConnection.
 *
 * Thread Safety:
 * - A lease is NOT thread-safe; it belongs to the caller that acquired it.
 * - Acquiring and releasing leases concurrently is safe.
 *
 * Usage:
 * @code
 *   {
 *       auto conn = pool.acquire();
 *       auto domains = conn->listAllDomains();
 *   }  // liveness-checked and returned to the pool here
 * @endcode
 */
class PooledConnection {
public:
    /**
     * @brief Construct a lease.
     * @param pool Owning connection pool (receives the connection on release).
     * @param conn The checked-out connection.
     *
     * @note Only ConnectionPool creates leases.
     */
    PooledConnection(ConnectionPool* pool, std::unique_ptr<HypervisorConnection> conn);

    /**
     * @brief Destructor - releases the connection back to the pool.
     */
    ~PooledConnection();

    // Non-copyable to prevent double-release
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    // Movable for transfer of ownership
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    HypervisorConnection* get() const { return m_conn.get(); }
    HypervisorConnection* operator->() const { return m_conn.get(); }
    HypervisorConnection& operator*() const { return *m_conn; }

    /**
     * @brief Check if the lease still holds a connection.
     * @return false after release() or after being moved from.
     */
    bool isValid() const;

    /**
     * @brief Return the connection to the pool before scope exit.
     *
     * Runs the pool's liveness check and return-or-replace logic.
     * Safe to call more than once.
     */
    void release() noexcept;

private:
    ConnectionPool* m_pool;                        ///< Owning connection pool
    std::unique_ptr<HypervisorConnection> m_conn;  ///< Leased connection
};

}  // namespace kvmrpc
