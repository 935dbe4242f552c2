#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Self-healing pool of hypervisor connections.
 *
 * The pool keeps up to max_connections idle handles to the hypervisor daemon
 * and hands them out as scoped leases. Capacity is a soft target: a caller
 * that cannot get an idle handle within the checkout timeout gets a freshly
 * opened one instead of an error.
 */

#include "Config.hpp"
#include "HypervisorConnection.hpp"
#include "PooledConnection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace kvmrpc {

/**
 * @class ConnectionPool
 * @brief Thread-safe pool of reusable hypervisor connections.
 *
 * Key features:
 * - Best-effort pre-opening of max_connections handles at construction
 * - Checkout waits up to checkout_timeout, then falls back to a new handle
 * - Liveness probe on every release; dead handles are closed and replaced
 * - Soft shutdown: closeAll() closes idle handles, leased ones on release
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Handle open and liveness probes run outside the pool lock
 *
 * @see PooledConnection for using acquired connections
 */
class ConnectionPool {
public:
    /**
     * @brief Create a pool and pre-open its connections.
     * @param factory Opens new hypervisor connections.
     * @param config URI, max_connections and checkout_timeout.
     *
     * A connection that fails to open is logged and skipped; the pool may
     * start with fewer than max_connections handles, or none.
     */
    ConnectionPool(std::shared_ptr<ConnectionFactory> factory, const ConnectionConfig& config);

    /**
     * @brief Destructor - closes all idle connections.
     *
     * Leases must not outlive the pool.
     */
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Check out a connection, waiting up to the checkout timeout.
     * @return Scoped lease on the connection.
     * @throws ConnectionError if the pool is closed or the fallback open fails.
     *
     * If no idle connection shows up before the timeout, a new connection is
     * opened and handed out, so active connections may briefly exceed
     * max_connections.
     */
    PooledConnection acquire();

    /**
     * @brief Close all idle connections and stop handing out new ones.
     *
     * Close failures are logged, not propagated. Connections currently leased
     * are closed when their lease is released.
     */
    void closeAll();

    /**
     * @brief Check if the pool can provide a working connection.
     * @return true if an acquired connection answers its liveness probe.
     */
    bool healthCheck();

    // Number of idle connections ready to be acquired
    size_t availableCount() const;

    // Connections opened and not yet closed (idle + leased)
    size_t activeCount() const;

    // Number of callers blocked in acquire()
    size_t waitingCount() const;

    size_t maxConnections() const { return m_config.max_connections; }
    const std::string& uri() const { return m_config.uri; }
    bool isClosed() const { return m_closed.load(); }

private:
    friend class PooledConnection;  // For releaseConnection access

    /**
     * @brief Open a new connection and count it as active.
     * @throws ConnectionError on failure.
     */
    std::unique_ptr<HypervisorConnection> openConnection();

    /**
     * @brief Return a leased connection to the pool.
     *
     * Live connections are queued again (or closed if the queue is full or
     * the pool is closed). Dead connections are closed and replaced
     * best-effort. Never throws.
     */
    void releaseConnection(std::unique_ptr<HypervisorConnection> conn) noexcept;

    /**
     * @brief Close a connection and stop counting it. Never throws.
     */
    void destroyConnection(std::unique_ptr<HypervisorConnection> conn) noexcept;

    /**
     * @brief Run the liveness probe; a throwing probe counts as dead.
     */
    bool validateConnection(HypervisorConnection& conn) noexcept;

    std::shared_ptr<ConnectionFactory> m_factory;  ///< Opens new handles
    ConnectionConfig m_config;                     ///< URI, capacity, timeout

    std::queue<std::unique_ptr<HypervisorConnection>> m_available;  ///< Idle connections
    std::atomic<size_t> m_activeCount{0};   ///< Connections opened and not closed
    std::atomic<size_t> m_waitingCount{0};  ///< Callers blocked on acquire()

    mutable std::mutex m_mutex;           ///< Protects m_available
    std::condition_variable m_cv;         ///< Signaled when a connection is queued
    std::atomic<bool> m_closed{false};    ///< True after closeAll()
};

}  // namespace kvmrpc
