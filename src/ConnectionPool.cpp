#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace kvmrpc {

ConnectionPool::ConnectionPool(std::shared_ptr<ConnectionFactory> factory, const ConnectionConfig& config)
    : m_factory(std::move(factory)), m_config(config) {

    for (size_t i = 0; i < m_config.max_connections; ++i) {
        try {
            auto conn = openConnection();
            std::lock_guard<std::mutex> lock(m_mutex);
            m_available.push(std::move(conn));
        } catch (const ConnectionError& e) {
            // Partial initialization is allowed
            spdlog::error("Failed to initialize hypervisor connection: {}", e.what());
        }
    }

    spdlog::info("Connection pool for {} initialized with {}/{} connections",
                 m_config.uri, m_activeCount.load(), m_config.max_connections);
}

ConnectionPool::~ConnectionPool() {
    closeAll();
}

std::unique_ptr<HypervisorConnection> ConnectionPool::openConnection() {
    auto conn = m_factory->open(m_config.uri);
    if (!conn) {
        throw ConnectionError("Failed to connect to hypervisor at " + m_config.uri);
    }

    m_activeCount++;
    spdlog::debug("Opened hypervisor connection (active: {})", m_activeCount.load());

    return conn;
}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (m_closed) {
        throw ConnectionError("Connection pool is closed");
    }

    m_waitingCount++;
    bool ready = m_cv.wait_for(lock, m_config.checkout_timeout, [this]() {
        return !m_available.empty() || m_closed;
    });
    m_waitingCount--;

    if (m_closed) {
        throw ConnectionError("Connection pool is closed");
    }

    if (ready) {
        auto conn = std::move(m_available.front());
        m_available.pop();
        spdlog::debug("Got connection from pool (idle: {})", m_available.size());
        return PooledConnection(this, std::move(conn));
    }

    lock.unlock();

    // Capacity is a soft limit: callers are never rejected
    spdlog::warn("Connection pool timeout after {}ms, opening new connection",
                 m_config.checkout_timeout.count());
    return PooledConnection(this, openConnection());
}

void ConnectionPool::releaseConnection(std::unique_ptr<HypervisorConnection> conn) noexcept {
    if (!conn) return;

    if (validateConnection(*conn)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_closed && m_available.size() < m_config.max_connections) {
            m_available.push(std::move(conn));
            lock.unlock();
            m_cv.notify_one();
            spdlog::debug("Returned connection to pool");
            return;
        }
        lock.unlock();

        // Pool closed, or this was a timeout extra and the pool is full
        destroyConnection(std::move(conn));
        return;
    }

    destroyConnection(std::move(conn));
    spdlog::warn("Closed dead connection, active: {}", m_activeCount.load());

    {
        // A dead timeout extra is not replaced once the idle queue is full
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_available.size() >= m_config.max_connections) {
            return;
        }
    }

    try {
        auto replacement = openConnection();
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_closed || m_available.size() >= m_config.max_connections) {
            lock.unlock();
            destroyConnection(std::move(replacement));
            return;
        }
        m_available.push(std::move(replacement));
        lock.unlock();
        m_cv.notify_one();
        spdlog::debug("Created replacement connection, active: {}", m_activeCount.load());
    } catch (const std::exception& e) {
        // The caller's operation already completed; let the pool shrink
        spdlog::error("Failed to create replacement connection: {}", e.what());
    }
}

void ConnectionPool::destroyConnection(std::unique_ptr<HypervisorConnection> conn) noexcept {
    if (!conn) return;

    try {
        conn->close();
    } catch (const std::exception& e) {
        spdlog::error("Error closing connection: {}", e.what());
    }
    conn.reset();

    m_activeCount--;
    spdlog::debug("Closed hypervisor connection (active: {})", m_activeCount.load());
}

bool ConnectionPool::validateConnection(HypervisorConnection& conn) noexcept {
    try {
        if (conn.ping()) {
            return true;
        }
        spdlog::debug("Connection liveness probe failed");
    } catch (const std::exception& e) {
        spdlog::debug("Connection liveness probe failed: {}", e.what());
    }
    return false;
}

void ConnectionPool::closeAll() {
    std::queue<std::unique_ptr<HypervisorConnection>> drained;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        std::swap(drained, m_available);
    }
    m_cv.notify_all();

    size_t closed = drained.size();
    while (!drained.empty()) {
        destroyConnection(std::move(drained.front()));
        drained.pop();
    }

    if (closed > 0) {
        spdlog::info("Connection pool closed {} connections (active: {})",
                     closed, m_activeCount.load());
    }
}

bool ConnectionPool::healthCheck() {
    try {
        auto conn = acquire();
        return conn->ping();
    } catch (const std::exception& e) {
        spdlog::warn("Connection pool health check failed: {}", e.what());
        return false;
    }
}

size_t ConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t ConnectionPool::activeCount() const {
    return m_activeCount.load();
}

size_t ConnectionPool::waitingCount() const {
    return m_waitingCount.load();
}

}  // namespace kvmrpc
