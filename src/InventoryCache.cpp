#include "InventoryCache.hpp"
#include <spdlog/spdlog.h>
#include <iterator>
#include <utility>

namespace kvmrpc {

InventoryCache::InventoryCache(const CacheConfig& config)
    : m_config(config) {
    m_stats.maxEntries = config.max_entries;
}

std::optional<nlohmann::json> InventoryCache::get(const std::string& key) {
    if (!m_config.enabled) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it == m_cache.end()) {
        m_stats.misses++;
        return std::nullopt;
    }

    // Check expiration
    auto now = std::chrono::steady_clock::now();
    if (now - it->second.inserted >= m_config.ttl) {
        // Expired - remove it
        erase(it);
        m_stats.expirations++;
        m_stats.misses++;
        spdlog::debug("Cache entry '{}' expired", key);
        return std::nullopt;
    }

    m_stats.hits++;
    return it->second.value;
}

void InventoryCache::set(const std::string& key, nlohmann::json value) {
    if (!m_config.enabled || m_config.max_entries == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_cache.find(key);
    if (existing != m_cache.end()) {
        erase(existing);
    } else if (m_cache.size() >= m_config.max_entries) {
        evictOldest();
    }

    m_insertionOrder.push_back(key);

    CacheEntry entry{
        .value = std::move(value),
        .inserted = std::chrono::steady_clock::now(),
        .order = std::prev(m_insertionOrder.end())
    };
    m_cache[key] = std::move(entry);

    m_stats.entryCount = m_cache.size();

    spdlog::debug("Cached '{}' (TTL {}s)", key, m_config.ttl.count());
}

void InventoryCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        erase(it);
        spdlog::debug("Invalidated cache entry '{}'", key);
    }
}

void InventoryCache::invalidate() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_cache.clear();
    m_insertionOrder.clear();
    m_stats.entryCount = 0;

    spdlog::debug("Cache cleared");
}

bool InventoryCache::contains(const std::string& key) const {
    if (!m_config.enabled) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it == m_cache.end()) {
        return false;
    }

    return std::chrono::steady_clock::now() - it->second.inserted < m_config.ttl;
}

size_t InventoryCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

InventoryCache::Stats InventoryCache::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void InventoryCache::evictOldest() {
    if (m_insertionOrder.empty()) {
        return;
    }

    // Front of the insertion list has the smallest timestamp; among equal
    // timestamps it is the one inserted first.
    auto it = m_cache.find(m_insertionOrder.front());
    if (it != m_cache.end()) {
        spdlog::debug("Evicting oldest cache entry '{}'", it->first);
        erase(it);
        m_stats.evictions++;
    }
}

void InventoryCache::erase(std::unordered_map<std::string, CacheEntry>::iterator it) {
    m_insertionOrder.erase(it->second.order);
    m_cache.erase(it);
    m_stats.entryCount = m_cache.size();
}

}  // namespace kvmrpc
