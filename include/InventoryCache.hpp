#pragma once

#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <optional>
#include <unordered_map>
#include <list>
#include <mutex>
#include <chrono>

namespace kvmrpc {

// TTL-bounded store for VM inventory snapshots and per-VM records.
// Eviction is by insertion time: reading an entry never changes its priority.
class InventoryCache {
public:
    // Key of the full VM inventory snapshot
    static constexpr const char* kAllVmsKey = "_all_vms_";

    struct CacheEntry {
        nlohmann::json value;
        std::chrono::steady_clock::time_point inserted;
        std::list<std::string>::iterator order;
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t evictions = 0;
        size_t expirations = 0;
        size_t entryCount = 0;
        size_t maxEntries = 0;
    };

    explicit InventoryCache(const CacheConfig& config);
    ~InventoryCache() = default;

    // Non-copyable
    InventoryCache(const InventoryCache&) = delete;
    InventoryCache& operator=(const InventoryCache&) = delete;

    // Cached value, or nullopt if absent or expired (expired entries are purged)
    std::optional<nlohmann::json> get(const std::string& key);

    // Store value stamped with the current time
    void set(const std::string& key, nlohmann::json value);

    // Remove one entry; no-op if absent
    void invalidate(const std::string& key);

    // Remove every entry
    void invalidate();

    // Check if key exists and is not expired, without touching statistics
    bool contains(const std::string& key) const;

    // Number of stored entries, expired ones included until accessed
    size_t size() const;

    Stats getStats() const;

private:
    void evictOldest();
    void erase(std::unordered_map<std::string, CacheEntry>::iterator it);

    CacheConfig m_config;

    std::unordered_map<std::string, CacheEntry> m_cache;
    std::list<std::string> m_insertionOrder;  // oldest first

    mutable std::mutex m_mutex;

    Stats m_stats;
};

}  // namespace kvmrpc
