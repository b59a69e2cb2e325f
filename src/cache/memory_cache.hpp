#pragma once
#include "../cache.hpp"
#include <list>
#include <mutex>
#include <unordered_map>

namespace strucache {

// In-process LRU cache with per-entry TTL. Contents live as long as the
// instance. A single mutex serializes all operations.
class MemoryCache : public Cache {
public:
    // max_size = 0 disables the size bound.
    explicit MemoryCache(uint32_t max_size = 100,
                         std::optional<Ttl> default_ttl = std::nullopt);

    std::string backend_name() const override { return "memory"; }

    std::optional<nlohmann::json> get(const CacheKey& key) override;
    void set(const CacheKey& key, const nlohmann::json& value) override;
    void set(const CacheKey& key, const nlohmann::json& value,
             std::optional<Ttl> ttl) override;
    bool remove(const CacheKey& key) override;
    uint64_t clear() override;
    uint64_t cleanup_expired() override;
    CacheStats stats() const override;

private:
    struct Node {
        CacheEntry entry;
        std::list<CacheKey>::iterator order; // position in lru_
    };

    void evict_over_capacity();

    uint32_t max_size_;
    std::optional<Ttl> default_ttl_;
    std::unordered_map<CacheKey, Node> entries_;
    std::list<CacheKey> lru_; // front = least recently used
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    mutable std::mutex mutex_;
};

} // namespace strucache
