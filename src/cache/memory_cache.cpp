#include "memory_cache.hpp"
#include "../util.hpp"

namespace strucache {

MemoryCache::MemoryCache(uint32_t max_size, std::optional<Ttl> default_ttl)
    : max_size_(max_size), default_ttl_(default_ttl) {}

std::optional<nlohmann::json> MemoryCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (it->second.entry.expired(epoch_seconds_precise())) {
        lru_.erase(it->second.order);
        entries_.erase(it);
        misses_++;
        return std::nullopt;
    }

    lru_.splice(lru_.end(), lru_, it->second.order);
    hits_++;
    return it->second.entry.value;
}

void MemoryCache::set(const CacheKey& key, const nlohmann::json& value) {
    set(key, value, default_ttl_);
}

void MemoryCache::set(const CacheKey& key, const nlohmann::json& value,
                      std::optional<Ttl> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry{value, epoch_seconds_precise(), ttl};

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.entry = std::move(entry);
        lru_.splice(lru_.end(), lru_, it->second.order);
    } else {
        auto pos = lru_.insert(lru_.end(), key);
        entries_.emplace(key, Node{std::move(entry), pos});
    }

    evict_over_capacity();
}

void MemoryCache::evict_over_capacity() {
    // Must be called with mutex_ already held.
    if (max_size_ == 0) return;
    while (entries_.size() > max_size_ && !lru_.empty()) {
        entries_.erase(lru_.front());
        lru_.pop_front();
        evictions_++;
    }
}

bool MemoryCache::remove(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    lru_.erase(it->second.order);
    entries_.erase(it);
    return true;
}

uint64_t MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t removed = entries_.size();
    entries_.clear();
    lru_.clear();
    return removed;
}

uint64_t MemoryCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    double now = epoch_seconds_precise();
    uint64_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.entry.expired(now)) {
            lru_.erase(it->second.order);
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

CacheStats MemoryCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.backend = backend_name();
    s.size = entries_.size();
    s.max_size = max_size_;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    return s;
}

} // namespace strucache
