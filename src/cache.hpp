#pragma once
#include "cache_key.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace strucache {

struct CacheConfig; // forward declaration

// Time-to-live in (fractional) seconds. std::nullopt means "never expires".
using Ttl = std::chrono::duration<double>;

struct CacheEntry {
    nlohmann::json value;
    double created_at = 0.0;   // epoch seconds
    std::optional<Ttl> ttl;

    bool expired(double now) const;
};

// True when ttl is set and more than ttl seconds have passed since created_at.
bool is_expired(double created_at, const std::optional<Ttl>& ttl, double now);

struct CacheStats {
    std::string backend;
    std::string location;   // directory or database path, empty for memory
    uint64_t size = 0;
    uint64_t max_size = 0;  // 0 = unbounded
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;

    // hits / (hits + misses), 0 before the first access
    double hit_rate() const;

    nlohmann::json to_json() const;
};

// Abstract cache backend interface. Every operation is synchronous and
// safe to call from several threads. Failures after construction are
// reported as misses or no-ops, never as exceptions.
class Cache {
public:
    virtual ~Cache() = default;

    virtual std::string backend_name() const = 0;

    // Cached value for key, or nullopt on miss (absent, expired or unreadable).
    virtual std::optional<nlohmann::json> get(const CacheKey& key) = 0;

    // Store value under key with the backend's default TTL.
    virtual void set(const CacheKey& key, const nlohmann::json& value) = 0;

    // Store value under key with an explicit TTL (nullopt = never expires).
    virtual void set(const CacheKey& key, const nlohmann::json& value,
                     std::optional<Ttl> ttl) = 0;

    // Delete one entry. Returns true if it was present.
    virtual bool remove(const CacheKey& key) = 0;

    // Delete every entry. Returns the number removed.
    virtual uint64_t clear() = 0;

    // Delete expired entries. Returns the number removed.
    virtual uint64_t cleanup_expired() = 0;

    virtual CacheStats stats() const = 0;
};

enum class CacheBackend { Memory, File, Sqlite };

std::string backend_to_string(CacheBackend backend);

// Case-insensitive. Returns nullopt for unknown names.
std::optional<CacheBackend> backend_from_string(const std::string& s);

// Build the backend named by config.backend.
// Throws std::invalid_argument for unknown names and CacheError when a
// durable backend cannot open its storage.
std::unique_ptr<Cache> create_cache(const CacheConfig& config);

} // namespace strucache
