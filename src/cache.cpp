#include "cache.hpp"
#include "config.hpp"
#include "util.hpp"
#include "cache/file_cache.hpp"
#include "cache/memory_cache.hpp"
#include "cache/sqlite_cache.hpp"
#include <stdexcept>

namespace strucache {

bool is_expired(double created_at, const std::optional<Ttl>& ttl, double now) {
    if (!ttl) return false;
    return (now - created_at) > ttl->count();
}

bool CacheEntry::expired(double now) const {
    return is_expired(created_at, ttl, now);
}

double CacheStats::hit_rate() const {
    uint64_t total = hits + misses;
    if (total == 0) return 0.0;
    return static_cast<double>(hits) / static_cast<double>(total);
}

nlohmann::json CacheStats::to_json() const {
    nlohmann::json j = {
        {"backend", backend},
        {"size", size},
        {"max_size", max_size},
        {"hits", hits},
        {"misses", misses},
        {"evictions", evictions},
        {"hit_rate", hit_rate()}
    };
    if (!location.empty()) {
        j["location"] = location;
    }
    return j;
}

std::string backend_to_string(CacheBackend backend) {
    switch (backend) {
        case CacheBackend::Memory: return "memory";
        case CacheBackend::File:   return "file";
        case CacheBackend::Sqlite: return "sqlite";
    }
    return "memory";
}

std::optional<CacheBackend> backend_from_string(const std::string& s) {
    std::string name = to_lower(trim(s));
    if (name == "memory") return CacheBackend::Memory;
    if (name == "file")   return CacheBackend::File;
    if (name == "sqlite") return CacheBackend::Sqlite;
    return std::nullopt;
}

std::unique_ptr<Cache> create_cache(const CacheConfig& config) {
    auto backend = backend_from_string(config.backend);
    if (!backend) {
        throw std::invalid_argument("Unknown cache backend: " + config.backend);
    }

    std::optional<Ttl> ttl;
    if (config.ttl_seconds) ttl = Ttl(*config.ttl_seconds);

    switch (*backend) {
        case CacheBackend::Memory:
            return std::make_unique<MemoryCache>(config.max_size, ttl);
        case CacheBackend::File: {
            std::string dir = config.path.empty()
                ? expand_home("~/.strucache/cache")
                : expand_home(config.path);
            return std::make_unique<FileCache>(dir, ttl);
        }
        case CacheBackend::Sqlite: {
            std::string path = config.path.empty()
                ? expand_home("~/.strucache/cache.db")
                : expand_home(config.path);
            return std::make_unique<SqliteCache>(path, config.max_size, ttl);
        }
    }
    throw std::invalid_argument("Unknown cache backend: " + config.backend);
}

} // namespace strucache
