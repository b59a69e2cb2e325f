#pragma once
#include "../cache.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace strucache {

// Durable cache in a single SQLite database (table "cache"). Several
// instances, in one or more processes, may share a database file; SQLite's
// WAL journal and transactions serialize their writes.
class SqliteCache : public Cache {
public:
    // Opens (creating if needed) the database and its schema.
    // Throws CacheError if either step fails.
    explicit SqliteCache(const std::string& path, uint32_t max_size = 1000,
                         std::optional<Ttl> default_ttl = std::nullopt);
    ~SqliteCache() override;

    // Non-copyable
    SqliteCache(const SqliteCache&) = delete;
    SqliteCache& operator=(const SqliteCache&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<nlohmann::json> get(const CacheKey& key) override;
    void set(const CacheKey& key, const nlohmann::json& value) override;
    void set(const CacheKey& key, const nlohmann::json& value,
             std::optional<Ttl> ttl) override;
    bool remove(const CacheKey& key) override;
    uint64_t clear() override;
    uint64_t cleanup_expired() override;
    CacheStats stats() const override;

    const std::string& path() const { return path_; }

private:
    void init_schema();
    bool delete_row(const std::string& key,
                    std::optional<double> created_at = std::nullopt);
    uint64_t row_count() const;

    sqlite3* db_ = nullptr;
    std::string path_;
    uint32_t max_size_;
    std::optional<Ttl> default_ttl_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    mutable std::mutex mutex_;
};

} // namespace strucache
