#include "sqlite_cache.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace strucache {

static constexpr int kBusyTimeoutMs = 5000;

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    ~Transaction() {
        if (active_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool active() const { return active_; }

    bool commit() {
        if (!active_) return false;
        bool ok = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK;
        active_ = !ok;
        return ok;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

static void log_sqlite_error(sqlite3* db, const char* what) {
    std::cerr << "[sqlite_cache] " << what << ": " << sqlite3_errmsg(db) << "\n";
}

SqliteCache::SqliteCache(const std::string& path, uint32_t max_size,
                         std::optional<Ttl> default_ttl)
    : path_(path), max_size_(max_size), default_ttl_(default_ttl) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw CacheError("SqliteCache: cannot create directory " +
                             parent.string() + ": " + ec.message(), "open");
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw CacheError("SqliteCache: failed to open database: " + err, "open");
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const CacheError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCache::~SqliteCache() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteCache::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS cache ("
        "  key         TEXT PRIMARY KEY,"
        "  value       TEXT NOT NULL,"
        "  created_at  REAL NOT NULL,"
        "  ttl         REAL,"
        "  last_access REAL NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw CacheError("SqliteCache: failed to create schema: " + msg, "open");
    }

    const char* create_index =
        "CREATE INDEX IF NOT EXISTS cache_last_access ON cache(last_access);";
    if (sqlite3_exec(db_, create_index, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw CacheError("SqliteCache: failed to create index: " + msg, "open");
    }
}

bool SqliteCache::delete_row(const std::string& key,
                             std::optional<double> created_at) {
    // Must be called with mutex_ already held. With created_at set, a row
    // rewritten by another connection since it was read is left alone.
    StmtGuard g;
    const char* sql = created_at
        ? "DELETE FROM cache WHERE key = ? AND created_at = ?;"
        : "DELETE FROM cache WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "delete prepare failed");
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    if (created_at) sqlite3_bind_double(g.stmt, 2, *created_at);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "delete failed");
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

uint64_t SqliteCache::row_count() const {
    // Must be called with mutex_ already held.
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "count prepare failed");
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
}

std::optional<nlohmann::json> SqliteCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string k = key.to_string();
    double now = epoch_seconds_precise();

    std::string value_text;
    double created_at = 0.0;
    std::optional<Ttl> ttl;
    {
        StmtGuard g;
        const char* sql = "SELECT value, created_at, ttl FROM cache WHERE key = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            log_sqlite_error(db_, "get prepare failed");
            misses_++;
            return std::nullopt;
        }
        sqlite3_bind_text(g.stmt, 1, k.c_str(), -1, SQLITE_STATIC);

        int rc = sqlite3_step(g.stmt);
        if (rc != SQLITE_ROW) {
            if (rc != SQLITE_DONE) log_sqlite_error(db_, "get failed");
            misses_++;
            return std::nullopt;
        }

        if (auto* v = sqlite3_column_text(g.stmt, 0)) {
            value_text = reinterpret_cast<const char*>(v);
        }
        created_at = sqlite3_column_double(g.stmt, 1);
        if (sqlite3_column_type(g.stmt, 2) != SQLITE_NULL) {
            ttl = Ttl(sqlite3_column_double(g.stmt, 2));
        }
    }

    if (is_expired(created_at, ttl, now)) {
        delete_row(k, created_at);
        misses_++;
        return std::nullopt;
    }

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(value_text);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[sqlite_cache] Removing undecodable row: " << e.what() << "\n";
        delete_row(k, created_at);
        misses_++;
        return std::nullopt;
    }

    {
        StmtGuard g;
        const char* sql = "UPDATE cache SET last_access = ? WHERE key = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_double(g.stmt, 1, now);
            sqlite3_bind_text(g.stmt, 2, k.c_str(), -1, SQLITE_STATIC);
            if (sqlite3_step(g.stmt) != SQLITE_DONE) {
                log_sqlite_error(db_, "touch failed");
            }
        }
    }

    hits_++;
    return value;
}

void SqliteCache::set(const CacheKey& key, const nlohmann::json& value) {
    set(key, value, default_ttl_);
}

void SqliteCache::set(const CacheKey& key, const nlohmann::json& value,
                      std::optional<Ttl> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string k = key.to_string();
    std::string v;
    try {
        v = value.dump();
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "[sqlite_cache] Cannot serialize value: " << e.what() << "\n";
        return;
    }
    double now = epoch_seconds_precise();

    Transaction tx(db_);
    if (!tx.active()) {
        log_sqlite_error(db_, "set could not begin transaction");
        return;
    }

    {
        StmtGuard g;
        const char* sql =
            "INSERT OR REPLACE INTO cache (key, value, created_at, ttl, last_access)"
            " VALUES (?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            log_sqlite_error(db_, "set prepare failed");
            return;
        }
        sqlite3_bind_text(g.stmt, 1, k.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, v.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(g.stmt, 3, now);
        if (ttl) {
            sqlite3_bind_double(g.stmt, 4, ttl->count());
        } else {
            sqlite3_bind_null(g.stmt, 4);
        }
        sqlite3_bind_double(g.stmt, 5, now);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            log_sqlite_error(db_, "set failed");
            return;
        }
    }

    uint64_t evicted = 0;
    if (max_size_ > 0) {
        uint64_t count = row_count();
        if (count > max_size_) {
            StmtGuard g;
            const char* sql =
                "DELETE FROM cache WHERE key IN ("
                "  SELECT key FROM cache ORDER BY last_access ASC, rowid ASC LIMIT ?"
                ");";
            if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
                log_sqlite_error(db_, "evict prepare failed");
                return;
            }
            sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(count - max_size_));
            if (sqlite3_step(g.stmt) != SQLITE_DONE) {
                log_sqlite_error(db_, "evict failed");
                return;
            }
            evicted = static_cast<uint64_t>(sqlite3_changes(db_));
        }
    }

    if (!tx.commit()) {
        log_sqlite_error(db_, "set commit failed");
        return;
    }
    evictions_ += evicted;
}

bool SqliteCache::remove(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_row(key.to_string());
}

uint64_t SqliteCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sqlite3_exec(db_, "DELETE FROM cache;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "clear failed");
        return 0;
    }
    return static_cast<uint64_t>(sqlite3_changes(db_));
}

uint64_t SqliteCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "DELETE FROM cache WHERE ttl IS NOT NULL AND (? - created_at) > ttl;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_error(db_, "cleanup prepare failed");
        return 0;
    }
    sqlite3_bind_double(g.stmt, 1, epoch_seconds_precise());
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        log_sqlite_error(db_, "cleanup failed");
        return 0;
    }
    return static_cast<uint64_t>(sqlite3_changes(db_));
}

CacheStats SqliteCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.backend = backend_name();
    s.location = path_;
    s.size = row_count();
    s.max_size = max_size_;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    return s;
}

} // namespace strucache
