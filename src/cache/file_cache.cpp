#include "file_cache.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace strucache {

static constexpr const char* kEntryExtension = ".json";
static constexpr size_t kDigestChars = 64;

// <64 hex chars>.json; temp files and foreign files do not match.
static bool is_entry_file(const fs::path& p) {
    std::string name = p.filename().string();
    if (name.size() != kDigestChars + 5) return false;
    if (p.extension().string() != kEntryExtension) return false;
    return std::all_of(name.begin(), name.begin() + kDigestChars,
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

static nlohmann::json record_to_json(const CacheKey& key, const CacheEntry& entry) {
    nlohmann::json j = {
        {"key", key.to_string()},
        {"value", entry.value},
        {"created_at", entry.created_at},
        {"ttl", nullptr}
    };
    if (entry.ttl) j["ttl"] = entry.ttl->count();
    return j;
}

// Parse an entry file. nullopt means missing, unreadable or malformed.
static std::optional<CacheEntry> read_record(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object() || !j.contains("value")) return std::nullopt;
        if (!j.contains("created_at") || !j["created_at"].is_number()) return std::nullopt;

        CacheEntry entry;
        entry.value = j["value"];
        entry.created_at = j["created_at"].get<double>();
        if (j.contains("ttl") && !j["ttl"].is_null()) {
            if (!j["ttl"].is_number()) return std::nullopt;
            entry.ttl = Ttl(j["ttl"].get<double>());
        }
        return entry;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

FileCache::FileCache(const std::string& directory, std::optional<Ttl> default_ttl)
    : dir_(directory), default_ttl_(default_ttl) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_, ec)) {
        throw CacheError("FileCache: cannot create cache directory " +
                         dir_.string() + (ec ? ": " + ec.message() : ""), "open");
    }
}

fs::path FileCache::path_for(const CacheKey& key) const {
    return dir_ / (sha256_hex(key.to_string()) + kEntryExtension);
}

std::vector<fs::path> FileCache::entry_files() const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        std::cerr << "[file_cache] Cannot list " << dir_ << ": " << ec.message() << "\n";
        return files;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && is_entry_file(it->path())) {
            files.push_back(it->path());
        }
    }
    return files;
}

bool FileCache::remove_if_stale(const fs::path& path, double now) {
    // Must be called with mutex_ already held. Another writer may have
    // replaced the file since it was read; a fresh record stays.
    auto current = read_record(path);
    if (current && !current->expired(now)) return false;
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<nlohmann::json> FileCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path path = path_for(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        misses_++;
        return std::nullopt;
    }

    double now = epoch_seconds_precise();
    auto entry = read_record(path);
    if (!entry) {
        std::cerr << "[file_cache] Removing unreadable entry " << path.filename() << "\n";
        remove_if_stale(path, now);
        misses_++;
        return std::nullopt;
    }

    if (entry->expired(now)) {
        remove_if_stale(path, now);
        misses_++;
        return std::nullopt;
    }

    hits_++;
    return std::move(entry->value);
}

void FileCache::set(const CacheKey& key, const nlohmann::json& value) {
    set(key, value, default_ttl_);
}

void FileCache::set(const CacheKey& key, const nlohmann::json& value,
                    std::optional<Ttl> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry{value, epoch_seconds_precise(), ttl};
    fs::path path = path_for(key);

    std::string text;
    try {
        text = record_to_json(key, entry).dump(2);
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "[file_cache] Warning: cannot serialize value for "
                  << path.filename() << ": " << e.what() << "\n";
        return;
    }

    if (!atomic_write_file(path.string(), text)) {
        std::cerr << "[file_cache] Warning: failed to write " << path << "\n";
    }
}

bool FileCache::remove(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::remove(path_for(key), ec);
}

uint64_t FileCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t removed = 0;
    std::error_code ec;
    for (const auto& path : entry_files()) {
        if (fs::remove(path, ec)) removed++;
    }
    return removed;
}

uint64_t FileCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = epoch_seconds_precise();
    uint64_t removed = 0;
    for (const auto& path : entry_files()) {
        // Unparseable files count as expired
        if (remove_if_stale(path, now)) removed++;
    }
    return removed;
}

CacheStats FileCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.backend = backend_name();
    s.location = dir_.string();
    s.size = entry_files().size();
    s.hits = hits_;
    s.misses = misses_;
    return s;
}

} // namespace strucache
