#pragma once
#include "../cache.hpp"
#include <filesystem>
#include <mutex>
#include <vector>

namespace strucache {

// One JSON file per key in a directory. Files are named after the SHA-256
// of the key's canonical string and replaced atomically on write, so the
// directory can be shared between instances and processes.
class FileCache : public Cache {
public:
    // Creates the directory if needed. Throws CacheError if it cannot.
    explicit FileCache(const std::string& directory,
                       std::optional<Ttl> default_ttl = std::nullopt);

    std::string backend_name() const override { return "file"; }

    std::optional<nlohmann::json> get(const CacheKey& key) override;
    void set(const CacheKey& key, const nlohmann::json& value) override;
    void set(const CacheKey& key, const nlohmann::json& value,
             std::optional<Ttl> ttl) override;
    bool remove(const CacheKey& key) override;
    uint64_t clear() override;
    uint64_t cleanup_expired() override;
    CacheStats stats() const override;

    const std::filesystem::path& directory() const { return dir_; }

    // Full path of the file that holds key.
    std::filesystem::path path_for(const CacheKey& key) const;

private:
    std::vector<std::filesystem::path> entry_files() const;
    bool remove_if_stale(const std::filesystem::path& path, double now);

    std::filesystem::path dir_;
    std::optional<Ttl> default_ttl_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace strucache
