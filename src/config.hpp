#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace strucache {

struct CacheConfig {
    std::string backend = "memory";       // memory | file | sqlite
    std::string path;                     // directory (file) or database (sqlite)
    std::optional<double> ttl_seconds;    // nullopt = entries never expire
    uint32_t max_size = 1000;             // 0 = unbounded
};

struct Config {
    CacheConfig cache;

    // Load from ~/.strucache/config.json + env vars.
    // Writes the defaults there when the file is missing.
    static Config load();

    // Load from an explicit file + env vars. A missing or malformed file
    // yields the defaults; the file is never written.
    static Config load_from(const std::string& path);

    // Parse a config JSON document (no env vars applied)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply STRUCACHE_* environment overrides
    void apply_env();
};

} // namespace strucache
