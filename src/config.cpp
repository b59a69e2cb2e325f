#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace strucache {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"backend", "memory"},
            {"path", ""},
            {"ttl_seconds", nullptr},
            {"max_size", 1000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object() || !j.contains("cache") || !j["cache"].is_object()) {
        return cfg;
    }

    auto& c = j["cache"];
    if (c.contains("backend") && c["backend"].is_string())
        cfg.cache.backend = c["backend"].get<std::string>();
    if (c.contains("path") && c["path"].is_string())
        cfg.cache.path = c["path"].get<std::string>();
    if (c.contains("ttl_seconds") && c["ttl_seconds"].is_number())
        cfg.cache.ttl_seconds = c["ttl_seconds"].get<double>();
    if (c.contains("max_size") && c["max_size"].is_number_unsigned()) {
        auto n = c["max_size"].get<uint64_t>();
        if (n <= std::numeric_limits<uint32_t>::max()) {
            cfg.cache.max_size = static_cast<uint32_t>(n);
        } else {
            std::cerr << "[config] Ignoring out-of-range max_size: " << n << "\n";
        }
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.strucache/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            // Malformed config file: fall back to defaults
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path
                      << ": " << e.what() << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("STRUCACHE_BACKEND"))
        cache.backend = v;
    if (const char* v = std::getenv("STRUCACHE_PATH"))
        cache.path = v;
    if (const char* v = std::getenv("STRUCACHE_TTL_SECONDS")) {
        std::string s = trim(v);
        if (s.empty() || s == "none") {
            cache.ttl_seconds.reset();
        } else {
            try {
                cache.ttl_seconds = std::stod(s);
            } catch (const std::logic_error&) {
                std::cerr << "[config] Ignoring invalid STRUCACHE_TTL_SECONDS: " << s << "\n";
            }
        }
    }
    if (const char* v = std::getenv("STRUCACHE_MAX_SIZE")) {
        // stoull accepts a leading minus and wraps, so reject it up front
        std::string s = trim(v);
        try {
            if (!s.empty() && s[0] == '-') throw std::out_of_range(s);
            unsigned long long n = std::stoull(s);
            if (n > std::numeric_limits<uint32_t>::max()) throw std::out_of_range(s);
            cache.max_size = static_cast<uint32_t>(n);
        } catch (const std::logic_error&) {
            std::cerr << "[config] Ignoring invalid STRUCACHE_MAX_SIZE: " << v << "\n";
        }
    }
}

} // namespace strucache
