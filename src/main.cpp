#include "cache.hpp"
#include "cache_key.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: strucache [options] COMMAND\n"
              << "\n"
              << "Commands:\n"
              << "  stats                Show entry count and hit/miss counters\n"
              << "  cleanup              Remove expired entries\n"
              << "  clear                Remove all entries\n"
              << "  key FILE PROMPT PROVIDER [MODEL]\n"
              << "                       Print the cache key for a document\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.strucache/config.json)\n"
              << "  --backend NAME       Override backend (memory, file, sqlite)\n"
              << "  --path PATH          Override cache directory or database path\n"
              << "  --schema JSON        Schema used by the key command (default: {})\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  STRUCACHE_BACKEND    Backend name\n"
              << "  STRUCACHE_PATH       Cache directory or database path\n"
              << "  STRUCACHE_TTL_SECONDS  Default entry lifetime (empty = never expires)\n"
              << "  STRUCACHE_MAX_SIZE   Entry limit (0 = unbounded)\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string backend;
    std::string path;
    std::string schema_text = "{}";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
            backend = argv[++i];
        } else if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            path = argv[++i];
        } else if (std::strcmp(argv[i], "--schema") == 0 && i + 1 < argc) {
            schema_text = argv[++i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }
    const std::string& command = positional[0];

    if (command == "key") {
        if (positional.size() < 4) {
            std::cerr << "key requires FILE PROMPT PROVIDER [MODEL]\n";
            return 1;
        }
        auto schema = nlohmann::json::parse(schema_text);
        std::string model = positional.size() > 4 ? positional[4] : "";
        auto key = strucache::CacheKey::from_file(positional[1], positional[2],
                                                  schema, positional[3], model);
        std::cout << key.to_string() << "\n";
        return 0;
    }

    auto config = config_path.empty() ? strucache::Config::load()
                                      : strucache::Config::load_from(config_path);
    if (!backend.empty()) config.cache.backend = backend;
    if (!path.empty()) config.cache.path = path;

    auto cache = strucache::create_cache(config.cache);

    if (command == "stats") {
        std::cout << cache->stats().to_json().dump(2) << "\n";
    } else if (command == "cleanup") {
        std::cout << "Removed " << cache->cleanup_expired() << " expired entries\n";
    } else if (command == "clear") {
        std::cout << "Removed " << cache->clear() << " entries\n";
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
}
