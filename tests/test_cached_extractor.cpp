#include <catch2/catch.hpp>
#include "cached_extractor.hpp"
#include "cache/file_cache.hpp"
#include "cache/memory_cache.hpp"
#include <filesystem>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace strucache;
using json = nlohmann::json;

// ── Helpers ─────────────────────────────────────────────────────

class CountingExtractor : public Extractor {
public:
    int calls = 0;
    bool fail = false;
    std::string provider = "Gemini";
    std::string model = "gemini-2.5-flash";

    json extract(const std::string& document_bytes, const std::string& prompt,
                 const json&) override {
        calls++;
        if (fail) throw std::runtime_error("provider unavailable");
        return {{"size", document_bytes.size()}, {"prompt", prompt}, {"call", calls}};
    }
    std::string provider_name() const override { return provider; }
    std::string model_name() const override { return model; }
};

static const json kSchema = {{"type", "object"}};

// ── Tests ───────────────────────────────────────────────────────

TEST_CASE("CachedExtractor: second call is served from cache", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache);

    auto first = cached.process("invoice bytes", "Extract", kSchema);
    auto second = cached.process("invoice bytes", "Extract", kSchema);

    REQUIRE(extractor.calls == 1);
    REQUIRE(first == second);
    REQUIRE(cached.cache_hits() == 1);
    REQUIRE(cached.extractor_calls() == 1);
}

TEST_CASE("CachedExtractor: different prompt calls extractor again", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache);

    cached.process("doc", "Extract totals", kSchema);
    cached.process("doc", "Extract parties", kSchema);
    REQUIRE(extractor.calls == 2);
}

TEST_CASE("CachedExtractor: model switch misses", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache);

    cached.process("doc", "p", kSchema);
    extractor.model = "gemini-2.5-pro";
    cached.process("doc", "p", kSchema);
    REQUIRE(extractor.calls == 2);
}

TEST_CASE("CachedExtractor: key uses provider and model", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache);

    auto key = cached.key_for("doc", "p", kSchema);
    REQUIRE(key == CacheKey::create("doc", "p", kSchema, "gemini", "gemini-2.5-flash"));
}

TEST_CASE("CachedExtractor: extractor failure propagates and is not cached", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache);

    extractor.fail = true;
    REQUIRE_THROWS_AS(cached.process("doc", "p", kSchema), std::runtime_error);
    REQUIRE(cache.stats().size == 0);

    extractor.fail = false;
    cached.process("doc", "p", kSchema);
    REQUIRE(extractor.calls == 2);
}

TEST_CASE("CachedExtractor: ttl override expires results", "[cached_extractor]") {
    CountingExtractor extractor;
    MemoryCache cache;
    CachedExtractor cached(extractor, cache, Ttl(0.05));

    cached.process("doc", "p", kSchema);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cached.process("doc", "p", kSchema);
    REQUIRE(extractor.calls == 2);
}

TEST_CASE("CachedExtractor: unstorable result is still returned", "[cached_extractor]") {
    class Latin1Extractor : public CountingExtractor {
    public:
        json extract(const std::string&, const std::string&, const json&) override {
            calls++;
            return {{"vendor", "M\xfcller"}};
        }
    };

    std::string dir = "/tmp/strucache_test_extractor_" + std::to_string(getpid());
    {
        Latin1Extractor extractor;
        FileCache cache(dir);
        CachedExtractor cached(extractor, cache);

        json result;
        REQUIRE_NOTHROW(result = cached.process("scan", "Extract", kSchema));
        REQUIRE(result["vendor"] == "M\xfcller");
        REQUIRE(extractor.calls == 1);
    }
    std::filesystem::remove_all(dir);
}
