#pragma once
#include "cache.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace strucache {

// A structured-extraction backend (remote provider client or pipeline).
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual nlohmann::json extract(const std::string& document_bytes,
                                   const std::string& prompt,
                                   const nlohmann::json& schema) = 0;

    virtual std::string provider_name() const = 0;

    // Empty when the provider has no model selection
    virtual std::string model_name() const { return {}; }
};

// Serves repeated extractions from a cache. Neither the extractor nor the
// cache is owned; both must outlive this object.
class CachedExtractor {
public:
    CachedExtractor(Extractor& extractor, Cache& cache,
                    std::optional<Ttl> ttl_override = std::nullopt);

    // Cached value on hit; otherwise runs the extractor and stores its result.
    // Exceptions from the extractor propagate and nothing is stored.
    nlohmann::json process(const std::string& document_bytes,
                           const std::string& prompt,
                           const nlohmann::json& schema);

    CacheKey key_for(const std::string& document_bytes,
                     const std::string& prompt,
                     const nlohmann::json& schema) const;

    uint64_t cache_hits() const { return cache_hits_; }
    uint64_t extractor_calls() const { return extractor_calls_; }

private:
    Extractor& extractor_;
    Cache& cache_;
    std::optional<Ttl> ttl_override_;
    uint64_t cache_hits_ = 0;
    uint64_t extractor_calls_ = 0;
};

} // namespace strucache
