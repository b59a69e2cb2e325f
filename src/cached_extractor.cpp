#include "cached_extractor.hpp"

namespace strucache {

CachedExtractor::CachedExtractor(Extractor& extractor, Cache& cache,
                                 std::optional<Ttl> ttl_override)
    : extractor_(extractor), cache_(cache), ttl_override_(ttl_override) {}

CacheKey CachedExtractor::key_for(const std::string& document_bytes,
                                  const std::string& prompt,
                                  const nlohmann::json& schema) const {
    return CacheKey::create(document_bytes, prompt, schema,
                            extractor_.provider_name(), extractor_.model_name());
}

nlohmann::json CachedExtractor::process(const std::string& document_bytes,
                                        const std::string& prompt,
                                        const nlohmann::json& schema) {
    CacheKey key = key_for(document_bytes, prompt, schema);

    if (auto cached = cache_.get(key)) {
        cache_hits_++;
        return std::move(*cached);
    }

    extractor_calls_++;
    nlohmann::json result = extractor_.extract(document_bytes, prompt, schema);

    if (ttl_override_) {
        cache_.set(key, result, ttl_override_);
    } else {
        cache_.set(key, result);
    }
    return result;
}

} // namespace strucache
