#include "cache_key.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fstream>
#include <iterator>

namespace strucache {

CacheKey::CacheKey(std::string content_hash, std::string prompt_hash,
                   std::string schema_hash, std::string provider,
                   std::string model)
    : content_hash_(std::move(content_hash)),
      prompt_hash_(std::move(prompt_hash)),
      schema_hash_(std::move(schema_hash)),
      provider_(to_lower(provider)),
      model_(to_lower(model)) {}

std::string CacheKey::canonical_schema(const nlohmann::json& schema) {
    // nlohmann::json objects are std::map backed, so dump() emits keys sorted.
    // Invalid UTF-8 is replaced with U+FFFD rather than thrown.
    return schema.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

CacheKey CacheKey::create(const std::string& document_bytes,
                          const std::string& prompt,
                          const nlohmann::json& schema,
                          const std::string& provider,
                          const std::string& model) {
    return CacheKey(sha256_hex(document_bytes),
                    sha256_hex(prompt),
                    sha256_hex(canonical_schema(schema)),
                    provider, model);
}

CacheKey CacheKey::from_file(const std::string& path,
                             const std::string& prompt,
                             const nlohmann::json& schema,
                             const std::string& provider,
                             const std::string& model) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheError("CacheKey: cannot read document: " + path, "key");
    }
    std::string bytes((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw CacheError("CacheKey: read failed: " + path, "key");
    }
    return create(bytes, prompt, schema, provider, model);
}

std::string CacheKey::to_string() const {
    std::string out;
    out.reserve(content_hash_.size() + prompt_hash_.size() + schema_hash_.size() +
                provider_.size() + model_.size() + 4);
    out += content_hash_;
    out += ':';
    out += prompt_hash_;
    out += ':';
    out += schema_hash_;
    out += ':';
    out += provider_;
    if (!model_.empty()) {
        out += ':';
        out += model_;
    }
    return out;
}

bool CacheKey::operator==(const CacheKey& other) const {
    return content_hash_ == other.content_hash_ &&
           prompt_hash_ == other.prompt_hash_ &&
           schema_hash_ == other.schema_hash_ &&
           provider_ == other.provider_ &&
           model_ == other.model_;
}

} // namespace strucache
