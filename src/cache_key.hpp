#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace strucache {

// Identity of one extraction request: hashes of the document bytes, the
// prompt and the expected output schema, plus provider and model names.
// Provider and model are stored lower-cased.
class CacheKey {
public:
    CacheKey(std::string content_hash, std::string prompt_hash,
             std::string schema_hash, std::string provider,
             std::string model = "");

    // Derive a key from raw inputs. Each component is hashed on its own.
    static CacheKey create(const std::string& document_bytes,
                           const std::string& prompt,
                           const nlohmann::json& schema,
                           const std::string& provider,
                           const std::string& model = "");

    // Same as create(), reading the document bytes from disk.
    // Throws CacheError if the file cannot be read.
    static CacheKey from_file(const std::string& path,
                              const std::string& prompt,
                              const nlohmann::json& schema,
                              const std::string& provider,
                              const std::string& model = "");

    // Sorted-key compact JSON used as the schema hash input.
    static std::string canonical_schema(const nlohmann::json& schema);

    const std::string& content_hash() const { return content_hash_; }
    const std::string& prompt_hash() const { return prompt_hash_; }
    const std::string& schema_hash() const { return schema_hash_; }
    const std::string& provider() const { return provider_; }
    const std::string& model() const { return model_; }

    // content:prompt:schema:provider[:model]
    std::string to_string() const;

    bool operator==(const CacheKey& other) const;
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    std::string content_hash_;
    std::string prompt_hash_;
    std::string schema_hash_;
    std::string provider_;
    std::string model_;
};

} // namespace strucache

namespace std {

template <>
struct hash<strucache::CacheKey> {
    size_t operator()(const strucache::CacheKey& key) const {
        return hash<string>{}(key.to_string());
    }
};

} // namespace std
