#pragma once
#include <string>
#include <cstdint>

namespace strucache {

// Unix epoch seconds with sub-second precision
double epoch_seconds_precise();

// Lower-case ASCII copy
std::string to_lower(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Hex-encoded SHA-256 digest of arbitrary bytes
std::string sha256_hex(const std::string& data);

// Write content to a sibling temp file, then rename it over path.
// Creates parent directories. Returns false (leaving path untouched) on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace strucache
