#pragma once
#include <string>
#include <cstdint>

namespace agentlink {

// ISO 8601 timestamp
std::string timestamp_now();

// Milliseconds on the steady clock (for buffered event receipt times)
int64_t monotonic_ms();

// Trim whitespace
std::string trim(const std::string& s);

// Percent-encode a query parameter value (RFC 3986 unreserved set kept)
std::string url_encode(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace agentlink
