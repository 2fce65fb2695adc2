#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace ollie {

// Trim whitespace
std::string trim(const std::string& s);

// Strip trailing '/' characters (base URLs are joined with "/api/...")
std::string strip_trailing_slashes(const std::string& s);

// Random RFC 4122 version-4 UUID, lowercase. Safe to call concurrently.
std::string generate_uuid();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Parse the hex size at the start of an HTTP chunk-size line (extensions
// after ';' are ignored). Returns false if the line has no hex digits.
bool parse_chunk_size(const std::string& line, size_t& size);

// Human-readable byte count ("1.5 GB")
std::string format_bytes(uint64_t bytes);

} // namespace ollie
