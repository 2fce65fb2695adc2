#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ollie {

// Splits an NDJSON byte stream into trimmed, non-empty text lines.
// Bytes are decoded as UTF-8; a sequence split across feed() calls is held
// back until it completes, and invalid bytes become U+FFFD.
class LineFramer {
public:
    // Append a received chunk.
    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Extract every complete line. The unterminated tail stays buffered.
    std::vector<std::string> drain();

    // Call once at end of stream: the trimmed unterminated tail, if any.
    std::optional<std::string> flush_remainder();

    // Reset parser state
    void reset();

private:
    void decode(const std::string& bytes);

    std::string buffer_;  // decoded text not yet terminated by '\n'
    std::string pending_; // incomplete UTF-8 sequence from the last chunk
};

// Parse one line into a progress payload. Lines that are not JSON become
// {"status": "parsing_error", "raw": <line>}.
nlohmann::json parse_progress(const std::string& line);

} // namespace ollie
