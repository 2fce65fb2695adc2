#include "line_framer.hpp"
#include "util.hpp"

namespace ollie {

static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Number of continuation bytes after a lead byte, or -1 if c cannot start
// a sequence.
static int continuation_count(unsigned char c) {
    if (c < 0x80) return 0;
    if (c >= 0xC2 && c <= 0xDF) return 1;
    if (c >= 0xE0 && c <= 0xEF) return 2;
    if (c >= 0xF0 && c <= 0xF4) return 3;
    return -1;
}

// Valid range of the first continuation byte; excludes overlongs,
// surrogates and code points above U+10FFFF.
static void first_continuation_range(unsigned char lead,
                                     unsigned char& lo, unsigned char& hi) {
    lo = 0x80;
    hi = 0xBF;
    switch (lead) {
        case 0xE0: lo = 0xA0; break;
        case 0xED: hi = 0x9F; break;
        case 0xF0: lo = 0x90; break;
        case 0xF4: hi = 0x8F; break;
        default: break;
    }
}

void LineFramer::decode(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        int need = continuation_count(lead);
        if (need == 0) {
            buffer_ += static_cast<char>(lead);
            ++i;
            continue;
        }
        if (need < 0) {
            buffer_ += kReplacement;
            ++i;
            continue;
        }

        // Validate continuation bytes that are present. A bad byte ends the
        // maximal subpart, which becomes a single U+FFFD.
        size_t avail = bytes.size() - i - 1;
        size_t k = 0;
        bool bad = false;
        for (; k < static_cast<size_t>(need) && k < avail; ++k) {
            auto b = static_cast<unsigned char>(bytes[i + 1 + k]);
            unsigned char lo = 0x80, hi = 0xBF;
            if (k == 0) first_continuation_range(lead, lo, hi);
            if (b < lo || b > hi) {
                bad = true;
                break;
            }
        }
        if (bad) {
            buffer_ += kReplacement;
            i += 1 + k;
            continue;
        }
        if (k < static_cast<size_t>(need)) {
            // Truncated at the chunk boundary; finish on the next feed.
            pending_.assign(bytes, i, std::string::npos);
            return;
        }
        buffer_.append(bytes, i, static_cast<size_t>(need) + 1);
        i += static_cast<size_t>(need) + 1;
    }
}

void LineFramer::feed(const char* data, size_t len) {
    std::string bytes;
    bytes.reserve(pending_.size() + len);
    bytes += pending_;
    bytes.append(data, len);
    pending_.clear();
    decode(bytes);
}

std::vector<std::string> LineFramer::drain() {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = trim(buffer_.substr(start, newline - start));
        start = newline + 1;
        if (!line.empty()) lines.push_back(std::move(line));
    }
    buffer_.erase(0, start);
    return lines;
}

std::optional<std::string> LineFramer::flush_remainder() {
    if (!pending_.empty()) {
        buffer_ += kReplacement;
        pending_.clear();
    }
    std::string rest = trim(buffer_);
    buffer_.clear();
    if (rest.empty()) return std::nullopt;
    return rest;
}

void LineFramer::reset() {
    buffer_.clear();
    pending_.clear();
}

nlohmann::json parse_progress(const std::string& line) {
    auto value = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
        return {{"status", "parsing_error"}, {"raw", line}};
    }
    return value;
}

} // namespace ollie
